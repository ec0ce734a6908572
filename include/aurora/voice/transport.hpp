#pragma once

#include <memory>
#include <string>

#include <dpp/dpp.h>

namespace aurora::voice {

enum class transport_failure {
    already_connected_elsewhere,
    not_a_voice_destination,
    not_connected,
    connect_failed
};

class transport_error : public dpp::exception {
public:
    transport_error(transport_failure kind, const std::string& what)
        : dpp::exception(what)
        , m_kind(kind)
    {
    }

    transport_failure kind() const { return m_kind; }

private:
    transport_failure m_kind;
};

/// A live voice connection. Owned by exactly one channel_state.
class transport_handle {
public:
    virtual ~transport_handle() = default;

    virtual dpp::snowflake voice_channel() const = 0;
    virtual void move(dpp::snowflake voice_channel_id) = 0;
    virtual void disconnect() = 0;
};

class transport_provider {
public:
    virtual ~transport_provider() = default;

    /// Throws transport_error.
    virtual std::unique_ptr<transport_handle> connect(dpp::snowflake voice_channel_id) = 0;
};

} // namespace aurora::voice
