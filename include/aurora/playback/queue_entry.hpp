#pragma once

#include <memory>
#include <optional>
#include <string>

#include <dpp/dpp.h>

#include "aurora/playback/playback_handle.hpp"

namespace aurora::playback {

/// Copyable description of an entry, safe to hand out of the state lock.
struct entry_info {
    std::string        title;
    std::string        author;
    dpp::snowflake     requester;
    dpp::snowflake     channel;
    std::optional<int> duration_seconds;
};

/// A queued song: who asked for it, where to announce it, and the source.
/// requester and channel are fixed at construction.
class queue_entry {
public:
    queue_entry(dpp::snowflake requester,
                dpp::snowflake channel,
                std::unique_ptr<playback_handle> source);

    dpp::snowflake requester() const { return m_requester; }
    dpp::snowflake channel() const { return m_channel; }

    playback_handle& source() const { return *m_source; }

    entry_info info() const;

private:
    const dpp::snowflake                   m_requester;
    const dpp::snowflake                   m_channel;
    const std::unique_ptr<playback_handle> m_source;
};

/// "<title> by <author> [length: 3m 7s]"; the length part is dropped when
/// the duration is unknown (live streams).
std::string describe(const entry_info& info);

} // namespace aurora::playback
