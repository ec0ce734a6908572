#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <dpp/dpp.h>

#include "aurora/log.hpp"
#include "aurora/playback/channel_state.hpp"

namespace aurora::playback {

/// channel id -> live channel_state. States are created on first use (loop
/// already running) and handed back to the caller on remove() for teardown.
class registry {
public:
    registry(channel_options opts, notifier* events = nullptr, log_sink log = {});

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;

    /// Existing state, or a new started one. Concurrent calls for the same
    /// key always see the same instance.
    std::shared_ptr<channel_state> get_or_create(dpp::snowflake key);

    /// Same as get_or_create, but the transport is attached before a new
    /// state becomes visible to other callers. Throws transport_error if the
    /// existing state is already connected; `transport` is then left with
    /// the caller.
    std::shared_ptr<channel_state> create_with(dpp::snowflake key,
                                               std::unique_ptr<voice::transport_handle>&& transport);

    std::shared_ptr<channel_state> find(dpp::snowflake key) const;

    /// Removes and returns the state; nullptr if there was none.
    std::shared_ptr<channel_state> remove(dpp::snowflake key);

    /// Empties the registry, returning everything that was in it.
    std::vector<std::shared_ptr<channel_state>> drain();

    std::size_t size() const;

private:
    std::shared_ptr<channel_state> make_state(dpp::snowflake key) const;

    const channel_options m_opts;
    notifier*             m_events;
    log_sink              m_log;

    mutable std::mutex                                                 m_mutex;
    std::unordered_map<dpp::snowflake, std::shared_ptr<channel_state>> m_states;
};

} // namespace aurora::playback
