#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <dpp/dpp.h>

#include "aurora/playback/queue_entry.hpp"

namespace aurora::playback {

enum class event_kind {
    now_playing,
    enqueued,
    vote_recorded,
    skipped,
    stopped
};

struct event_payload {
    std::optional<entry_info> entry;
    dpp::snowflake            actor;     // who triggered it, if anyone
    std::size_t               votes    = 0;
    std::size_t               quorum   = 0;
    std::size_t               position = 0; // 1-based queue position for enqueued
};

/// Fire-and-forget announcements. Failures are the implementation's problem;
/// callers guard against exceptions so scheduling is never affected.
class notifier {
public:
    virtual ~notifier() = default;
    virtual void notify(dpp::snowflake channel_id, event_kind kind, const event_payload& payload) = 0;
};

} // namespace aurora::playback
