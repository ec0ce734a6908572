#pragma once

#include <cstddef>
#include <unordered_set>

#include <dpp/dpp.h>

namespace aurora::playback {

class queue_entry;

enum class vote_kind {
    forced,          // the requester skipped their own song
    already_voted,
    vote_recorded,
    quorum_reached,
    nothing_playing
};

struct vote_outcome {
    vote_kind   kind  = vote_kind::nothing_playing;
    std::size_t votes = 0; // distinct votes after this call (vote_recorded / quorum_reached)

    bool skips() const { return kind == vote_kind::forced || kind == vote_kind::quorum_reached; }
};

constexpr std::size_t default_skip_quorum = 3;

/// Decide what a skip request from `voter` does. Pure: the caller applies the
/// outcome (records the vote, forces the skip).
vote_outcome arbitrate_skip(dpp::snowflake voter,
                            const std::unordered_set<dpp::snowflake>& votes,
                            const queue_entry* current,
                            std::size_t quorum);

const char* to_string(vote_kind kind);

} // namespace aurora::playback
