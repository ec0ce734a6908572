#include "aurora/playback/skip_arbitrator.hpp"

#include "aurora/playback/queue_entry.hpp"

namespace aurora::playback {

vote_outcome arbitrate_skip(dpp::snowflake voter,
                            const std::unordered_set<dpp::snowflake>& votes,
                            const queue_entry* current,
                            std::size_t quorum)
{
    vote_outcome out;
    if (current == nullptr) {
        out.kind = vote_kind::nothing_playing;
        return out;
    }

    // The requester never joins the vote set; their request always wins.
    if (voter == current->requester()) {
        out.kind = vote_kind::forced;
        return out;
    }

    if (votes.count(voter) != 0) {
        out.kind  = vote_kind::already_voted;
        out.votes = votes.size();
        return out;
    }

    out.votes = votes.size() + 1;
    out.kind  = out.votes >= quorum ? vote_kind::quorum_reached : vote_kind::vote_recorded;
    return out;
}

const char* to_string(vote_kind kind)
{
    switch (kind) {
        case vote_kind::forced:          return "forced";
        case vote_kind::already_voted:   return "already_voted";
        case vote_kind::vote_recorded:   return "vote_recorded";
        case vote_kind::quorum_reached:  return "quorum_reached";
        case vote_kind::nothing_playing: return "nothing_playing";
    }
    return "unknown";
}

} // namespace aurora::playback
