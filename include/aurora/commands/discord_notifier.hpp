#pragma once

#include <optional>
#include <string>

#include <dpp/dpp.h>

#include "aurora/playback/notifier.hpp"

namespace aurora::commands {

/// Text posted to the entry's channel for an event, or nullopt when the
/// slash command reply already covers it (enqueue, votes, skips).
std::optional<std::string> render(playback::event_kind kind, const playback::event_payload& payload);

class discord_notifier : public playback::notifier {
public:
    explicit discord_notifier(dpp::cluster& cluster);

    void notify(dpp::snowflake channel_id,
                playback::event_kind kind,
                const playback::event_payload& payload) override;

private:
    dpp::cluster& m_cluster;
};

} // namespace aurora::commands
