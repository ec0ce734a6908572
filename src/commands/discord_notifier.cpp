#include "aurora/commands/discord_notifier.hpp"

namespace aurora::commands {

std::optional<std::string> render(playback::event_kind kind, const playback::event_payload& payload)
{
    if (kind != playback::event_kind::now_playing || !payload.entry.has_value()) {
        return std::nullopt;
    }
    return "Now playing " + playback::describe(*payload.entry) +
           ", requested by <@" + payload.entry->requester.str() + ">";
}

discord_notifier::discord_notifier(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

void discord_notifier::notify(dpp::snowflake channel_id,
                              playback::event_kind kind,
                              const playback::event_payload& payload)
{
    auto text = render(kind, payload);
    if (!text.has_value() || channel_id.empty()) {
        return;
    }

    m_cluster.message_create(dpp::message(channel_id, *text),
        [this, channel_id](const dpp::confirmation_callback_t& cc) {
            if (cc.is_error()) {
                m_cluster.log(dpp::ll_warning,
                              "Failed to announce in channel " + channel_id.str() +
                              ": " + cc.get_error().message);
            }
        });
}

} // namespace aurora::commands
