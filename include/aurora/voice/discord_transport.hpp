#pragma once

#include <memory>
#include <mutex>
#include <unordered_set>

#include <dpp/dpp.h>

#include "aurora/voice/transport.hpp"

namespace aurora::voice {

/// Joins Discord voice channels by sending gateway voice state updates
/// (op 4). The audio itself is streamed by Lavalink, which receives the
/// resulting voice server details through lavalink::node.
class discord_transport : public transport_provider {
public:
    explicit discord_transport(dpp::cluster& cluster);

    std::unique_ptr<transport_handle> connect(dpp::snowflake voice_channel_id) override;

private:
    friend class discord_voice_link;

    /// channel_id 0 leaves voice.
    void send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id);
    void release(dpp::snowflake guild_id);

    dpp::cluster& m_cluster;

    std::mutex                         m_mutex;
    std::unordered_set<dpp::snowflake> m_connected_guilds;
};

} // namespace aurora::voice
