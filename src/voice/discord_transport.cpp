#include "aurora/voice/discord_transport.hpp"

#include <dpp/json.h>

namespace aurora::voice {

namespace {

dpp::channel* find_voice_channel(dpp::snowflake channel_id)
{
    dpp::channel* c = dpp::find_channel(channel_id);
    if (c == nullptr || !(c->is_voice_channel() || c->is_stage_channel())) {
        throw transport_error(transport_failure::not_a_voice_destination,
                              "Channel " + channel_id.str() + " is not a voice channel");
    }
    return c;
}

} // namespace

class discord_voice_link : public transport_handle {
public:
    discord_voice_link(discord_transport& owner, dpp::snowflake guild_id, dpp::snowflake channel_id)
        : m_owner(owner)
        , m_guild_id(guild_id)
        , m_channel_id(channel_id)
    {
    }

    ~discord_voice_link() override
    {
        if (m_connected) {
            m_owner.release(m_guild_id);
        }
    }

    dpp::snowflake voice_channel() const override { return m_channel_id; }

    void move(dpp::snowflake voice_channel_id) override
    {
        if (!m_connected) {
            throw transport_error(transport_failure::not_connected, "Voice link already closed");
        }
        dpp::channel* c = find_voice_channel(voice_channel_id);
        if (c->guild_id != m_guild_id) {
            throw transport_error(transport_failure::not_a_voice_destination,
                                  "Channel " + voice_channel_id.str() + " belongs to another guild");
        }
        m_owner.send_voice_state(m_guild_id, voice_channel_id);
        m_channel_id = voice_channel_id;
    }

    void disconnect() override
    {
        if (!m_connected) {
            return;
        }
        m_connected = false;
        m_owner.release(m_guild_id);
        m_owner.send_voice_state(m_guild_id, dpp::snowflake{});
    }

private:
    discord_transport& m_owner;
    dpp::snowflake     m_guild_id;
    dpp::snowflake     m_channel_id;
    bool               m_connected = true;
};

discord_transport::discord_transport(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

std::unique_ptr<transport_handle> discord_transport::connect(dpp::snowflake voice_channel_id)
{
    dpp::channel* c = find_voice_channel(voice_channel_id);
    const dpp::snowflake guild_id = c->guild_id;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected_guilds.insert(guild_id).second) {
            throw transport_error(transport_failure::already_connected_elsewhere,
                                  "Already connected to a voice channel in guild " + guild_id.str());
        }
    }

    try {
        send_voice_state(guild_id, voice_channel_id);
    } catch (const transport_error&) {
        release(guild_id);
        throw;
    }

    m_cluster.log(dpp::ll_info,
                  "Joining voice channel " + voice_channel_id.str() + " in guild " + guild_id.str());
    return std::make_unique<discord_voice_link>(*this, guild_id, voice_channel_id);
}

void discord_transport::send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    const uint32_t shard_id = m_cluster.numshards == 0
        ? 0
        : static_cast<uint32_t>((static_cast<uint64_t>(guild_id) >> 22) % m_cluster.numshards);

    dpp::discord_client* shard = m_cluster.get_shard(shard_id);
    if (shard == nullptr) {
        throw transport_error(transport_failure::connect_failed,
                              "No shard " + std::to_string(shard_id) + " for guild " + guild_id.str());
    }

    dpp::json payload;
    payload["op"] = 4;
    payload["d"]["guild_id"]  = guild_id.str();
    if (channel_id.empty()) {
        payload["d"]["channel_id"] = nullptr;
    } else {
        payload["d"]["channel_id"] = channel_id.str();
    }
    payload["d"]["self_mute"] = false;
    payload["d"]["self_deaf"] = true;

    shard->queue_message(payload.dump());
}

void discord_transport::release(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connected_guilds.erase(guild_id);
}

} // namespace aurora::voice
