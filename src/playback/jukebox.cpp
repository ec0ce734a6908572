#include "aurora/playback/jukebox.hpp"

#include <sstream>

namespace aurora::playback {

jukebox::jukebox(voice::transport_provider& transports,
                 channel_options opts,
                 notifier* events,
                 log_sink log)
    : m_transports(transports)
    , m_opts(opts)
    , m_log(log)
    , m_registry(opts, events, std::move(log))
{
}

jukebox::~jukebox()
{
    unload();
}

void jukebox::discard(std::unique_ptr<voice::transport_handle> transport)
{
    if (!transport) {
        return;
    }
    try {
        transport->disconnect();
    } catch (const std::exception& e) {
        log_to(m_log, dpp::ll_warning, std::string("Ignoring disconnect failure: ") + e.what());
    }
}

void jukebox::join(dpp::snowflake key, dpp::snowflake voice_channel_id)
{
    if (auto state = m_registry.find(key); state && state->has_transport()) {
        throw voice::transport_error(voice::transport_failure::already_connected_elsewhere,
                                     "Already connected to a voice channel for " + key.str());
    }

    // Connect first: if this throws, nothing has been created.
    auto transport = m_transports.connect(voice_channel_id);

    try {
        m_registry.create_with(key, std::move(transport));
    } catch (const voice::transport_error&) {
        // Lost a race with another join for the same key.
        discard(std::move(transport));
        throw;
    }

    std::ostringstream oss;
    oss << "Joined voice channel " << voice_channel_id << " for " << key;
    log_to(m_log, dpp::ll_info, oss.str());
}

void jukebox::summon(dpp::snowflake key, dpp::snowflake voice_channel_id)
{
    auto state = m_registry.find(key);
    if (state && state->has_transport()) {
        state->move_transport(voice_channel_id);

        std::ostringstream oss;
        oss << "Moved " << key << " to voice channel " << voice_channel_id;
        log_to(m_log, dpp::ll_info, oss.str());
        return;
    }
    join(key, voice_channel_id);
}

bool jukebox::is_connected(dpp::snowflake key) const
{
    auto state = m_registry.find(key);
    return state && state->has_transport();
}

bool jukebox::enqueue(dpp::snowflake key,
                      dpp::snowflake requester,
                      dpp::snowflake text_channel,
                      std::unique_ptr<playback_handle> source)
{
    auto entry = std::make_unique<queue_entry>(requester, text_channel, std::move(source));
    return m_registry.get_or_create(key)->enqueue(std::move(entry));
}

bool jukebox::pause(dpp::snowflake key)
{
    auto state = m_registry.find(key);
    return state && state->pause();
}

bool jukebox::resume(dpp::snowflake key)
{
    auto state = m_registry.find(key);
    return state && state->resume();
}

bool jukebox::stop(dpp::snowflake key)
{
    auto state = m_registry.remove(key);
    if (!state) {
        return false;
    }
    state->stop();
    return true;
}

vote_outcome jukebox::vote_skip(dpp::snowflake key, dpp::snowflake requester)
{
    auto state = m_registry.find(key);
    if (!state) {
        return vote_outcome{};
    }
    return state->vote_skip(requester);
}

bool jukebox::set_volume(dpp::snowflake key, int percent)
{
    auto state = m_registry.find(key);
    return state && state->set_volume(percent);
}

status_snapshot jukebox::status(dpp::snowflake key) const
{
    auto state = m_registry.find(key);
    return state ? state->status() : status_snapshot{};
}

std::vector<entry_info> jukebox::upcoming(dpp::snowflake key) const
{
    auto state = m_registry.find(key);
    return state ? state->upcoming() : std::vector<entry_info>{};
}

void jukebox::unload()
{
    auto states = m_registry.drain();
    for (auto& state : states) {
        state->stop();
    }
    if (!states.empty()) {
        log_to(m_log, dpp::ll_info, "Unloaded " + std::to_string(states.size()) + " playback session(s)");
    }
}

} // namespace aurora::playback
