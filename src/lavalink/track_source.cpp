#include "aurora/lavalink/track_source.hpp"

#include <algorithm>
#include <cmath>

namespace aurora::lavalink {

void track_source::completion_latch::fire()
{
    completion_callback cb;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (fired) {
            return;
        }
        fired = true;
        cb = std::move(callback);
    }
    if (cb) {
        cb();
    }
}

bool track_source::completion_latch::done()
{
    std::lock_guard<std::mutex> lock(mutex);
    return fired;
}

track_source::track_source(node& lavalink, dpp::snowflake guild_id, track t)
    : m_node(lavalink)
    , m_guild_id(guild_id)
    , m_track(std::move(t))
{
}

track_source::~track_source()
{
    std::shared_ptr<completion_latch> latch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        latch = m_latch;
    }
    if (latch && !latch->done()) {
        m_node.unwatch(m_guild_id, m_track.encoded);
    }
}

void track_source::start(completion_callback on_complete)
{
    auto latch = std::make_shared<completion_latch>();
    latch->callback = std::move(on_complete);

    int volume_percent = 100;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_latch = latch;
        volume_percent = static_cast<int>(std::lround(m_volume * 100.0f));
    }

    if (!m_node.play(m_guild_id, m_track.encoded, volume_percent)) {
        {
            std::lock_guard<std::mutex> lock(latch->mutex);
            latch->fired = true;    // never started, so never completes
            latch->callback = nullptr;
        }
        throw dpp::exception("Lavalink refused to play '" + m_track.title + "'");
    }

    m_node.watch(m_guild_id, m_track.encoded, [latch] { latch->fire(); });
}

void track_source::pause()
{
    if (!m_node.pause(m_guild_id, true)) {
        throw dpp::exception("Lavalink pause request failed");
    }
}

void track_source::resume()
{
    if (!m_node.pause(m_guild_id, false)) {
        throw dpp::exception("Lavalink resume request failed");
    }
}

void track_source::stop()
{
    std::shared_ptr<completion_latch> latch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        latch = m_latch;
    }
    if (!latch || latch->done()) {
        return; // not started, or already over: the player may belong to the next track
    }

    m_node.unwatch(m_guild_id, m_track.encoded);
    const bool sent = m_node.stop(m_guild_id);
    latch->fire();
    if (!sent) {
        throw dpp::exception("Lavalink stop request failed");
    }
}

bool track_source::is_finished() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_latch && m_latch->done();
}

std::optional<int> track_source::duration_seconds() const
{
    if (m_track.is_stream || m_track.length_ms <= 0) {
        return std::nullopt;
    }
    return static_cast<int>(m_track.length_ms / 1000);
}

float track_source::volume() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_volume;
}

void track_source::set_volume(float volume)
{
    bool live = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_volume = std::clamp(volume, 0.0f, 2.0f);
        live = m_latch && !m_latch->done();
        volume = m_volume;
    }
    if (live && !m_node.set_volume(m_guild_id, static_cast<int>(std::lround(volume * 100.0f)))) {
        throw dpp::exception("Lavalink volume request failed");
    }
}

std::string make_identifier(const std::string& query, const std::string& search_prefix)
{
    auto starts_with = [&query](const char* prefix) {
        return query.rfind(prefix, 0) == 0;
    };
    if (starts_with("http://") || starts_with("https://")) {
        return query;
    }
    return search_prefix + query;
}

track_resolver::track_resolver(node& lavalink, std::string search_prefix)
    : m_node(lavalink)
    , m_search_prefix(std::move(search_prefix))
{
}

std::unique_ptr<playback::playback_handle> track_resolver::resolve(dpp::snowflake guild_id,
                                                                   const std::string& query)
{
    load_result res = m_node.load_tracks(make_identifier(query, m_search_prefix));

    if (res.type == load_type::error) {
        throw playback::resolution_error(res.error_message);
    }
    if (res.tracks.empty()) {
        throw playback::resolution_error("Nothing playable found for '" + query + "'");
    }
    return std::make_unique<track_source>(m_node, guild_id, std::move(res.tracks.front()));
}

} // namespace aurora::lavalink
