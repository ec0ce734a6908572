#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <dpp/dpp.h>

#include "aurora/lavalink/client.hpp"
#include "aurora/playback/playback_handle.hpp"
#include "aurora/playback/source_resolver.hpp"

namespace aurora::lavalink {

/// A Lavalink track played on the player of one guild.
class track_source : public playback::playback_handle {
public:
    track_source(node& lavalink, dpp::snowflake guild_id, track t);
    ~track_source() override;

    void start(completion_callback on_complete) override;
    void pause() override;
    void resume() override;
    void stop() override;

    bool is_finished() const override;
    std::optional<int> duration_seconds() const override;

    float volume() const override;
    void set_volume(float volume) override;

    std::string title() const override { return m_track.title; }
    std::string author() const override { return m_track.author; }

    const track& info() const { return m_track; }

private:
    // Shared with the node's watcher so a late track-end poll never touches
    // a destroyed source.
    struct completion_latch {
        std::mutex          mutex;
        completion_callback callback;
        bool                fired = false;

        void fire();
        bool done();
    };

    node&                             m_node;
    const dpp::snowflake              m_guild_id;
    const track                       m_track;

    mutable std::mutex                m_mutex;
    std::shared_ptr<completion_latch> m_latch;
    float                             m_volume = 1.0f;
};

/// Query -> Lavalink identifier. URLs pass through, anything else gets the
/// search prefix (e.g. "ytsearch:").
std::string make_identifier(const std::string& query, const std::string& search_prefix);

class track_resolver : public playback::source_resolver {
public:
    track_resolver(node& lavalink, std::string search_prefix);

    std::unique_ptr<playback::playback_handle> resolve(dpp::snowflake guild_id,
                                                       const std::string& query) override;

private:
    node&       m_node;
    std::string m_search_prefix;
};

} // namespace aurora::lavalink
