#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>
#include <chrono>
#include <unordered_map>
#include <cstdint>

#include <dpp/dpp.h>

namespace aurora::lavalink {

struct node_config {
    std::string host = "127.0.0.1";
    uint16_t    port = 2333;
    bool        https = false;
    std::string password = "youshallnotpass";
    std::string session_id = "default"; // Lavalink v4 session id
};

struct track {
    std::string  encoded;
    std::string  title;
    std::string  author;
    std::string  uri;
    std::int64_t length_ms = 0;
    bool         is_stream = false;
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type          type = load_type::empty;
    std::vector<track> tracks;
    std::string        error_message; // set when type is error
};

/// What GET /v4/sessions/{id}/players/{guild} tells us about a player.
struct player_state {
    std::optional<std::string> encoded_track; // nullopt when nothing is loaded
    bool                       paused = false;
    int                        volume = 100;
};

/// Parse a /v4/loadtracks response body. Never throws; malformed input
/// comes back as load_type::error.
load_result parse_load_result(const std::string& body);

/// Parse a player object. nullopt if the body is not a JSON object.
std::optional<player_state> parse_player_state(const std::string& body);

class node {
public:
    using track_end_callback = std::function<void()>;

    explicit node(dpp::cluster& cluster, const node_config& cfg);
    ~node();

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    // Fed from the gateway voice events.
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    // Resolves an identifier through /v4/loadtracks.
    load_result load_tracks(const std::string& identifier) const;

    // Player PATCH calls, false when Lavalink rejects them.
    bool play(dpp::snowflake guild_id,
              const std::string& encoded_track,
              std::optional<int> volume = std::nullopt);

    bool stop(dpp::snowflake guild_id);
    bool pause(dpp::snowflake guild_id, bool pause_flag);
    bool set_volume(dpp::snowflake guild_id, int volume_percent);

    std::optional<player_state> get_player(dpp::snowflake guild_id) const;

    // Track end detection. Lavalink only reports TrackEndEvent over its
    // websocket, so the watcher polls the player of every watched guild and
    // fires the callback once the player no longer holds `encoded_track`.
    void watch(dpp::snowflake guild_id, const std::string& encoded_track, track_end_callback on_end);
    void unwatch(dpp::snowflake guild_id, const std::string& encoded_track);
    void start_watcher(std::chrono::milliseconds interval);
    void stop_watcher();

private:
    struct voice_state {
        std::string session_id;      // from voice_state_update
        std::string token;
        std::string endpoint;
    };

    struct watched_track {
        std::string        encoded;
        track_end_callback on_end;
    };

    dpp::cluster& m_cluster;
    node_config   m_cfg;

    // Lavalink v4 session id (used in /v4/sessions/{sessionId}/players/...)
    std::string   m_session_id;

    mutable std::mutex m_voice_mutex;
    std::unordered_map<dpp::snowflake, voice_state> m_voice_states;

    std::mutex                                        m_watch_mutex;
    std::condition_variable                           m_watch_cv;
    std::unordered_map<dpp::snowflake, watched_track> m_watched;
    std::thread                                       m_watch_thread;
    bool                                              m_watch_stop = false;

    std::string http_request(const std::string& method,
                             const std::string& urlpath,
                             const std::string& body_json = "") const;

    std::optional<voice_state> get_voice_state_locked(dpp::snowflake guild_id) const;

    bool send_player_update(dpp::snowflake guild_id,
                            const std::string& body_json,
                            bool log_payload);

    void poll_watched();
    void watch_loop(std::chrono::milliseconds interval);
};

} // namespace aurora::lavalink
