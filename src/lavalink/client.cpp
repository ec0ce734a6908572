#include "aurora/lavalink/client.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <sstream>
#include <future>
#include <map>

namespace aurora::lavalink {

namespace {

track parse_track(const dpp::json& el)
{
    track t;
    t.encoded = el.value("encoded", "");

    if (el.contains("info") && el["info"].is_object()) {
        const auto& info = el["info"];
        t.title     = info.value("title", "");
        t.author    = info.value("author", "");
        t.length_ms = info.value("length", static_cast<std::int64_t>(0));
        t.uri       = info.value("uri", "");
        t.is_stream = info.value("isStream", false);
    }
    return t;
}

} // namespace

load_result parse_load_result(const std::string& body)
{
    load_result res;

    dpp::json j;
    try {
        j = dpp::json::parse(body);
    } catch (const std::exception& e) {
        res.type = load_type::error;
        res.error_message = std::string("Failed to parse Lavalink response: ") + e.what();
        return res;
    }

    if (!j.is_object()) {
        res.type = load_type::error;
        res.error_message = "Lavalink response is not an object";
        return res;
    }

    const std::string load_type_str = j.value("loadType", "");

    if (load_type_str == "track") {
        res.type = load_type::track;
    } else if (load_type_str == "search") {
        res.type = load_type::search;
    } else if (load_type_str == "playlist") {
        res.type = load_type::playlist;
    } else if (load_type_str == "empty") {
        res.type = load_type::empty;
    } else if (load_type_str == "error") {
        res.type = load_type::error;
        if (j.contains("data") && j["data"].is_object()) {
            res.error_message = j["data"].value("message", "Unknown Lavalink error");
        } else {
            res.error_message = "Unknown Lavalink error (no data field)";
        }
    } else {
        res.type = load_type::error;
        res.error_message = "Unknown loadType: " + load_type_str;
    }

    if (!j.contains("data")) {
        return res;
    }
    const auto& data = j["data"];

    // v4 shapes: track -> object, search -> array, playlist -> {tracks: [...]}
    if (res.type == load_type::track && data.is_object()) {
        res.tracks.push_back(parse_track(data));
    } else if (res.type == load_type::search && data.is_array()) {
        for (const auto& el : data) {
            res.tracks.push_back(parse_track(el));
        }
    } else if (res.type == load_type::playlist && data.is_object()
               && data.contains("tracks") && data["tracks"].is_array()) {
        for (const auto& el : data["tracks"]) {
            res.tracks.push_back(parse_track(el));
        }
    }

    // encoded is the only thing strictly required to play
    res.tracks.erase(std::remove_if(res.tracks.begin(), res.tracks.end(),
                                    [](const track& t) { return t.encoded.empty(); }),
                     res.tracks.end());
    return res;
}

std::optional<player_state> parse_player_state(const std::string& body)
{
    dpp::json j;
    try {
        j = dpp::json::parse(body);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (!j.is_object()) {
        return std::nullopt;
    }

    player_state ps;
    if (j.contains("track") && j["track"].is_object()) {
        const auto& t = j["track"];
        if (t.contains("encoded") && t["encoded"].is_string()) {
            ps.encoded_track = t["encoded"].get<std::string>();
        }
    }
    ps.paused = j.value("paused", false);
    ps.volume = j.value("volume", 100);
    return ps;
}

node::node(dpp::cluster& cluster, const node_config& cfg)
    : m_cluster(cluster)
    , m_cfg(cfg)
    , m_session_id(cfg.session_id)
{
    std::ostringstream oss;
    oss << "Initialising Lavalink node at "
        << (m_cfg.https ? "https://" : "http://")
        << m_cfg.host << ":" << m_cfg.port
        << " with session_id='" << m_session_id << "'";
    m_cluster.log(dpp::ll_info, oss.str());
}

node::~node()
{
    stop_watcher();
}

void node::handle_voice_state_update(const dpp::voice_state_update_t& ev)
{
    // Only cache our own bot's voice state
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_voice_mutex);
    if (ev.state.channel_id.empty()) {
        m_voice_states.erase(ev.state.guild_id);
        m_cluster.log(dpp::ll_debug,
                      "Dropped voice_state for guild " + ev.state.guild_id.str() + " (left voice)");
        return;
    }

    auto& vs = m_voice_states[ev.state.guild_id];
    vs.session_id = ev.state.session_id;

    std::ostringstream oss;
    oss << "Cached voice_state for guild " << ev.state.guild_id
        << " session_id=" << vs.session_id;
    m_cluster.log(dpp::ll_debug, oss.str());
}

void node::handle_voice_server_update(const dpp::voice_server_update_t& ev)
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.guild_id];
    vs.token    = ev.token;
    vs.endpoint = ev.endpoint;

    std::ostringstream oss;
    oss << "Cached voice_server for guild " << ev.guild_id
        << " token=" << (!vs.token.empty() ? "<set>" : "<empty>")
        << " endpoint=" << vs.endpoint;
    m_cluster.log(dpp::ll_debug, oss.str());
}

std::optional<node::voice_state> node::get_voice_state_locked(dpp::snowflake guild_id) const
{
    auto it = m_voice_states.find(guild_id);
    if (it == m_voice_states.end()) {
        return std::nullopt;
    }
    const auto& vs = it->second;
    if (vs.token.empty() || vs.endpoint.empty() || vs.session_id.empty()) {
        return std::nullopt;
    }
    return vs;
}

std::string node::http_request(const std::string& method,
                               const std::string& urlpath,
                               const std::string& body_json) const
{
    dpp::http_method http_method_enum = dpp::m_get;
    if (method == "POST") {
        http_method_enum = dpp::m_post;
    } else if (method == "PATCH") {
        http_method_enum = dpp::m_patch;
    } else if (method == "DELETE") {
        http_method_enum = dpp::m_delete;
    } else if (method == "PUT") {
        http_method_enum = dpp::m_put;
    }

    const std::string scheme   = m_cfg.https ? "https://" : "http://";
    const std::string full_url = scheme + m_cfg.host + ":" + std::to_string(m_cfg.port) + urlpath;

    std::multimap<std::string, std::string> headers;
    headers.emplace("Authorization", m_cfg.password);
    headers.emplace("User-Id",       m_cluster.me.id.str());
    headers.emplace("Client-Name",   "AuroraBot");

    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_cluster.log(
        dpp::ll_trace,
        "Lavalink HTTP request: " + method + " " + urlpath +
        " (body=" + (body_json.empty() ? "empty" : std::to_string(body_json.size()) + " bytes") + ")"
    );

    m_cluster.request(
        full_url,
        http_method_enum,
        [this, method, urlpath, prom](const dpp::http_request_completion_t& cc) {
            std::ostringstream oss;
            oss << "Lavalink HTTP " << cc.status
                << " on " << method << " " << urlpath
                << " (response length=" << cc.body.size() << ")";

            if (cc.status == 0) {
                m_cluster.log(dpp::ll_warning, oss.str() + " (request failed)");
            } else if (cc.status >= 400) {
                m_cluster.log(dpp::ll_warning, oss.str() + " response: " + cc.body);
            } else {
                m_cluster.log(dpp::ll_trace, oss.str());
            }

            prom->set_value(cc);
        },
        body_json,
        body_json.empty() ? "" : "application/json",
        headers
    );

    const auto cc = fut.get();
    if (cc.status == 0 || cc.status >= 400 || cc.body.empty()) {
        return {};
    }
    return cc.body;
}

load_result node::load_tracks(const std::string& identifier) const
{
    m_cluster.log(
        dpp::ll_debug,
        "Requesting /v4/loadtracks for identifier: " + identifier
    );

    std::string path = "/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier);
    std::string body = http_request("GET", path, {});

    if (body.empty()) {
        m_cluster.log(
            dpp::ll_warning,
            "Empty response from Lavalink /loadtracks for identifier: " + identifier
        );
        load_result res;
        res.type = load_type::error;
        res.error_message = "Lavalink node did not answer";
        return res;
    }

    load_result res = parse_load_result(body);

    if (res.type == load_type::error) {
        m_cluster.log(
            dpp::ll_warning,
            "Lavalink /loadtracks error for identifier '" + identifier +
            "': " + res.error_message
        );
    } else {
        std::ostringstream oss;
        oss << "Loaded " << res.tracks.size()
            << " track(s) from Lavalink for identifier: " << identifier;
        m_cluster.log(dpp::ll_info, oss.str());
    }

    return res;
}

bool node::send_player_update(dpp::snowflake guild_id,
                              const std::string& body_json,
                              bool log_payload)
{
    if (m_session_id.empty()) {
        m_cluster.log(
            dpp::ll_warning,
            "Cannot send player update: session id is empty"
        );
        return false;
    }

    std::string path = "/v4/sessions/" + m_session_id +
                       "/players/" + guild_id.str();

    if (log_payload) {
        std::ostringstream oss;
        oss << "Sending player update to Lavalink for guild "
            << guild_id << ": " << body_json;
        m_cluster.log(dpp::ll_debug, oss.str());
    }

    std::string resp = http_request("PATCH", path, body_json);
    // http_request already logged status; treat non-empty body as "sent"
    return !resp.empty();
}

bool node::play(dpp::snowflake guild_id,
                const std::string& encoded_track,
                std::optional<int> volume)
{
    dpp::json payload;
    payload["track"]["encoded"] = encoded_track;

    if (volume.has_value()) {
        payload["volume"] = *volume;
    }
    payload["paused"] = false;

    std::optional<voice_state> vs;
    {
        std::lock_guard<std::mutex> lock(m_voice_mutex);
        vs = get_voice_state_locked(guild_id);
    }

    if (vs.has_value()) {
        payload["voice"]["token"]     = vs->token;
        payload["voice"]["endpoint"]  = vs->endpoint;
        payload["voice"]["sessionId"] = vs->session_id;
    } else {
        m_cluster.log(dpp::ll_warning,
                      "No voice connection cached for guild " + guild_id.str() +
                      ", Lavalink may not be able to stream");
    }

    m_cluster.log(dpp::ll_info, "Sending play to Lavalink for guild " + guild_id.str());

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/false);
}

bool node::stop(dpp::snowflake guild_id)
{
    dpp::json payload;
    payload["track"]["encoded"] = nullptr;

    m_cluster.log(
        dpp::ll_info,
        "Sending stop to Lavalink for guild " + guild_id.str()
    );

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/true);
}

bool node::pause(dpp::snowflake guild_id, bool pause_flag)
{
    dpp::json payload;
    payload["paused"] = pause_flag;

    std::ostringstream oss;
    oss << "Sending pause=" << std::boolalpha << pause_flag
        << " to Lavalink for guild " << guild_id;
    m_cluster.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/true);
}

bool node::set_volume(dpp::snowflake guild_id, int volume_percent)
{
    dpp::json payload;
    payload["volume"] = volume_percent;

    std::ostringstream oss;
    oss << "Sending volume=" << volume_percent
        << " to Lavalink for guild " << guild_id;
    m_cluster.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload.dump(), /*log_payload=*/true);
}

std::optional<player_state> node::get_player(dpp::snowflake guild_id) const
{
    if (m_session_id.empty()) {
        return std::nullopt;
    }
    std::string body = http_request("GET", "/v4/sessions/" + m_session_id +
                                           "/players/" + guild_id.str());
    if (body.empty()) {
        return std::nullopt;
    }
    return parse_player_state(body);
}

void node::watch(dpp::snowflake guild_id, const std::string& encoded_track, track_end_callback on_end)
{
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    m_watched[guild_id] = watched_track{encoded_track, std::move(on_end)};
}

void node::unwatch(dpp::snowflake guild_id, const std::string& encoded_track)
{
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    auto it = m_watched.find(guild_id);
    if (it != m_watched.end() && it->second.encoded == encoded_track) {
        m_watched.erase(it);
    }
}

void node::start_watcher(std::chrono::milliseconds interval)
{
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    if (m_watch_thread.joinable()) {
        return;
    }
    m_watch_stop   = false;
    m_watch_thread = std::thread([this, interval] { watch_loop(interval); });
}

void node::stop_watcher()
{
    {
        std::lock_guard<std::mutex> lock(m_watch_mutex);
        m_watch_stop = true;
    }
    m_watch_cv.notify_all();
    if (m_watch_thread.joinable()) {
        m_watch_thread.join();
    }
}

void node::watch_loop(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(m_watch_mutex);
    while (!m_watch_stop) {
        m_watch_cv.wait_for(lock, interval, [this] { return m_watch_stop; });
        if (m_watch_stop) {
            break;
        }
        lock.unlock();
        poll_watched();
        lock.lock();
    }
}

void node::poll_watched()
{
    std::vector<std::pair<dpp::snowflake, std::string>> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_watch_mutex);
        for (const auto& [guild_id, w] : m_watched) {
            snapshot.emplace_back(guild_id, w.encoded);
        }
    }

    for (const auto& [guild_id, encoded] : snapshot) {
        auto ps = get_player(guild_id);
        if (!ps.has_value()) {
            continue; // transient failure, try again next round
        }
        if (ps->encoded_track.has_value() && *ps->encoded_track == encoded) {
            continue;
        }

        track_end_callback on_end;
        {
            std::lock_guard<std::mutex> lock(m_watch_mutex);
            auto it = m_watched.find(guild_id);
            if (it == m_watched.end() || it->second.encoded != encoded) {
                continue; // replaced or unwatched while we were polling
            }
            on_end = std::move(it->second.on_end);
            m_watched.erase(it);
        }

        m_cluster.log(dpp::ll_debug, "Track ended on Lavalink for guild " + guild_id.str());
        if (on_end) {
            on_end();
        }
    }
}

} // namespace aurora::lavalink
