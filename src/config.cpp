#include "aurora/config.hpp"

#include <dpp/json.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace aurora {

namespace {

const char* env(const char* name)
{
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

long parse_long(const char* name, const char* text)
{
    try {
        std::size_t used = 0;
        long v = std::stol(text, &used);
        if (used != std::string(text).size()) {
            throw std::invalid_argument(text);
        }
        return v;
    } catch (const std::exception&) {
        throw config_error(std::string(name) + " is not a number: " + text);
    }
}

} // namespace

bot_config parse_config(const std::string& json_text)
{
    bot_config cfg;

    dpp::json j;
    try {
        j = dpp::json::parse(json_text);
    } catch (const std::exception& e) {
        throw config_error(std::string("Malformed config: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("Config must be a JSON object");
    }

    try {
        cfg.token = j.value("token", cfg.token);

        if (j.contains("lavalink") && j["lavalink"].is_object()) {
            const auto& l = j["lavalink"];
            cfg.lavalink.host       = l.value("host", cfg.lavalink.host);
            cfg.lavalink.port       = static_cast<uint16_t>(l.value("port", static_cast<int>(cfg.lavalink.port)));
            cfg.lavalink.https      = l.value("https", cfg.lavalink.https);
            cfg.lavalink.password   = l.value("password", cfg.lavalink.password);
            cfg.lavalink.session_id = l.value("session_id", cfg.lavalink.session_id);

            if (l.contains("port") && (l["port"].get<int>() < 1 || l["port"].get<int>() > 65535)) {
                throw config_error("lavalink.port out of range");
            }
        }

        if (j.contains("music") && j["music"].is_object()) {
            const auto& m = j["music"];
            if (m.contains("skip_quorum")) {
                const long q = m["skip_quorum"].get<long>();
                if (q < 1) {
                    throw config_error("music.skip_quorum must be at least 1");
                }
                cfg.skip_quorum = static_cast<std::size_t>(q);
            }
            cfg.default_volume    = m.value("default_volume", cfg.default_volume);
            cfg.watch_interval_ms = m.value("watch_interval_ms", cfg.watch_interval_ms);
            cfg.search_prefix     = m.value("search_prefix", cfg.search_prefix);
        }
    } catch (const dpp::json::exception& e) {
        throw config_error(std::string("Invalid config value: ") + e.what());
    }

    validate(cfg);
    return cfg;
}

void apply_env_overrides(bot_config& cfg)
{
    // `token` is what the bot has always read; AURORA_TOKEN wins if both are set.
    if (const char* v = env("token")) {
        cfg.token = v;
    }
    if (const char* v = env("AURORA_TOKEN")) {
        cfg.token = v;
    }
    if (const char* v = env("AURORA_LAVALINK_HOST")) {
        cfg.lavalink.host = v;
    }
    if (const char* v = env("AURORA_LAVALINK_PORT")) {
        const long port = parse_long("AURORA_LAVALINK_PORT", v);
        if (port < 1 || port > 65535) {
            throw config_error("AURORA_LAVALINK_PORT out of range");
        }
        cfg.lavalink.port = static_cast<uint16_t>(port);
    }
    if (const char* v = env("AURORA_LAVALINK_PASSWORD")) {
        cfg.lavalink.password = v;
    }
    if (const char* v = env("AURORA_LAVALINK_SESSION")) {
        cfg.lavalink.session_id = v;
    }
    if (const char* v = env("AURORA_SKIP_QUORUM")) {
        const long q = parse_long("AURORA_SKIP_QUORUM", v);
        if (q < 1) {
            throw config_error("AURORA_SKIP_QUORUM must be at least 1");
        }
        cfg.skip_quorum = static_cast<std::size_t>(q);
    }
}

void validate(bot_config& cfg)
{
    if (cfg.skip_quorum < 1) {
        throw config_error("skip_quorum must be at least 1");
    }
    if (cfg.watch_interval_ms == 0) {
        throw config_error("watch_interval_ms must be positive");
    }
    cfg.default_volume = std::clamp(cfg.default_volume, 0.0f, 2.0f);
}

bot_config load_config(const std::string& path)
{
    bot_config cfg;

    std::ifstream in(path);
    if (in.is_open()) {
        std::ostringstream ss;
        ss << in.rdbuf();
        cfg = parse_config(ss.str());
    }

    apply_env_overrides(cfg);
    validate(cfg);
    return cfg;
}

} // namespace aurora
