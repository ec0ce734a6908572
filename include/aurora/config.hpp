#pragma once

#include <string>
#include <cstdint>

#include <dpp/dpp.h>

#include "aurora/lavalink/client.hpp"

namespace aurora {

class config_error : public dpp::exception {
public:
    using dpp::exception::exception;
};

struct bot_config {
    std::string                 token;
    lavalink::node_config       lavalink;

    std::size_t                 skip_quorum       = 3;
    float                       default_volume    = 0.6f;   // 0.0 - 2.0
    std::uint32_t               watch_interval_ms = 1000;
    std::string                 search_prefix     = "ytsearch:";
};

/// Parse a JSON config document on top of the defaults.
/// Throws config_error on malformed JSON or out-of-range values.
bot_config parse_config(const std::string& json_text);

/// Read `path` (a missing file means defaults), then apply environment
/// overrides. Throws config_error.
bot_config load_config(const std::string& path);

/// Applies AURORA_* environment variables (and the legacy `token`).
void apply_env_overrides(bot_config& cfg);

void validate(bot_config& cfg);

} // namespace aurora
