#include <catch2/catch.hpp>

#include "aurora/config.hpp"

using namespace aurora;

TEST_CASE("an empty object keeps the defaults", "[config]") {
    auto cfg = parse_config("{}");
    CHECK(cfg.skip_quorum == 3);
    CHECK(cfg.default_volume == Approx(0.6f));
    CHECK(cfg.lavalink.host == "127.0.0.1");
    CHECK(cfg.lavalink.port == 2333);
    CHECK(cfg.lavalink.session_id == "default");
    CHECK(cfg.search_prefix == "ytsearch:");
}

TEST_CASE("config values override the defaults", "[config]") {
    auto cfg = parse_config(R"({
        "token": "abc",
        "lavalink": { "host": "lava.local", "port": 443, "https": true,
                      "password": "pw", "session_id": "aurora" },
        "music": { "skip_quorum": 2, "default_volume": 1.5,
                   "watch_interval_ms": 250, "search_prefix": "scsearch:" }
    })");

    CHECK(cfg.token == "abc");
    CHECK(cfg.lavalink.host == "lava.local");
    CHECK(cfg.lavalink.port == 443);
    CHECK(cfg.lavalink.https);
    CHECK(cfg.lavalink.password == "pw");
    CHECK(cfg.lavalink.session_id == "aurora");
    CHECK(cfg.skip_quorum == 2);
    CHECK(cfg.default_volume == Approx(1.5f));
    CHECK(cfg.watch_interval_ms == 250);
    CHECK(cfg.search_prefix == "scsearch:");
}

TEST_CASE("volume is clamped to the playable range", "[config]") {
    CHECK(parse_config(R"({"music": {"default_volume": 5.0}})").default_volume == Approx(2.0f));
    CHECK(parse_config(R"({"music": {"default_volume": -1.0}})").default_volume == Approx(0.0f));
}

TEST_CASE("bad configs are rejected", "[config]") {
    CHECK_THROWS_AS(parse_config("{ not json"), config_error);
    CHECK_THROWS_AS(parse_config("[1, 2]"), config_error);
    CHECK_THROWS_AS(parse_config(R"({"music": {"skip_quorum": 0}})"), config_error);
    CHECK_THROWS_AS(parse_config(R"({"music": {"skip_quorum": "three"}})"), config_error);
    CHECK_THROWS_AS(parse_config(R"({"lavalink": {"port": 70000}})"), config_error);
    CHECK_THROWS_AS(parse_config(R"({"music": {"watch_interval_ms": 0}})"), config_error);
}

TEST_CASE("a missing config file means defaults", "[config]") {
    auto cfg = load_config("/nonexistent/aurora-test-config.json");
    CHECK(cfg.lavalink.port >= 1);
    CHECK(cfg.skip_quorum >= 1);
}
