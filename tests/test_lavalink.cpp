#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <type_traits>

#include "aurora/lavalink/client.hpp"
#include "aurora/lavalink/track_source.hpp"

using namespace aurora::lavalink;

TEST_CASE("search results come back in order", "[lavalink]") {
    auto res = parse_load_result(R"({
        "loadType": "search",
        "data": [
            { "encoded": "QAAA1", "info": { "title": "First", "author": "Someone",
                                            "length": 215000, "uri": "https://a", "isStream": false } },
            { "encoded": "QAAA2", "info": { "title": "Second", "length": 1000 } }
        ]
    })");

    REQUIRE(res.type == load_type::search);
    REQUIRE(res.tracks.size() == 2);
    CHECK(res.tracks[0].encoded == "QAAA1");
    CHECK(res.tracks[0].title == "First");
    CHECK(res.tracks[0].author == "Someone");
    CHECK(res.tracks[0].length_ms == 215000);
    CHECK(res.tracks[0].uri == "https://a");
    CHECK(res.tracks[1].title == "Second");
}

TEST_CASE("a single track result is an object", "[lavalink]") {
    auto res = parse_load_result(R"({
        "loadType": "track",
        "data": { "encoded": "QBBB", "info": { "title": "Live", "isStream": true } }
    })");

    REQUIRE(res.type == load_type::track);
    REQUIRE(res.tracks.size() == 1);
    CHECK(res.tracks[0].is_stream);
}

TEST_CASE("playlist tracks are nested", "[lavalink]") {
    auto res = parse_load_result(R"({
        "loadType": "playlist",
        "data": { "info": { "name": "Mix" },
                  "tracks": [ { "encoded": "P1" }, { "encoded": "" }, { "encoded": "P2" } ] }
    })");

    REQUIRE(res.type == load_type::playlist);
    REQUIRE(res.tracks.size() == 2); // the entry without an encoded track is dropped
    CHECK(res.tracks[1].encoded == "P2");
}

TEST_CASE("errors and garbage are reported as load errors", "[lavalink]") {
    auto err = parse_load_result(R"({"loadType": "error", "data": {"message": "This video is private"}})");
    CHECK(err.type == load_type::error);
    CHECK(err.error_message == "This video is private");

    auto empty = parse_load_result(R"({"loadType": "empty", "data": {}})");
    CHECK(empty.type == load_type::empty);
    CHECK(empty.tracks.empty());

    CHECK(parse_load_result("<html>").type == load_type::error);
    CHECK(parse_load_result(R"({"loadType": "weird"})").type == load_type::error);
}

TEST_CASE("player state tells whether a track is loaded", "[lavalink]") {
    auto playing = parse_player_state(R"({"track": {"encoded": "QAAA1"}, "paused": true, "volume": 60})");
    REQUIRE(playing.has_value());
    REQUIRE(playing->encoded_track.has_value());
    CHECK(*playing->encoded_track == "QAAA1");
    CHECK(playing->paused);
    CHECK(playing->volume == 60);

    auto idle = parse_player_state(R"({"track": null, "paused": false})");
    REQUIRE(idle.has_value());
    CHECK_FALSE(idle->encoded_track.has_value());

    CHECK_FALSE(parse_player_state("not json").has_value());
}

TEST_CASE("queries become Lavalink identifiers", "[lavalink]") {
    CHECK(make_identifier("https://youtu.be/abc", "ytsearch:") == "https://youtu.be/abc");
    CHECK(make_identifier("http://example.com/a.mp3", "ytsearch:") == "http://example.com/a.mp3");
    CHECK(make_identifier("never gonna give you up", "ytsearch:") == "ytsearch:never gonna give you up");
}

TEST_CASE("play takes only the track and an optional volume", "[lavalink]") {
    using play_fn = bool (node::*)(dpp::snowflake, const std::string&, std::optional<int>);
    STATIC_REQUIRE(std::is_same<decltype(&node::play), play_fn>::value);
}
