#include <catch2/catch.hpp>

#include "aurora/commands/discord_notifier.hpp"
#include "aurora/commands/music.hpp"

using namespace aurora;

TEST_CASE("only now-playing is announced in the channel", "[commands]") {
    playback::event_payload payload;
    playback::entry_info info;
    info.title     = "Song";
    info.author    = "Band";
    info.requester = dpp::snowflake{123};
    info.duration_seconds = 61;
    payload.entry = info;

    auto text = commands::render(playback::event_kind::now_playing, payload);
    REQUIRE(text.has_value());
    CHECK(*text == "Now playing Song by Band [length: 1m 1s], requested by <@123>");

    CHECK_FALSE(commands::render(playback::event_kind::enqueued, payload).has_value());
    CHECK_FALSE(commands::render(playback::event_kind::vote_recorded, payload).has_value());
    CHECK_FALSE(commands::render(playback::event_kind::now_playing, playback::event_payload{}).has_value());
}

TEST_CASE("skip replies match the outcome", "[commands]") {
    playback::vote_outcome out;
    out.kind  = playback::vote_kind::vote_recorded;
    out.votes = 2;
    CHECK(music::describe_vote(out, 3) == "Skip vote added, currently at [2/3]");

    out.kind = playback::vote_kind::quorum_reached;
    CHECK(music::describe_vote(out, 3) == "Skip vote passed, skipping song...");

    out.kind = playback::vote_kind::forced;
    CHECK(music::describe_vote(out, 3) == "Requester requested skipping song...");

    out.kind = playback::vote_kind::already_voted;
    CHECK(music::describe_vote(out, 3) == "You have already voted to skip this song.");

    out.kind = playback::vote_kind::nothing_playing;
    CHECK(music::describe_vote(out, 3) == "Not playing any music right now.");
}
