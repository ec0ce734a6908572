#include <catch2/catch.hpp>

#include "aurora/playback/queue_entry.hpp"
#include "aurora/playback/skip_arbitrator.hpp"

#include "fakes.hpp"

using namespace aurora::playback;
using aurora::test::make_source;

namespace {

const dpp::snowflake requester{100};
const dpp::snowflake text_channel{900};

queue_entry make_entry()
{
    return queue_entry(requester, text_channel, make_source("song").first);
}

} // namespace

TEST_CASE("no current entry means nothing to skip", "[skip]") {
    std::unordered_set<dpp::snowflake> votes;
    auto out = arbitrate_skip(dpp::snowflake{1}, votes, nullptr, 3);
    CHECK(out.kind == vote_kind::nothing_playing);
    CHECK_FALSE(out.skips());
}

TEST_CASE("requester always forces the skip", "[skip]") {
    auto entry = make_entry();
    std::unordered_set<dpp::snowflake> votes{dpp::snowflake{1}, dpp::snowflake{2}};

    auto out = arbitrate_skip(requester, votes, &entry, 3);
    CHECK(out.kind == vote_kind::forced);
    CHECK(out.skips());
}

TEST_CASE("votes count once per voter and pass at quorum", "[skip]") {
    auto entry = make_entry();
    std::unordered_set<dpp::snowflake> votes;

    auto first = arbitrate_skip(dpp::snowflake{1}, votes, &entry, 3);
    REQUIRE(first.kind == vote_kind::vote_recorded);
    CHECK(first.votes == 1);
    votes.insert(dpp::snowflake{1});

    auto again = arbitrate_skip(dpp::snowflake{1}, votes, &entry, 3);
    CHECK(again.kind == vote_kind::already_voted);
    CHECK(again.votes == 1);

    auto second = arbitrate_skip(dpp::snowflake{2}, votes, &entry, 3);
    CHECK(second.kind == vote_kind::vote_recorded);
    CHECK(second.votes == 2);
    votes.insert(dpp::snowflake{2});

    auto third = arbitrate_skip(dpp::snowflake{3}, votes, &entry, 3);
    CHECK(third.kind == vote_kind::quorum_reached);
    CHECK(third.votes == 3);
}

TEST_CASE("a quorum of one skips on the first vote", "[skip]") {
    auto entry = make_entry();
    std::unordered_set<dpp::snowflake> votes;
    CHECK(arbitrate_skip(dpp::snowflake{7}, votes, &entry, 1).kind == vote_kind::quorum_reached);
}

TEST_CASE("vote kinds have readable names", "[skip]") {
    CHECK(std::string(to_string(vote_kind::quorum_reached)) == "quorum_reached");
    CHECK(std::string(to_string(vote_kind::already_voted)) == "already_voted");
}
