#include <catch2/catch.hpp>

#include <thread>
#include <vector>

#include "aurora/playback/jukebox.hpp"

#include "fakes.hpp"

using namespace aurora::playback;
using namespace aurora::test;
using aurora::voice::transport_error;
using aurora::voice::transport_failure;

namespace {

const dpp::snowflake guild{1};
const dpp::snowflake voice_a{10};
const dpp::snowflake voice_b{11};
const dpp::snowflake text_channel{50};
const dpp::snowflake alice{101};

struct jukebox_fixture {
    fake_transport            transports;
    recording_notifier        events;
    std::shared_ptr<play_log> log = std::make_shared<play_log>();
    jukebox                   box{transports, channel_options{3, 0.6f}, &events};

    std::shared_ptr<source_probe> play(const std::string& title, dpp::snowflake requester = alice,
                                       dpp::snowflake key = guild)
    {
        auto [source, probe] = make_source(title, log);
        box.enqueue(key, requester, text_channel, std::move(source));
        return probe;
    }

    bool now_playing(const std::string& title, dpp::snowflake key = guild)
    {
        return eventually([&] {
            auto st = box.status(key);
            return st.current.has_value() && st.current->title == title && st.started;
        });
    }
};

} // namespace

TEST_CASE("a failed first join leaves no session behind", "[jukebox]") {
    jukebox_fixture f;
    f.transports.probe->fail_connect = transport_failure::not_a_voice_destination;

    try {
        f.box.join(guild, voice_a);
        FAIL("join should have thrown");
    } catch (const transport_error& e) {
        CHECK(e.kind() == transport_failure::not_a_voice_destination);
    }

    CHECK_FALSE(f.box.is_connected(guild));
    CHECK(f.box.sessions() == 0);
    CHECK(f.box.status(guild).state == playback_state::idle);
}

TEST_CASE("joining twice is refused without a second connect", "[jukebox]") {
    jukebox_fixture f;
    f.box.join(guild, voice_a);
    CHECK(f.box.is_connected(guild));

    try {
        f.box.join(guild, voice_b);
        FAIL("second join should have thrown");
    } catch (const transport_error& e) {
        CHECK(e.kind() == transport_failure::already_connected_elsewhere);
    }
    CHECK(f.transports.probe->connects == 1);
}

TEST_CASE("summon moves an existing connection or connects", "[jukebox]") {
    jukebox_fixture f;
    f.box.summon(guild, voice_a);
    CHECK(f.transports.probe->connects == 1);

    f.box.summon(guild, voice_b);
    CHECK(f.transports.probe->connects == 1);
    REQUIRE(f.transports.probe->moves.size() == 1);
    CHECK(f.transports.probe->moves.front() == voice_b);
}

TEST_CASE("a failed move keeps the session as it was", "[jukebox]") {
    jukebox_fixture f;
    f.box.join(guild, voice_a);
    f.play("A");
    REQUIRE(f.now_playing("A"));

    f.transports.probe->fail_move = transport_failure::not_a_voice_destination;
    REQUIRE_THROWS_AS(f.box.summon(guild, voice_b), transport_error);
    CHECK(f.box.is_connected(guild));
    CHECK(f.box.status(guild).current->title == "A");
}

TEST_CASE("enqueue reports that the entry was accepted", "[jukebox]") {
    jukebox_fixture f;
    auto [first, first_probe] = make_source("first", f.log);
    CHECK(f.box.enqueue(guild, alice, text_channel, std::move(first)));
    REQUIRE(f.now_playing("first"));
    CHECK(first_probe->started());
}

TEST_CASE("enqueue A, B, C plays them in order with announcements", "[jukebox]") {
    jukebox_fixture f;
    auto a = f.play("A");
    auto b = f.play("B");
    auto c = f.play("C");

    REQUIRE(f.now_playing("A"));
    a->finish();
    REQUIRE(f.now_playing("B"));
    b->finish();
    REQUIRE(f.now_playing("C"));

    CHECK(f.log->started() == std::vector<std::string>{"A", "B", "C"});
    CHECK(f.events.of_kind(event_kind::now_playing).size() == 3);
    CHECK(a->current_volume() == Approx(0.6f));
}

TEST_CASE("quorum scenario through the jukebox", "[jukebox][skip]") {
    jukebox_fixture f;
    auto a = f.play("A", alice);
    f.play("B", alice);
    REQUIRE(f.now_playing("A"));

    auto v1 = f.box.vote_skip(guild, dpp::snowflake{201});
    auto v2 = f.box.vote_skip(guild, dpp::snowflake{202});
    CHECK(v1.kind == vote_kind::vote_recorded);
    CHECK(v1.votes == 1);
    CHECK(v2.kind == vote_kind::vote_recorded);
    CHECK(v2.votes == 2);
    CHECK(f.box.status(guild).current->title == "A");

    auto v3 = f.box.vote_skip(guild, dpp::snowflake{203});
    CHECK(v3.kind == vote_kind::quorum_reached);
    REQUIRE(f.now_playing("B"));
    CHECK(a->stop_count() == 1);
}

TEST_CASE("operations on an unknown channel are harmless", "[jukebox]") {
    jukebox_fixture f;
    const dpp::snowflake nowhere{999};

    CHECK(f.box.vote_skip(nowhere, alice).kind == vote_kind::nothing_playing);
    CHECK_FALSE(f.box.pause(nowhere));
    CHECK_FALSE(f.box.resume(nowhere));
    CHECK_FALSE(f.box.set_volume(nowhere, 80));
    CHECK(f.box.status(nowhere).state == playback_state::idle);
    CHECK(f.box.upcoming(nowhere).empty());
    CHECK_FALSE(f.box.stop(nowhere));
    CHECK(f.box.sessions() == 0);
}

TEST_CASE("status reflects playing and paused", "[jukebox]") {
    jukebox_fixture f;
    f.play("A");
    f.play("B");
    REQUIRE(f.now_playing("A"));

    auto st = f.box.status(guild);
    CHECK(st.state == playback_state::playing);
    CHECK(st.current->requester == alice);
    CHECK(st.queued == 1);

    REQUIRE(f.box.pause(guild));
    CHECK(f.box.status(guild).state == playback_state::paused);
    REQUIRE(f.box.resume(guild));
    CHECK(f.box.status(guild).state == playback_state::playing);

    CHECK(f.box.set_volume(guild, 150));
}

TEST_CASE("stop tears down the session and is idempotent", "[jukebox]") {
    jukebox_fixture f;
    f.box.join(guild, voice_a);
    auto a = f.play("A");
    f.play("B");
    REQUIRE(f.now_playing("A"));

    CHECK(f.box.stop(guild));
    CHECK(a->stop_count() == 1);
    CHECK(f.transports.probe->disconnects == 1);
    CHECK(f.box.sessions() == 0);
    CHECK(f.box.status(guild).state == playback_state::idle);

    CHECK_FALSE(f.box.stop(guild));
    CHECK(f.transports.probe->disconnects == 1);

    // A fresh session can be joined afterwards.
    f.box.join(guild, voice_a);
    CHECK(f.transports.probe->connects == 2);
}

TEST_CASE("concurrent first enqueues keep every entry", "[jukebox]") {
    jukebox_fixture f;
    constexpr int callers = 12;

    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&f, i] { f.play("song-" + std::to_string(i), dpp::snowflake{300u + i}); });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(f.box.sessions() == 1);
    REQUIRE(eventually([&] { return f.box.status(guild).current.has_value(); }));
    auto st = f.box.status(guild);
    CHECK(st.queued + 1 == callers);
    CHECK(f.events.of_kind(event_kind::enqueued).size() == callers);
    CHECK(f.log->size() == 1);
}

TEST_CASE("channels do not block each other", "[jukebox]") {
    jukebox_fixture f;
    const dpp::snowflake other{2};

    auto a = f.play("A", alice, guild);
    f.play("X", alice, other);
    REQUIRE(f.now_playing("A", guild));
    REQUIRE(f.now_playing("X", other));

    CHECK(f.box.vote_skip(guild, alice).kind == vote_kind::forced);
    CHECK(f.box.status(other).current->title == "X");
    CHECK(f.box.sessions() == 2);
}

TEST_CASE("unload stops every session", "[jukebox]") {
    jukebox_fixture f;
    f.box.join(guild, voice_a);
    f.box.join(dpp::snowflake{2}, voice_b);
    auto a = f.play("A");
    REQUIRE(f.now_playing("A"));

    f.box.unload();
    CHECK(f.box.sessions() == 0);
    CHECK(a->stop_count() == 1);
    CHECK(f.transports.probe->disconnects == 2);
}
