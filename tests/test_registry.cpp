#include <catch2/catch.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "aurora/playback/registry.hpp"

#include "fakes.hpp"

using namespace aurora::playback;
using namespace aurora::test;

TEST_CASE("get_or_create returns one state per key under contention", "[registry]") {
    registry reg(channel_options{});

    constexpr int callers = 16;
    std::vector<std::shared_ptr<channel_state>> seen(callers);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&, i] {
            while (!go) {
                std::this_thread::yield();
            }
            seen[i] = reg.get_or_create(dpp::snowflake{42});
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& s : seen) {
        CHECK(s == seen.front());
    }
    CHECK(reg.size() == 1);
}

TEST_CASE("different keys get independent states", "[registry]") {
    registry reg(channel_options{});
    auto a = reg.get_or_create(dpp::snowflake{1});
    auto b = reg.get_or_create(dpp::snowflake{2});
    CHECK(a != b);
    CHECK(a->key() == dpp::snowflake{1});
    CHECK(b->key() == dpp::snowflake{2});
    CHECK(reg.size() == 2);
    CHECK(reg.find(dpp::snowflake{3}) == nullptr);
}

TEST_CASE("remove hands the state back once", "[registry]") {
    registry reg(channel_options{});
    auto created = reg.get_or_create(dpp::snowflake{5});

    auto removed = reg.remove(dpp::snowflake{5});
    CHECK(removed == created);
    CHECK(reg.remove(dpp::snowflake{5}) == nullptr);
    CHECK(reg.find(dpp::snowflake{5}) == nullptr);

    removed->stop();
}

TEST_CASE("create_with attaches the transport before publishing", "[registry]") {
    fake_transport transports;
    registry reg(channel_options{});

    auto state = reg.create_with(dpp::snowflake{9}, transports.connect(dpp::snowflake{90}));
    CHECK(state->has_transport());
    CHECK(reg.find(dpp::snowflake{9}) == state);

    auto second = transports.connect(dpp::snowflake{91});
    REQUIRE_THROWS_AS(reg.create_with(dpp::snowflake{9}, std::move(second)), aurora::voice::transport_error);
    CHECK(second != nullptr); // still ours to dispose of
}

TEST_CASE("drain empties the registry", "[registry]") {
    registry reg(channel_options{});
    reg.get_or_create(dpp::snowflake{1});
    reg.get_or_create(dpp::snowflake{2});

    auto all = reg.drain();
    CHECK(all.size() == 2);
    CHECK(reg.size() == 0);
    for (auto& s : all) {
        s->stop();
    }
}
