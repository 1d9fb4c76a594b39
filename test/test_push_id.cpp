// test_push_id.cpp - Tests for PushIdGenerator
// Module 2: chronologically ordered child keys

#include <catch2/catch_all.hpp>
#include <sync_tree/push_id.h>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace sync_tree;

TEST_CASE("PushIdGenerator format", "[push_id][format]") {
    PushIdGenerator gen;
    auto id = gen.next();

    REQUIRE(id.size() == push_id_length);
    for (char c : id) {
        REQUIRE(push_id_alphabet.find(c) != std::string_view::npos);
    }
}

TEST_CASE("PushIdGenerator alphabet is in ASCII order", "[push_id][format]") {
    REQUIRE(std::is_sorted(push_id_alphabet.begin(), push_id_alphabet.end()));
    REQUIRE(push_id_alphabet.size() == 64);
}

TEST_CASE("PushIdGenerator timestamp prefix", "[push_id][timestamp]") {
    std::int64_t now = 1'700'000'000'000;
    PushIdGenerator gen([&] { return now; });

    auto id = gen.next();
    REQUIRE(push_id_timestamp(id) == now);

    SECTION("later time sorts later") {
        now += 1;
        auto later = gen.next();
        REQUIRE(id < later);
        REQUIRE(push_id_timestamp(later) == now);
    }

    SECTION("malformed keys") {
        REQUIRE_FALSE(push_id_timestamp("short").has_value());
        REQUIRE_FALSE(push_id_timestamp("!!!!!!!!000000000000").has_value());
    }
}

TEST_CASE("PushIdGenerator is monotonic", "[push_id][order]") {
    SECTION("frozen clock") {
        PushIdGenerator gen([] { return std::int64_t{1'000}; });

        std::string previous = gen.next();
        for (int i = 0; i < 1000; ++i) {
            auto id = gen.next();
            REQUIRE(previous < id);
            previous = id;
        }
    }

    SECTION("clock going backwards") {
        std::int64_t now = 5'000;
        PushIdGenerator gen([&] { return now; });

        auto a = gen.next();
        now = 4'000;
        auto b = gen.next();
        REQUIRE(a < b);
        REQUIRE(push_id_timestamp(b) == 5'000);
    }

    SECTION("real clock") {
        PushIdGenerator gen;
        std::string previous = gen.next();
        for (int i = 0; i < 1000; ++i) {
            auto id = gen.next();
            REQUIRE(previous < id);
            previous = id;
        }
    }
}

TEST_CASE("PushIdGenerator across threads", "[push_id][thread]") {
    PushIdGenerator gen;
    std::mutex mutex;
    std::vector<std::string> all;
    bool each_sorted = true;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            std::vector<std::string> local;
            for (int i = 0; i < 250; ++i) {
                local.push_back(gen.next());
            }
            std::lock_guard<std::mutex> lock(mutex);
            each_sorted = each_sorted && std::is_sorted(local.begin(), local.end());
            all.insert(all.end(), local.begin(), local.end());
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(each_sorted);
    REQUIRE(all.size() == 1000);

    std::set<std::string> unique(all.begin(), all.end());
    REQUIRE(unique.size() == all.size());
}
