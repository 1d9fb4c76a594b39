// test_query.cpp - Tests for DataSnapshot and Query views

#include <catch2/catch_all.hpp>
#include <sync_tree/query.h>
#include <sync_tree/serialization.h>
#include <sync_tree/snapshot.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace sync_tree;

namespace {

DataSnapshot scores_snapshot()
{
    std::string error;
    Value v = from_json(R"({
        "alice": {"score": 30, ".priority": 3},
        "bob":   {"score": 10, ".priority": 1},
        "carol": {"score": 20},
        "dave":  {"score": "n/a", ".priority": "x"}
    })", &error);
    REQUIRE(error.empty());
    return DataSnapshot{Path{"scores"}, v};
}

std::vector<std::string> keys_of(const std::vector<DataSnapshot>& snaps)
{
    std::vector<std::string> keys;
    for (const auto& s : snaps) keys.push_back(s.key());
    return keys;
}

} // namespace

// ============================================================
// DataSnapshot
// ============================================================

TEST_CASE("DataSnapshot basics", "[snapshot]") {
    auto snap = scores_snapshot();

    REQUIRE(snap.exists());
    REQUIRE(snap.key() == "scores");
    REQUIRE(snap.num_children() == 4);
    REQUIRE(snap.has_children());
    REQUIRE(snap.has_child("alice/score"));
    REQUIRE_FALSE(snap.has_child("zed"));

    SECTION("child") {
        auto score = snap.child("alice/score");
        REQUIRE(score.exists());
        REQUIRE(score.path() == Path{"scores", "alice", "score"});
        REQUIRE(score.value().as_int() == 30);
    }

    SECTION("missing child") {
        auto missing = snap.child("zed");
        REQUIRE_FALSE(missing.exists());
        REQUIRE(missing.value().is_null());
        REQUIRE(missing.to_json() == "null");
    }

    SECTION("children in priority order") {
        REQUIRE(keys_of(snap.children()) == std::vector<std::string>{"carol", "bob", "alice", "dave"});
    }

    SECTION("priority") {
        REQUIRE(snap.child("bob").priority() == Priority{1.0});
    }
}

TEST_CASE("DataSnapshot absent", "[snapshot]") {
    DataSnapshot snap{Path{"nothing"}};
    REQUIRE_FALSE(snap.exists());
    REQUIRE(snap.num_children() == 0);
    REQUIRE(snap.children().empty());
    REQUIRE_FALSE(snap.child("x").exists());
}

// ============================================================
// Query
// ============================================================

TEST_CASE("Query ordering", "[query][order]") {
    auto snap = scores_snapshot();

    SECTION("default is priority order") {
        REQUIRE(keys_of(Query{}.apply(snap)) == std::vector<std::string>{"carol", "bob", "alice", "dave"});
    }

    SECTION("by key") {
        REQUIRE(keys_of(Query{}.order_by_key().apply(snap)) ==
                std::vector<std::string>{"alice", "bob", "carol", "dave"});
    }

    SECTION("by child value") {
        REQUIRE(keys_of(Query{}.order_by_child("score").apply(snap)) ==
                std::vector<std::string>{"bob", "carol", "alice", "dave"});
    }
}

TEST_CASE("Query limits", "[query][limit]") {
    auto snap = scores_snapshot();

    SECTION("limit to first") {
        REQUIRE(keys_of(Query{}.order_by_key().limit_to_first(2).apply(snap)) ==
                std::vector<std::string>{"alice", "bob"});
    }

    SECTION("limit to last takes the trailing elements of the ordering") {
        REQUIRE(keys_of(Query{}.order_by_key().limit_to_last(2).apply(snap)) ==
                std::vector<std::string>{"carol", "dave"});
        REQUIRE(keys_of(Query{}.limit_to_last(2).apply(snap)) ==
                std::vector<std::string>{"alice", "dave"});
    }

    SECTION("limit larger than the child count") {
        REQUIRE(Query{}.limit_to_last(10).apply(snap).size() == 4);
    }

    SECTION("zero is rejected") {
        REQUIRE_THROWS_AS(Query{}.limit_to_first(0), std::invalid_argument);
        REQUIRE_THROWS_AS(Query{}.limit_to_last(0), std::invalid_argument);
    }

    SECTION("first and last cannot be combined") {
        Query q;
        q.limit_to_first(1);
        REQUIRE_THROWS_AS(q.limit_to_last(1), std::invalid_argument);
    }
}

TEST_CASE("Query on scalars and absent snapshots", "[query]") {
    REQUIRE(Query{}.apply(DataSnapshot{Path{"x"}, Value{1}}).empty());
    REQUIRE(Query{}.apply(DataSnapshot{Path{"x"}}).empty());
}

TEST_CASE("Query parse", "[query][parse]") {
    SECTION("supported parameters") {
        auto q = Query::parse(R"(orderBy="$key"&limitToLast=2)");
        REQUIRE(q.order() == Query::Order::Key);
        REQUIRE(q.limit_kind() == Query::Limit::Last);
        REQUIRE(q.limit() == 2);
    }

    SECTION("priority and child") {
        REQUIRE(Query::parse(R"(orderBy="$priority")").order() == Query::Order::Priority);
        auto q = Query::parse(R"(orderBy="score")");
        REQUIRE(q.order() == Query::Order::Child);
        REQUIRE(q.order_child() == "score");
    }

    SECTION("unsupported filters fail loudly") {
        REQUIRE_THROWS_AS(Query::parse(R"(orderBy="$value")"), unsupported_query);
        REQUIRE_THROWS_AS(Query::parse("startAt=3"), unsupported_query);
        REQUIRE_THROWS_AS(Query::parse("endAt=3"), unsupported_query);
        REQUIRE_THROWS_AS(Query::parse("equalTo=3"), unsupported_query);
        REQUIRE_THROWS_AS(Query::parse("shallow=true"), unsupported_query);
    }

    SECTION("bad limit") {
        REQUIRE_THROWS_AS(Query::parse("limitToFirst=abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(Query::parse("limitToFirst=0"), std::invalid_argument);
    }
}

TEST_CASE("compare_values", "[query][compare]") {
    REQUIRE(compare_values(Value{}, Value{false}) < 0);
    REQUIRE(compare_values(Value{false}, Value{true}) < 0);
    REQUIRE(compare_values(Value{true}, Value{-100}) < 0);
    REQUIRE(compare_values(Value{1}, Value{1.5}) < 0);
    REQUIRE(compare_values(Value{99}, Value{"a"}) < 0);
    REQUIRE(compare_values(Value{"z"}, Value::map()) < 0);
    REQUIRE(compare_values(Value{2}, Value{2.0}) == 0);
}
