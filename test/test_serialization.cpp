// test_serialization.cpp - Tests for JSON encode/decode and payload parsing

#include <catch2/catch_all.hpp>
#include <sync_tree/serialization.h>

#include <cstddef>
#include <string>

using namespace sync_tree;

// ============================================================
// from_json
// ============================================================

TEST_CASE("from_json scalars", "[json][decode]") {
    std::string error;

    REQUIRE(from_json("true", &error).as_bool());
    REQUIRE(from_json("42", &error).as_int() == 42);
    REQUIRE(from_json("42", &error).is<int64_t>());
    REQUIRE(from_json("-1.25", &error).as_number() == -1.25);
    REQUIRE(from_json("1e3", &error).is<double>());
    REQUIRE(from_json("\"a\\nb\"", &error).as_string() == "a\nb");
    REQUIRE(from_json("null", &error).is_null());
    REQUIRE(error.empty());
}

TEST_CASE("from_json objects", "[json][decode]") {
    std::string error;
    auto v = from_json(R"({"x": 1, "nested": {"y": "z"}})", &error);

    REQUIRE(error.empty());
    REQUIRE(v.is_map());
    REQUIRE(v.at("x").as_int() == 1);
    REQUIRE(v.at("nested").at("y").as_string() == "z");
}

TEST_CASE("from_json arrays become keyed maps", "[json][decode][array]") {
    std::string error;
    auto v = from_json(R"(["a", "b", "c"])", &error);

    REQUIRE(error.empty());
    REQUIRE(v.is_map());
    REQUIRE(v.size() == 3);
    REQUIRE(v.at("0").as_string() == "a");
    REQUIRE(v.at("2").as_string() == "c");

    REQUIRE(from_json("[]", &error).is_map());
}

TEST_CASE("from_json priority metadata", "[json][decode][priority]") {
    std::string error;

    SECTION(".priority on an object") {
        auto v = from_json(R"({"x": 1, ".priority": "p"})", &error);
        REQUIRE(error.empty());
        REQUIRE(v.size() == 1);
        REQUIRE_FALSE(v.contains(".priority"));
        REQUIRE(v.priority == Priority{std::string("p")});
    }

    SECTION(".value with .priority") {
        auto v = from_json(R"({".value": 5, ".priority": 1})", &error);
        REQUIRE(error.empty());
        REQUIRE(v.as_int() == 5);
        REQUIRE(v.priority == Priority{1.0});
    }

    SECTION(".value combined with children is an error") {
        auto v = from_json(R"({".value": 5, "x": 1})", &error);
        REQUIRE_FALSE(error.empty());
        REQUIRE(v.is_null());
    }

    SECTION("invalid .priority type") {
        (void)from_json(R"({".priority": true})", &error);
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("from_json errors", "[json][decode][error]") {
    std::string error;

    SECTION("unterminated object") {
        (void)from_json(R"({"x": 1)", &error);
        REQUIRE_FALSE(error.empty());
    }

    SECTION("trailing garbage") {
        (void)from_json(R"({"x": 1} extra)", &error);
        REQUIRE_FALSE(error.empty());
    }

    SECTION("empty input") {
        (void)from_json("   ", &error);
        REQUIRE(error == "Empty JSON input");
    }

    SECTION("error is cleared on success") {
        error = "stale";
        (void)from_json("1", &error);
        REQUIRE(error.empty());
    }
}

TEST_CASE("from_json nesting limit", "[json][decode][error]") {
    std::string error;

    auto nested = [](std::size_t depth) {
        std::string text;
        for (std::size_t i = 0; i < depth; ++i) text += R"({"a":)";
        text += "1";
        text.append(depth, '}');
        return text;
    };

    SECTION("at the limit") {
        auto v = from_json(nested(max_json_depth), &error);
        REQUIRE(error.empty());
        REQUIRE(v.is_map());
    }

    SECTION("one past the limit") {
        auto v = from_json(nested(max_json_depth + 1), &error);
        REQUIRE(v.is_null());
        REQUIRE(error.find("too deep") != std::string::npos);
    }

    SECTION("hostile depth fails cleanly") {
        std::string arrays(100000, '[');
        auto v = from_json(arrays, &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());

        auto payload = parse_payload(nested(100000), &error);
        REQUIRE_FALSE(payload.has_value());
    }
}

TEST_CASE("from_json unicode escapes", "[json][decode][unicode]") {
    std::string error;

    SECTION("surrogate pair") {
        auto v = from_json(R"("\ud83d\ude00")", &error);
        REQUIRE(error.empty());
        REQUIRE(v.as_string() == "\xF0\x9F\x98\x80");
    }

    SECTION("basic plane") {
        REQUIRE(from_json(R"("\u00e9")", &error).as_string() == "\xC3\xA9");
    }

    SECTION("high surrogate followed by a non-surrogate") {
        (void)from_json(R"("\ud83d\u0041")", &error);
        REQUIRE(error.find("surrogate") != std::string::npos);
    }

    SECTION("unpaired high surrogate") {
        (void)from_json(R"("\ud83dx")", &error);
        REQUIRE(error.find("surrogate") != std::string::npos);
    }

    SECTION("unpaired low surrogate") {
        (void)from_json(R"("\ude00")", &error);
        REQUIRE(error.find("surrogate") != std::string::npos);
    }
}

// ============================================================
// to_json
// ============================================================

TEST_CASE("to_json output", "[json][encode]") {
    SECTION("keys are sorted") {
        auto v = Value::map({{"b", 2}, {"a", 1}});
        REQUIRE(to_json(v) == R"({"a":1,"b":2})");
    }

    SECTION("empty map") {
        REQUIRE(to_json(Value::map()) == "{}");
    }

    SECTION("escaping") {
        REQUIRE(to_json(Value{"q\"\\"}) == R"("q\"\\")");
    }

    SECTION("prioritised map") {
        auto v = Value::map({{"x", 1}}).with_priority(2.0);
        REQUIRE(to_json(v) == R"({".priority":2,"x":1})");
    }

    SECTION("prioritised scalar") {
        auto v = Value{"hi"}.with_priority("p");
        REQUIRE(to_json(v) == R"({".priority":"p",".value":"hi"})");
    }

    SECTION("pretty print") {
        auto v = Value::map({{"a", 1}});
        REQUIRE(to_json(v, false) == "{\n  \"a\": 1\n}");
    }

    SECTION("decode accepts what encode writes") {
        auto v = Value::map({{"x", Value{1}.with_priority("k")}, {"y", Value::map()}}).with_priority(4.0);
        std::string error;
        auto back = from_json(to_json(v), &error);
        REQUIRE(error.empty());
        REQUIRE(identical(back, v));
    }
}

// ============================================================
// prune_nulls
// ============================================================

TEST_CASE("prune_nulls", "[json][prune]") {
    std::string error;
    auto v = from_json(R"({"a": 1, "b": null, "c": {"d": null}})", &error);
    auto pruned = prune_nulls(v);

    REQUIRE(pruned.size() == 2);
    REQUIRE_FALSE(pruned.contains("b"));
    REQUIRE(pruned.at("c").is_map());
    REQUIRE(pruned.at("c").size() == 0);
}

// ============================================================
// Payloads and priorities
// ============================================================

TEST_CASE("parse_payload", "[json][payload]") {
    std::string error;

    SECTION("object text is JSON") {
        auto v = parse_payload("  {\"x\":1}", &error);
        REQUIRE(v.has_value());
        REQUIRE(v->at("x").as_int() == 1);
    }

    SECTION("anything else is a raw string") {
        auto v = parse_payload("42", &error);
        REQUIRE(v.has_value());
        REQUIRE(v->as_string() == "42");

        auto quoted = parse_payload("\"hello\"", &error);
        REQUIRE(quoted->as_string() == "\"hello\"");
    }

    SECTION("raw text is kept untrimmed") {
        REQUIRE(parse_payload(" hi ", &error)->as_string() == " hi ");
    }

    SECTION("malformed object") {
        auto v = parse_payload("{not json", &error);
        REQUIRE_FALSE(v.has_value());
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("priority text", "[json][priority]") {
    REQUIRE(priority_to_json(Priority{}) == "null");
    REQUIRE(priority_to_json(Priority{1.5}) == "1.5");
    REQUIRE(priority_to_json(Priority{std::string("a")}) == "\"a\"");

    REQUIRE(parse_priority("null") == Priority{});
    REQUIRE(parse_priority("") == Priority{});
    REQUIRE(parse_priority("3") == Priority{3.0});
    REQUIRE(parse_priority("\"a b\"") == Priority{std::string("a b")});
    REQUIRE(parse_priority("plain") == Priority{std::string("plain")});
}
