// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// test_value.cpp - Tests for Value, builders and serialization

#include <catch2/catch_all.hpp>
#include <statecast/builders.h>
#include <statecast/serialization.h>
#include <statecast/value.h>

#include <cmath>
#include <limits>
#include <string>

using namespace statecast;

// ============================================================
// Construction and access
// ============================================================

TEST_CASE("Value construction", "[value]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE_FALSE(v.is_container());
    }

    SECTION("scalars") {
        REQUIRE(Value{42}.is<int32_t>());
        REQUIRE(Value{int64_t{1} << 40}.is<int64_t>());
        REQUIRE(Value{1.5}.is<double>());
        REQUIRE(Value{true}.is<bool>());
        REQUIRE(Value{"text"}.is<std::string>());
    }

    SECTION("containers") {
        auto m = Value::map({{"gold", 10}, {"name", "alice"}});
        REQUIRE(m.is_map());
        REQUIRE(m.size() == 2);
        REQUIRE(m.at("gold").as_int() == 10);

        auto v = Value::vector({1, 2, 3});
        REQUIRE(v.is_vector());
        REQUIRE(v.size() == 3);
        REQUIRE(v.at(2).as_int() == 3);
    }
}

TEST_CASE("Value numeric conversions", "[value]") {
    SECTION("int32 widens to int64") {
        REQUIRE(Value{7}.as_int64() == 7);
        REQUIRE(Value{7}.is_integer());
    }

    SECTION("as_number accepts every numeric kind") {
        REQUIRE(Value{7}.as_number() == 7.0);
        REQUIRE(Value{int64_t{8}}.as_number() == 8.0);
        REQUIRE(Value{2.5}.as_number() == 2.5);
    }

    SECTION("wrong type returns the default") {
        REQUIRE(Value{"x"}.as_int(-1) == -1);
        REQUIRE(Value{}.as_string("none") == "none");
    }
}

TEST_CASE("Value persistent updates", "[value]") {
    auto original = Value::map({{"a", 1}});

    SECTION("set returns a new value and leaves the original") {
        auto updated = original.set("b", 2);
        REQUIRE(updated.size() == 2);
        REQUIRE(original.size() == 1);
    }

    SECTION("set_vivify turns null into a container") {
        REQUIRE(Value{}.set_vivify("k", 1).is_map());
        auto padded = Value{}.set_vivify(std::size_t{2}, Value{"x"});
        REQUIRE(padded.is_vector());
        REQUIRE(padded.size() == 3);
        REQUIRE(padded.at(0).is_null());
        REQUIRE(padded.at(2).as_string() == "x");
    }

    SECTION("contains") {
        REQUIRE(original.contains("a"));
        REQUIRE_FALSE(original.contains("z"));
        REQUIRE_FALSE(Value::vector({1}).contains(std::size_t{1}));
    }
}

TEST_CASE("Value equality is structural", "[value]") {
    auto a = Value::map({{"items", Value::vector({"sword", "shield"})}});
    auto b = Value::map({{"items", Value::vector({"sword", "shield"})}});
    auto c = Value::map({{"items", Value::vector({"sword"})}});

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(Value{1} == Value{int64_t{1}});
}

TEST_CASE("type_name", "[value]") {
    REQUIRE(type_name(Value{}) == "null");
    REQUIRE(type_name(Value{1}) == "int");
    REQUIRE(type_name(Value::map({})) == "map");
    REQUIRE(type_name(Value::vector({})) == "vector");
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("MapBuilder and VectorBuilder", "[value][builder]") {
    auto v = MapBuilder()
                 .set("gold", 0)
                 .set("name", "alice")
                 .set("items", VectorBuilder().push_back("sword").push_back("shield").finish())
                 .finish();

    REQUIRE(v.at("gold").as_int() == 0);
    REQUIRE(v.at("name").as_string() == "alice");
    REQUIRE(v.at("items").size() == 2);

    SECTION("erase and contains") {
        auto builder = MapBuilder();
        builder.set("a", 1).set("b", 2).erase("a");
        REQUIRE_FALSE(builder.contains("a"));
        REQUIRE(builder.size() == 1);
    }
}

// ============================================================
// Binary serialization
// ============================================================

TEST_CASE("Binary serialization", "[value][serialization]") {
    auto tree = MapBuilder()
                    .set("gold", 100)
                    .set("big", int64_t{1} << 40)
                    .set("ratio", 0.25)
                    .set("alive")
                    .set("nothing", Value{})
                    .set("items", VectorBuilder().push_back("sword").push_back(3).finish())
                    .finish();

    SECTION("round trip preserves the exact tree") {
        auto bytes = serialize(tree);
        REQUIRE(deserialize(bytes) == tree);
    }

    SECTION("trailing bytes are rejected") {
        auto bytes = serialize(tree);
        bytes.push_back(0);
        REQUIRE_THROWS_AS(deserialize(bytes), std::runtime_error);
    }

    SECTION("integers are little-endian on the wire") {
        REQUIRE(serialize(Value{0x01020304}) == ByteBuffer{0x01, 0x04, 0x03, 0x02, 0x01});
    }

    SECTION("a count larger than the buffer is rejected") {
        ByteBuffer bytes{0x07, 0xFF, 0xFF, 0xFF, 0x7F, 0x00};
        REQUIRE_THROWS_AS(deserialize(bytes), std::runtime_error);
    }

    SECTION("truncated input is rejected") {
        auto bytes = serialize(tree);
        bytes.resize(bytes.size() / 2);
        REQUIRE_THROWS_AS(deserialize(bytes), std::runtime_error);
    }
}

// ============================================================
// JSON
// ============================================================

TEST_CASE("JSON parsing", "[value][json]") {
    SECTION("integers pick the narrowest type") {
        auto v = from_json(R"({"small": 5, "large": 10000000000, "real": 1.5})");
        REQUIRE(v.at("small").is<int32_t>());
        REQUIRE(v.at("large").is<int64_t>());
        REQUIRE(v.at("large").as_int64() == 10000000000LL);
        REQUIRE(v.at("real").as_double() == 1.5);
    }

    SECTION("nested containers") {
        auto v = from_json(R"({"items": ["a", {"b": null}], "ok": true})");
        REQUIRE(v.at("items").size() == 2);
        REQUIRE(v.at("items").at(1).at("b").is_null());
        REQUIRE(v.at("ok").as_bool());
    }

    SECTION("malformed input reports an error") {
        std::string error;
        auto v = from_json("{\"a\": }", &error);
        REQUIRE_FALSE(error.empty());
        REQUIRE(v.is_null());
    }

    SECTION("escapes decode to UTF-8, including surrogate pairs") {
        auto v = from_json(R"(["a\n\u00e9", "\ud83d\ude00"])");
        REQUIRE(v.at(0) == Value{"a\n\xC3\xA9"});
        REQUIRE(v.at(1) == Value{"\xF0\x9F\x98\x80"});

        std::string error;
        (void)from_json(R"("\ud83d")", &error);
        REQUIRE_FALSE(error.empty());
    }

    SECTION("trailing characters are rejected") {
        std::string error;
        (void)from_json("[1, 2] x", &error);
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("JSON output", "[value][json]") {
    SECTION("compact output parses back to the same tree") {
        auto tree = MapBuilder().set("a", 1).set("b", VectorBuilder().push_back("x").finish()).finish();
        auto text = to_json(tree);
        REQUIRE(text.find('\n') == std::string::npos);
        REQUIRE(from_json(text) == tree);
    }

    SECTION("integral doubles stay doubles") {
        auto text = to_json(Value{2.0});
        REQUIRE(text == "2.0");
        REQUIRE(from_json(text).is<double>());
    }

    SECTION("NaN is written as null") {
        auto text = to_json(Value{std::numeric_limits<double>::quiet_NaN()});
        REQUIRE(text == "null");
    }
}
