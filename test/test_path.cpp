// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// test_path.cpp - Tests for Path validation and tree access

#include <catch2/catch_all.hpp>
#include <statecast/builders.h>
#include <statecast/path.h>

#include <string>
#include <vector>

using namespace statecast;

// ============================================================
// Path construction
// ============================================================

TEST_CASE("Path construction", "[path]") {
    SECTION("mixed keys and indices") {
        Path p{"inventory", "items", 0};
        REQUIRE(p.size() == 3);
        REQUIRE(std::get<std::string>(p[0]) == "inventory");
        REQUIRE(std::get<std::size_t>(p.back()) == 0);
    }

    SECTION("empty path is rejected") {
        REQUIRE_THROWS_AS(Path(std::vector<PathElement>{}), std::invalid_argument);
    }

    SECTION("empty key is rejected") {
        REQUIRE_THROWS_AS((Path{"a", ""}), std::invalid_argument);
        REQUIRE_THROWS_AS(Path(std::vector<PathElement>{std::string{}}), std::invalid_argument);
    }

    SECTION("negative index is rejected") {
        REQUIRE_THROWS_AS((Path{"items", -1}), std::invalid_argument);
    }

    SECTION("child appends without modifying the parent") {
        Path parent{"players"};
        auto child = parent.child("alice");
        REQUIRE(parent.size() == 1);
        REQUIRE(child == Path{"players", "alice"});
    }
}

TEST_CASE("Path formatting and comparison", "[path]") {
    REQUIRE(Path{"users", 0, "name"}.to_string() == ".users[0].name");

    SECTION("starts_with") {
        Path p{"a", "b", 1};
        REQUIRE(p.starts_with(Path{"a"}));
        REQUIRE(p.starts_with(Path{"a", "b", 1}));
        REQUIRE_FALSE(p.starts_with(Path{"b"}));
        REQUIRE_FALSE(Path{"a"}.starts_with(p));
    }

    SECTION("string key and index never compare equal") {
        REQUIRE_FALSE(Path{"0"} == Path{0});
    }
}

TEST_CASE("Path value encoding", "[path]") {
    Path p{"items", 2, "name"};

    SECTION("round trip") {
        REQUIRE(Path::from_value(p.to_value()) == p);
    }

    SECTION("integral doubles are accepted") {
        auto encoded = VectorBuilder().push_back("items").push_back(2.0).finish();
        REQUIRE(Path::from_value(encoded) == Path{"items", 2});
    }

    SECTION("invalid shapes are rejected") {
        REQUIRE_THROWS_AS(Path::from_value(Value{"items"}), std::invalid_argument);
        REQUIRE_THROWS_AS(Path::from_value(Value::vector({})), std::invalid_argument);
        REQUIRE_THROWS_AS(Path::from_value(Value::vector({1.5})), std::invalid_argument);
        REQUIRE_THROWS_AS(Path::from_value(Value::vector({-1})), std::invalid_argument);
        REQUIRE_THROWS_AS(Path::from_value(Value::vector({true})), std::invalid_argument);
    }
}

// ============================================================
// get / set / erase
// ============================================================

TEST_CASE("get_at_path", "[path][access]") {
    auto tree = MapBuilder()
                    .set("gold", 10)
                    .set("items", VectorBuilder().push_back("a").push_back("b").finish())
                    .finish();

    REQUIRE(get_at_path(tree, {"gold"}) == Value{10});
    REQUIRE(get_at_path(tree, {"items", 1}) == Value{"b"});

    SECTION("missing or mistyped paths are absent") {
        REQUIRE_FALSE(get_at_path(tree, {"silver"}).has_value());
        REQUIRE_FALSE(get_at_path(tree, {"items", 5}).has_value());
        REQUIRE_FALSE(get_at_path(tree, {"gold", "x"}).has_value());
        REQUIRE_FALSE(get_at_path(tree, {"items", "x"}).has_value());
    }
}

TEST_CASE("set_at_path", "[path][access]") {
    Value tree = Value::map({});

    SECTION("set then get returns the value") {
        for (const Path& p : {Path{"a"}, Path{"a", "b", "c"}, Path{"list", 2}, Path{"m", 0, "x"}}) {
            Value v{"value"};
            REQUIRE(set_at_path(tree, p, v));
            REQUIRE(get_at_path(tree, p) == v);
        }
    }

    SECTION("intermediates follow the next key") {
        REQUIRE(set_at_path(tree, {"list", 1, "name"}, Value{"x"}));
        REQUIRE(tree.at("list").is_vector());
        REQUIRE(tree.at("list").size() == 2);
        REQUIRE(tree.at("list").at(0).is_null());
        REQUIRE(tree.at("list").at(1).is_map());
    }

    SECTION("non-container intermediate is replaced") {
        REQUIRE(set_at_path(tree, {"gold"}, Value{5}));
        REQUIRE(set_at_path(tree, {"gold", "amount"}, Value{6}));
        REQUIRE(get_at_path(tree, {"gold", "amount"}) == Value{6});
    }

    SECTION("key kind mismatch is a no-op") {
        REQUIRE(set_at_path(tree, {"items", 0}, Value{"a"}));
        const auto before = tree;
        REQUIRE_FALSE(set_at_path(tree, {"items", "name"}, Value{"x"}));
        REQUIRE(tree == before);
    }

    SECTION("non-container root is a no-op") {
        Value scalar{3};
        REQUIRE_FALSE(set_at_path(scalar, {"a"}, Value{1}));
        REQUIRE(scalar == Value{3});
    }

    SECTION("the previous tree is untouched") {
        REQUIRE(set_at_path(tree, {"a"}, Value{1}));
        const auto before = tree;
        REQUIRE(set_at_path(tree, {"a"}, Value{2}));
        REQUIRE(before.at("a").as_int() == 1);
    }
}

TEST_CASE("erase_at_path", "[path][access]") {
    Value tree = MapBuilder()
                     .set("a", MapBuilder().set("b", 1).set("c", 2).finish())
                     .set("items", VectorBuilder().push_back("x").push_back("y").push_back("z").finish())
                     .finish();

    SECTION("map key") {
        REQUIRE(erase_at_path(tree, {"a", "b"}));
        REQUIRE_FALSE(get_at_path(tree, {"a", "b"}).has_value());
        REQUIRE(get_at_path(tree, {"a", "c"}) == Value{2});
    }

    SECTION("vector element shifts the tail") {
        REQUIRE(erase_at_path(tree, {"items", 0}));
        REQUIRE(tree.at("items") == Value::vector({"y", "z"}));
    }

    SECTION("absent paths report false") {
        REQUIRE_FALSE(erase_at_path(tree, {"missing"}));
        REQUIRE_FALSE(erase_at_path(tree, {"items", 10}));
        REQUIRE_FALSE(erase_at_path(tree, {"a", "b", "c"}));
    }
}

TEST_CASE("vector helpers", "[path][vector]") {
    auto vec = Value::vector({"a", "b"}).as_vector();

    SECTION("insert at the front") {
        REQUIRE(Value{vector_insert(vec, 0, Value{"sword"})} == Value::vector({"sword", "a", "b"}));
    }

    SECTION("insert past the end appends") {
        REQUIRE(Value{vector_insert(vec, 9, Value{"c"})} == Value::vector({"a", "b", "c"}));
    }

    SECTION("erase") {
        REQUIRE(Value{vector_erase(vec, 1)} == Value::vector({"a"}));
    }
}
