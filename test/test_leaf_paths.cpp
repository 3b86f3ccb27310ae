// test_leaf_paths.cpp - Tests for Differ::resolve_leaf_paths

#include <catch2/catch_all.hpp>
#include <objdiff/differ.h>

#include "fixtures.h"

#include <memory>
#include <string>

using namespace objdiff;
using namespace fixtures;

TEST_CASE("resolve_leaf_paths on plain values", "[leaf]") {
    Differ differ;

    SECTION("null is a single empty leaf") {
        REQUIRE(differ.resolve_leaf_paths("p", Value{}) == DiffResult{{"p", ""}});
    }

    SECTION("scalar is a single leaf") {
        REQUIRE(differ.resolve_leaf_paths("p", Value{5}) == DiffResult{{"p", "5"}});
    }

    SECTION("sequences list positions without a count") {
        REQUIRE(differ.resolve_leaf_paths("p", Value::vector({"a", "b"})) ==
                DiffResult{{"p.idx1", "a"}, {"p.idx2", "b"}});
    }

    SECTION("empty containers have no leaves") {
        REQUIRE(differ.resolve_leaf_paths("p", Value::vector({})).empty());
        REQUIRE(differ.resolve_leaf_paths("p", Value::map({})).empty());
    }

    SECTION("maps list every key") {
        REQUIRE(differ.resolve_leaf_paths("p", Value::map({{"a", 1}, {"b", Value{}}})) ==
                DiffResult{{"p.a", "1"}, {"p.b", ""}});
    }
}

TEST_CASE("resolve_leaf_paths on described objects", "[leaf][object]") {
    Differ differ;
    Customer c = make_customer();

    SECTION("every compared leaf, including inherited and private ones") {
        REQUIRE(differ.resolve_leaf_paths("customer", c) == DiffResult{
            {"customer.active", "true"},
            {"customer.address.city", "Springfield"},
            {"customer.address.street", "1 Main St"},
            {"customer.address.zip", "12345"},
            {"customer.billing", ""},
            {"customer.name", "Alice"},
            {"customer.owner_id", "1"},
            {"customer.scores.q1", "10"},
            {"customer.scores.q2", "20"},
            {"customer.tags.idx1", "gold"},
            {"customer.tags.idx2", "early"},
            {"customer.version", "3"},
        });
    }

    SECTION("resolvers are applied") {
        differ.register_resolver("user_id", make_resolver<int>([](int id) {
            return "user-" + std::to_string(id);
        }));
        auto leaves = differ.resolve_leaf_paths("customer", c);
        REQUIRE(leaves.at("customer.owner_id") == "user-1");
    }

    SECTION("empty root") {
        auto leaves = differ.resolve_leaf_paths("", c);
        REQUIRE(leaves.at("name") == "Alice");
        REQUIRE(leaves.at("address.city") == "Springfield");
    }

    SECTION("unreadable fields are skipped") {
        Gauge g;
        g.fragile = -1;
        auto leaves = differ.resolve_leaf_paths("gauge", g);
        REQUIRE(leaves.count("gauge.fragile") == 0);
        REQUIRE(leaves.count("gauge.secret") == 0);
        REQUIRE(leaves.at("gauge.enabled") == "true");
        REQUIRE(leaves.at("gauge.muted") == "via get_muted");
        REQUIRE(leaves.at("gauge.calibration") == "1");
    }

    SECTION("scalar objects are single leaves") {
        REQUIRE(differ.resolve_leaf_paths("price", Money{705, "USD"}) == DiffResult{{"price", "7.05 USD"}});
    }
}

TEST_CASE("resolve_leaf_paths depth limit", "[leaf][depth]") {
    auto n = std::make_shared<Node>();
    n->next = n;

    Differ differ{DiffOptions{.max_depth = 8}};
    REQUIRE_THROWS_AS(differ.resolve_leaf_paths("node", to_value(n)), DepthLimitError);
    n->next.reset();
}
