// test_path.cpp - Tests for Path formatting

#include <catch2/catch_all.hpp>
#include <objdiff/path.h>

using namespace objdiff;

TEST_CASE("Path formatting", "[path]") {
    SECTION("root with field, index and count") {
        Path p{"order"};
        p.push_back("lines");
        p.push_back(Index{2});
        REQUIRE(p.to_string() == "order.lines.idx2");
        p.pop_back();
        p.push_back(Count{});
        REQUIRE(p.to_string() == "order.lines.count");
    }

    SECTION("empty root has no leading dot") {
        Path p{""};
        p.push_back("lines");
        REQUIRE(p.to_string() == "lines");
    }

    SECTION("root alone") {
        REQUIRE(Path{"order"}.to_string() == "order");
        REQUIRE(Path{}.to_string().empty());
    }

    SECTION("empty segments do not produce separators while text is empty") {
        Path p{""};
        p.push_back("");
        p.push_back("a");
        REQUIRE(p.to_string() == "a");
    }

    SECTION("keys may contain dots") {
        Path p{"cfg"};
        p.push_back("db.host");
        REQUIRE(p.to_string() == "cfg.db.host");
    }
}

TEST_CASE("Path push and pop", "[path]") {
    Path p{"root"};
    REQUIRE(p.empty());
    p.push_back("a");
    p.push_back(Index{1});
    REQUIRE(p.depth() == 2);
    REQUIRE(p.elements().back() == PathElement{Index{1}});
    p.pop_back();
    p.pop_back();
    REQUIRE(p.empty());
    REQUIRE(p.root() == "root");
}

TEST_CASE("element_to_string", "[path][element]") {
    REQUIRE(element_to_string(PathElement{std::string("name")}) == "name");
    REQUIRE(element_to_string(PathElement{Index{10}}) == "idx10");
    REQUIRE(element_to_string(PathElement{Count{}}) == "count");
}
