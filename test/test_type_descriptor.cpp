// test_type_descriptor.cpp - Tests for descriptors, inheritance and the type registry

#include <catch2/catch_all.hpp>
#include <objdiff/describe.h>
#include <objdiff/differ.h>
#include <objdiff/field_access.h>

#include "fixtures.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <typeindex>
#include <string>
#include <vector>

using namespace objdiff;
using namespace fixtures;

namespace {

std::vector<std::string> names_of(const std::vector<FieldDescriptor>& fields) {
    std::vector<std::string> names;
    for (const auto& f : fields) {
        names.push_back(f.name);
    }
    return names;
}

struct Unnamed {
    int x = 0;

    static void describe(TypeBuilder<Unnamed>& b) {
        b.comparable().field("x", &Unnamed::x);
    }
};

struct Point {
    int x = 0;

    static void describe(TypeBuilder<Point>& b) {
        b.name("Point").comparable().field("x", &Point::x);
    }
};

struct Twice {
    int x = 0;

    static void describe(TypeBuilder<Twice>& b) {
        b.comparable()
         .field("x", &Twice::x)
         .field("x", &Twice::x);
    }
};

} // namespace

TEST_CASE("Composite marker", "[descriptor][marker]") {
    REQUIRE(descriptor_of<Address>().is_composite());
    REQUIRE(descriptor_of<Entity>().is_composite());
    REQUIRE_FALSE(descriptor_of<Money>().is_composite());

    SECTION("inherited from a marked base") {
        REQUIRE(descriptor_of<Customer>().is_composite());
        REQUIRE(descriptor_of<Circle>().is_composite());
    }
}

TEST_CASE("Comparable fields", "[descriptor][fields]") {
    const auto& customer = descriptor_of<Customer>();

    SECTION("own fields first, then inherited, excluding unmarked ones") {
        REQUIRE(names_of(customer.comparable_fields()) == std::vector<std::string>{
            "name", "address", "tags", "scores", "billing", "owner_id", "active", "version"});
    }

    SECTION("declared fields keep the excluded ones") {
        const auto& declared = customer.declared_fields();
        auto notes = std::find_if(declared.begin(), declared.end(),
                                  [](const FieldDescriptor& f) { return f.name == "notes"; });
        REQUIRE(notes != declared.end());
        REQUIRE_FALSE(notes->included);
        REQUIRE(customer.find_field("notes") == nullptr);
    }

    SECTION("resolver keys") {
        REQUIRE(resolver_key_for(*customer.find_field("owner_id")) == std::optional<std::string>{"user_id"});
        REQUIRE_FALSE(resolver_key_for(*customer.find_field("name")).has_value());
    }

    SECTION("boolean detection") {
        REQUIRE(customer.find_field("active")->is_boolean);
        REQUIRE_FALSE(customer.find_field("name")->is_boolean);
    }

    SECTION("a derived field shadows an inherited one of the same name") {
        const auto& labelled = descriptor_of<Labelled>();
        REQUIRE(names_of(labelled.comparable_fields()) == std::vector<std::string>{"label"});

        Labelled l;
        l.label = "base";
        l.label_override = "derived";
        auto v = read_field(labelled, *labelled.find_field("label"), &l);
        REQUIRE(*v.get_if<std::string>() == "derived");
    }

    SECTION("inherited fields read through a derived pointer") {
        Customer c = make_customer();
        auto v = read_field(customer, *customer.find_field("version"), &c);
        REQUIRE(*v.get_if<int32_t>() == 3);
    }
}

TEST_CASE("descriptor_of finalizes a minimal type", "[descriptor][build]") {
    const auto& point = descriptor_of<Point>();
    REQUIRE(point.is_composite());
    REQUIRE(names_of(point.comparable_fields()) == std::vector<std::string>{"x"});
    REQUIRE(&descriptor_of<Point>() == &point);

    Point before{1};
    Point after{2};
    REQUIRE(Differ{}.diff("p", before, after) == DiffResult{{"p.x", "1"}});
}

TEST_CASE("Descriptor names", "[descriptor][name]") {
    REQUIRE(descriptor_of<Address>().name() == "Address");
    REQUIRE_THAT(descriptor_of<Unnamed>().name(), Catch::Matchers::ContainsSubstring("Unnamed"));
}

TEST_CASE("Duplicate field names are rejected", "[descriptor][error]") {
    REQUIRE_THROWS_AS(descriptor_of<Twice>(), std::invalid_argument);
}

TEST_CASE("Default to_string names the type", "[descriptor][display]") {
    Address a{"1 Main St", "Springfield", 1};
    REQUIRE_THAT(descriptor_of<Address>().to_string(&a), Catch::Matchers::StartsWith("Address@0x"));
    REQUIRE(to_display_string(to_value(Money{99, "EUR"})) == "0.99 EUR");
}

TEST_CASE("TypeRegistry", "[descriptor][registry]") {
    auto& registry = TypeRegistry::instance();

    const auto* address = &descriptor_of<Address>();
    REQUIRE(registry.find(std::type_index(typeid(Address))) == address);

    register_type<Square>();
    const auto* square = registry.find(std::type_index(typeid(Square)));
    REQUIRE(square != nullptr);
    REQUIRE(square->name() == "Square");
    REQUIRE(registry.size() >= 2);
}
