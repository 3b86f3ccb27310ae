// fixtures.h - Described types shared by the test suites

#pragma once

#include <objdiff/describe.h>

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixtures {

using objdiff::Access;
using objdiff::TypeBuilder;

struct Address {
    std::string street;
    std::string city;
    int zip = 0;

    static void describe(TypeBuilder<Address>& b) {
        b.name("Address")
         .comparable()
         .field("street", &Address::street)
         .field("city", &Address::city)
         .field("zip", &Address::zip);
    }
};

struct Entity {
    virtual ~Entity() = default;

    long id = 0;
    int version = 1;

    static void describe(TypeBuilder<Entity>& b) {
        b.name("Entity")
         .comparable()
         .field("id", &Entity::id, {.compared = false})
         .field("version", &Entity::version);
    }
};

/// Composite through its Entity base; never calls comparable() itself
class Customer : public Entity {
public:
    std::string name;
    Address address;
    std::vector<std::string> tags;
    std::map<std::string, int> scores;
    std::shared_ptr<Address> billing;
    std::string notes;
    int owner_id = 0;

    static void describe(TypeBuilder<Customer>& b) {
        b.name("Customer")
         .base<Entity>()
         .field("name", &Customer::name)
         .field("address", &Customer::address)
         .field("tags", &Customer::tags)
         .field("scores", &Customer::scores)
         .field("billing", &Customer::billing)
         .field("notes", &Customer::notes, {.compared = false})
         .field("owner_id", &Customer::owner_id, {.resolver = "user_id"})
         .field("active", &Customer::active_, {.access = Access::Private})
         .accessor("is_active", &Customer::is_active);
    }

    [[nodiscard]] bool is_active() const { return active_; }
    void set_active(bool active) { active_ = active; }

private:
    bool active_ = true;
};

/// Exercises every branch of read_field()
class Gauge {
public:
    bool enabled = false;
    bool muted = false;
    int level = 0;
    int fragile = 0;

    static void describe(TypeBuilder<Gauge>& b) {
        b.name("Gauge")
         .comparable()
         .field("enabled", &Gauge::enabled)
         .field("muted", &Gauge::muted)
         .field("level", &Gauge::level)
         .field("fragile", &Gauge::fragile)
         .field("secret", &Gauge::secret_, {.access = Access::Private})
         .field("calibration", &Gauge::calibration_, {.access = Access::Private})
         .accessor("is_enabled", [](const Gauge& g) { return !g.enabled; })
         .accessor("get_muted", [](const Gauge&) { return std::string("via get_muted"); })
         .accessor("get_level", [](const Gauge& g) { return g.level * 10; })
         .accessor("get_fragile", &Gauge::get_fragile)
         .accessor("get_calibration", &Gauge::get_calibration);
    }

    [[nodiscard]] int get_fragile() const {
        if (fragile < 0) {
            throw std::runtime_error("sensor offline");
        }
        return fragile;
    }

    [[nodiscard]] double get_calibration() const { return calibration_; }

    void set_secret(int secret) { secret_ = secret; }
    void set_calibration(double calibration) { calibration_ = calibration; }

private:
    int secret_ = 0;
    double calibration_ = 1.0;
};

/// Accessor that throws a value not derived from std::exception
struct Relay {
    int x = 0;
    int y = 0;

    static void describe(TypeBuilder<Relay>& b) {
        b.name("Relay")
         .comparable()
         .field("x", &Relay::x)
         .field("y", &Relay::y)
         .accessor("get_y", [](const Relay& r) {
             if (r.y < 0) {
                 throw 42;
             }
             return r.y;
         });
    }
};

/// Unmarked described type: compared as a scalar
struct Money {
    long cents = 0;
    std::string currency = "EUR";

    bool operator==(const Money&) const = default;

    static void describe(TypeBuilder<Money>& b) {
        b.name("Money")
         .equality()
         .to_string([](const Money& m) {
             std::ostringstream oss;
             oss << m.cents / 100 << "." << (m.cents % 100 < 10 ? "0" : "") << m.cents % 100
                 << " " << m.currency;
             return oss.str();
         });
    }
};

struct Invoice {
    std::string number;
    Money total;
    std::optional<std::string> memo;
    std::vector<Money> payments;

    static void describe(TypeBuilder<Invoice>& b) {
        b.name("Invoice")
         .comparable()
         .field("number", &Invoice::number)
         .field("total", &Invoice::total)
         .field("memo", &Invoice::memo)
         .field("payments", &Invoice::payments);
    }
};

// ============================================================
// Polymorphic hierarchy
// ============================================================

struct Shape {
    virtual ~Shape() = default;
    std::string label;

    static void describe(TypeBuilder<Shape>& b) {
        b.name("Shape")
         .comparable()
         .field("label", &Shape::label);
    }
};

struct Circle : Shape {
    double radius = 0.0;

    static void describe(TypeBuilder<Circle>& b) {
        b.name("Circle")
         .base<Shape>()
         .field("radius", &Circle::radius);
    }
};

struct Square : Shape {
    double side = 0.0;

    static void describe(TypeBuilder<Square>& b) {
        b.name("Square")
         .base<Shape>()
         .field("side", &Square::side);
    }
};

struct Drawing {
    std::vector<std::shared_ptr<Shape>> shapes;

    static void describe(TypeBuilder<Drawing>& b) {
        b.name("Drawing")
         .comparable()
         .field("shapes", &Drawing::shapes);
    }
};

/// Singly linked node; a node pointing to itself forms a cycle
struct Node {
    int value = 0;
    std::shared_ptr<Node> next;

    static void describe(TypeBuilder<Node>& b) {
        b.name("Node")
         .comparable()
         .field("value", &Node::value)
         .field("next", &Node::next);
    }
};

/// Derived field hiding an inherited one of the same name
struct Labelled : Shape {
    std::string label_override;

    static void describe(TypeBuilder<Labelled>& b) {
        b.name("Labelled")
         .base<Shape>()
         .field("label", &Labelled::label_override);
    }
};

inline Customer make_customer()
{
    Customer c;
    c.id = 7;
    c.version = 3;
    c.name = "Alice";
    c.address = Address{"1 Main St", "Springfield", 12345};
    c.tags = {"gold", "early"};
    c.scores = {{"q1", 10}, {"q2", 20}};
    c.notes = "likes tea";
    c.owner_id = 1;
    return c;
}

} // namespace fixtures
