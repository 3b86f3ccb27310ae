// main.cpp - Change auditing example
//
// Builds two snapshots of a user account, diffs them and prints what the
// account looked like before each change.

#include <objdiff/differ.h>
#include <objdiff/errors.h>

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace objdiff;

// ============================================================
// Domain Model
// ============================================================

struct Record
{
    virtual ~Record() = default;

    long record_id = 0;
    std::string created_by;

    static void describe(TypeBuilder<Record>& b)
    {
        b.name("Record")
         .comparable()
         .field("record_id", &Record::record_id, {.compared = false})
         .field("created_by", &Record::created_by);
    }
};

struct Address
{
    std::string street;
    std::string city;

    static void describe(TypeBuilder<Address>& b)
    {
        b.name("Address")
         .comparable()
         .field("street", &Address::street)
         .field("city", &Address::city);
    }
};

class Account : public Record
{
public:
    std::string login;
    Address address;
    int profile_id = 0;
    std::vector<std::string> roles;
    std::map<std::string, std::string> settings;

    static void describe(TypeBuilder<Account>& b)
    {
        b.name("Account")
         .base<Record>()
         .field("login", &Account::login)
         .field("address", &Account::address)
         .field("profile_id", &Account::profile_id, {.resolver = "profile"})
         .field("roles", &Account::roles)
         .field("settings", &Account::settings)
         .field("locked", &Account::locked_, {.access = Access::Private})
         .accessor("is_locked", &Account::is_locked);
    }

    [[nodiscard]] bool is_locked() const { return locked_; }
    void lock() { locked_ = true; }

private:
    bool locked_ = false;
};

// ============================================================
// Helpers
// ============================================================

std::string profile_name(int id)
{
    static const std::map<int, std::string> profiles = {
        {1, "Standard"}, {2, "Standard"}, {3, "Administrator"}};
    auto it = profiles.find(id);
    return it != profiles.end() ? it->second : "Unknown";
}

void print_result(const std::string& title, const DiffResult& result)
{
    std::cout << "--- " << title << " (" << result.size() << " entries) ---\n";
    for (const auto& [path, old_value] : result) {
        std::cout << "  " << path << " = \"" << old_value << "\"\n";
    }
    std::cout << "\n";
}

Account make_account()
{
    Account a;
    a.record_id = 1001;
    a.created_by = "import";
    a.login = "alice";
    a.address = Address{"1 Main St", "Springfield"};
    a.profile_id = 1;
    a.roles = {"reader", "writer"};
    a.settings = {{"theme", "dark"}, {"lang", "en"}};
    return a;
}

// ============================================================
// Main
// ============================================================

int main()
{
    std::cout << "=== objdiff Audit Example ===\n\n";

    Account before = make_account();
    Account after = make_account();
    after.record_id = 2002;                // not compared
    after.address.city = "Shelbyville";
    after.profile_id = 2;                  // same profile name once resolved
    after.roles.push_back("auditor");
    after.settings.erase("lang");
    after.settings["timezone"] = "UTC";    // keys only in the new snapshot are not visited
    after.lock();

    Differ differ;
    print_result("Raw diff", differ.diff("account", before, after));

    differ.register_resolver("profile", make_resolver<int>(profile_name));
    print_result("Diff with profile resolver", differ.diff("account", before, after));

    print_result("All leaves of the original", differ.resolve_leaf_paths("account", before));

    try {
        (void)differ.diff("value", Value{1}, Value{"1"});
    } catch (const TypeMismatchError& e) {
        std::cout << "Type mismatch: " << e.what() << "\n";
    }

    return 0;
}
