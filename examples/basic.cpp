#include <sift/sift.hpp>

#include <fmt/core.h>

using namespace sift;

auto main() -> int {
    auto user = Schema::Builder("User").field("Name", ValueKind::Text).build();
    auto account = Schema::Builder("Account")
                       .field("Name", ValueKind::Text)
                       .field("Revenue", ValueKind::Numeric)
                       .relation("Owner", "User")
                       .build();

    auto ann = make_record(user, {{"Name", "Ann"}});
    auto foo = make_record(account, {{"Name", "Foo"}, {"Revenue", 1000}});
    auto bar = make_record(account, {{"Name", "Bar"}, {"Revenue", 5000}});
    foo->set_relation("Owner", ann);
    bar->set("Owner", Value{});

    auto accounts = view::Collection::of({foo, bar}, account);

    fmt::print("=== Field conditions ===\n");
    auto big = accounts.filter(match::field("Revenue").gt(2000));
    fmt::print("revenue > 2000: {} of {} records\n", big.size(), accounts.size());

    auto owned = accounts.filter(match::field("Owner.Name").equals("Ann"));
    fmt::print("owned by Ann: {}\n", format_value(owned.pluck("Name").front()));

    // Prototype match against populated fields only.
    auto proto = make_record(account, {{"Name", "Bar"}});
    fmt::print("matching the prototype: {}\n", accounts.filter(match::record(proto)).size());

    fmt::print("\n=== Reshaping ===\n");
    for (const auto& name : accounts.pluck_texts("Name")) {
        fmt::print("name: {}\n", name.value_or("null"));
    }
    for (const auto& entry : accounts.group_by("Owner.Name")) {
        fmt::print("owner {}: {} records\n", format_value(entry.key), entry.records.size());
    }

    return 0;
}
