#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

#include <sift/match/predicate.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace sift;
using sift::match::Predicate;
using sift::runtime::Comparison;
using sift::testing::account;
using sift::testing::user;

namespace {

template <typename T>
concept CanEquals = requires(T pending) { std::forward<T>(pending).equals(Value{}); };

// Company and Contact refer to each other.
auto company_schema() -> SchemaPtr {
    static const SchemaPtr schema = Schema::Builder("Company")
                                        .field("Name", ValueKind::Text)
                                        .relation("PrimaryContact", "Contact")
                                        .build();
    return schema;
}

auto contact_schema() -> SchemaPtr {
    static const SchemaPtr schema = Schema::Builder("Contact")
                                        .field("Name", ValueKind::Text)
                                        .relation("Account", "Company")
                                        .build();
    return schema;
}

auto linked_pair(const std::string& company, const std::string& contact)
    -> std::pair<std::shared_ptr<Record>, std::shared_ptr<Record>> {
    auto c = make_record(company_schema(), {{"Name", Value{company}}});
    auto p = make_record(contact_schema(), {{"Name", Value{contact}}});
    c->set_relation("PrimaryContact", p);
    p->set_relation("Account", c);
    return {c, p};
}

}  // namespace

TEST_CASE("FieldsMatch builder", "[match][fields]") {
    SECTION("each comparator completes the pending field") {
        auto pending = match::field("Name");
        REQUIRE(pending.pending() == FieldRef("Name"));
        REQUIRE(pending.prior().empty());

        auto m = std::move(pending).equals("Acme");
        REQUIRE(m.conditions().size() == 1);
        REQUIRE(m.conditions()[0].op == Comparison::Equals);
        REQUIRE(m.conditions()[0].field == FieldRef("Name"));
    }

    SECTION("also() never modifies the source") {
        auto base = match::field("Name").equals("Acme");
        auto wider = base.also("Revenue").gt(10);
        auto other = base.also("Revenue").lt(5);

        REQUIRE(base.conditions().size() == 1);
        REQUIRE(wider.conditions().size() == 2);
        REQUIRE(other.conditions().size() == 2);
        REQUIRE(wider.conditions()[1].op == Comparison::GreaterThan);
        REQUIRE(other.conditions()[1].op == Comparison::LessThan);
    }

    SECTION("comparators consume the pending field") {
        STATIC_REQUIRE(CanEquals<match::IncompleteFieldsMatch>);
        STATIC_REQUIRE_FALSE(CanEquals<match::IncompleteFieldsMatch&>);
        STATIC_REQUIRE_FALSE(CanEquals<const match::IncompleteFieldsMatch&>);
    }

    SECTION("also() starts a new pending condition") {
        auto base = match::field("Name").equals("Acme");
        auto pending = base.also("Revenue");
        REQUIRE(pending.pending() == FieldRef("Revenue"));
        REQUIRE(pending.prior().size() == 1);
        REQUIRE(pending.prior()[0].field == FieldRef("Name"));

        auto done = std::move(pending).ge(10);
        REQUIRE(done.conditions().size() == 2);
        REQUIRE(done.conditions()[1].op == Comparison::GreaterOrEqual);
        REQUIRE(base.conditions().size() == 1);
    }

    SECTION("aliases map to the same operators") {
        REQUIRE(match::field("A").eq(1).conditions()[0].op == Comparison::Equals);
        REQUIRE(match::field("A").neq(1).conditions()[0].op == Comparison::NotEquals);
        REQUIRE(match::field("A").le(1).conditions()[0].op == Comparison::LessOrEqual);
        REQUIRE(match::field("A").has_value().conditions()[0].op == Comparison::HasValue);
    }
}

TEST_CASE("FieldsMatch evaluation", "[match][fields]") {
    auto acme = account("Acme", 5000);

    SECTION("all conditions must hold") {
        REQUIRE(match::field("Name").equals("Acme").matches(*acme));
        REQUIRE(match::field("Name").equals("Acme").also("Revenue").gt(1000).matches(*acme));
        REQUIRE_FALSE(
            match::field("Name").equals("Acme").also("Revenue").gt(9000).matches(*acme));
    }

    SECTION("adding a condition never widens the match") {
        auto base = match::field("Revenue").ge(0);
        auto narrower = base.also("Name").is_in({"Globex"});
        REQUIRE(base.matches(*acme));
        REQUIRE_FALSE(narrower.matches(*acme));
    }

    SECTION("evaluation stops at the first false condition") {
        // Founded is not loaded; the failing Name test runs first.
        auto m = match::field("Name").equals("Other").also("Founded").has_value();
        REQUIRE_FALSE(m.matches(*acme));

        auto reversed = match::field("Founded").has_value().also("Name").equals("Other");
        REQUIRE_THROWS_AS(reversed.matches(*acme), FieldNotLoadedError);
    }

    SECTION("errors carry the failing condition") {
        acme->set("IsActive", true);
        auto m = match::field("IsActive").lt(false);
        auto result = m.evaluate(*acme);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::UnsupportedComparisonType);
        REQUIRE(result.error().message.starts_with("IsActive <"));
        REQUIRE_THROWS_AS(m.matches(*acme), UnsupportedComparisonTypeError);
    }

    SECTION("relation paths") {
        auto parent = account("Parent Co", 1);
        parent->set_relation("Owner", user("Ann"));
        acme->set_relation("Parent", parent);
        REQUIRE(match::field("Parent.Owner.Name").equals("Ann").matches(*acme));
        REQUIRE(match::field("Parent.Name").is_not_in({"Acme"}).matches(*acme));
    }
}

TEST_CASE("RecordMatch", "[match][record]") {
    auto prototype = account("Test", 50'000'000);
    auto exact = account("Test", 50'000'000);
    auto wrong_revenue = account("Test", 1);
    auto wrong_name = account("Other", 50'000'000);

    SECTION("every populated prototype field must be equal") {
        auto m = match::record(prototype);
        REQUIRE(m.matches(*exact));
        REQUIRE_FALSE(m.matches(*wrong_revenue));
        REQUIRE_FALSE(m.matches(*wrong_name));
    }

    SECTION("fewer prototype fields match a superset of records") {
        auto name_only = make_record(sift::testing::account_schema(), {{"Name", "Test"}});
        auto narrow = match::record(name_only);
        auto wide = match::record(prototype);
        std::vector<std::shared_ptr<Record>> targets{exact, wrong_revenue, wrong_name};

        REQUIRE(narrow.matches(*exact));
        REQUIRE(narrow.matches(*wrong_revenue));
        REQUIRE_FALSE(narrow.matches(*wrong_name));
        REQUIRE(wide.matches(*exact));
        REQUIRE_FALSE(wide.matches(*wrong_revenue));

        for (const auto& target : targets) {
            if (wide.matches(*target)) {
                REQUIRE(narrow.matches(*target));
            }
        }
    }

    SECTION("extra fields on the target are ignored") {
        exact->set("IsActive", true);
        REQUIRE(match::record(prototype).matches(*exact));
    }

    SECTION("empty prototype matches everything") {
        auto empty = std::make_shared<Record>(sift::testing::account_schema());
        REQUIRE(match::record(empty).matches(*wrong_name));
    }

    SECTION("target missing a prototype field") {
        auto partial = make_record(sift::testing::account_schema(), {{"Name", "Test"}});
        REQUIRE_THROWS_AS(match::record(prototype).matches(*partial), FieldNotLoadedError);
    }

    SECTION("relations match recursively") {
        auto owner_proto = make_record(sift::testing::user_schema(), {{"Name", "Ann"}});
        auto proto = std::make_shared<Record>(sift::testing::account_schema());
        proto->set_relation("Owner", owner_proto);

        auto ann = user("Ann");
        ann->set("IsActive", true);
        exact->set_relation("Owner", ann);
        wrong_name->set_relation("Owner", user("Bob"));
        wrong_revenue->set("Owner", Value{});

        auto m = match::record(proto);
        REQUIRE(m.matches(*exact));
        REQUIRE_FALSE(m.matches(*wrong_name));
        REQUIRE_FALSE(m.matches(*wrong_revenue));
    }

    SECTION("null prototype relation matches only null") {
        auto proto = std::make_shared<Record>(sift::testing::account_schema());
        proto->set("Parent", Value{});
        exact->set("Parent", Value{});
        wrong_name->set_relation("Parent", wrong_revenue);
        REQUIRE(match::record(proto).matches(*exact));
        REQUIRE_FALSE(match::record(proto).matches(*wrong_name));
    }

    SECTION("cyclic relations terminate") {
        auto [acme, ann] = linked_pair("Acme", "Ann");
        auto [twin, twin_contact] = linked_pair("Acme", "Ann");
        auto [other, bob] = linked_pair("Acme", "Bob");

        auto m = match::record(acme);
        REQUIRE(m.matches(*acme));
        REQUIRE(m.matches(*twin));
        REQUIRE_FALSE(m.matches(*other));
        REQUIRE(match::record(ann).matches(*twin_contact));

        for (const auto& company : {acme, twin, other}) {
            company->set("PrimaryContact", Value{});
        }
    }

    SECTION("null prototype is rejected") {
        REQUIRE_THROWS_AS(match::record(nullptr), std::invalid_argument);
    }
}

TEST_CASE("Predicate negation", "[match][predicate]") {
    auto acme = account("Acme", 10);
    Predicate is_acme = match::field("Name").equals("Acme");

    REQUIRE(is_acme.matches(*acme));
    REQUIRE_FALSE((!is_acme).matches(*acme));
    REQUIRE((!!is_acme).matches(*acme));
    REQUIRE(std::holds_alternative<match::FieldsMatch>((!!is_acme).node()));

    Predicate by_record = match::record(account("Acme", 10));
    REQUIRE_FALSE(by_record.negate().matches(*acme));

    SECTION("negation propagates errors") {
        Predicate bad = match::field("Founded").has_value();
        REQUIRE_THROWS_AS((!bad).matches(*acme), FieldNotLoadedError);
    }
}
