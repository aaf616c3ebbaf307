#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

#include <sift/core/error.hpp>
#include <sift/core/field_ref.hpp>
#include <sift/core/record.hpp>
#include <sift/core/schema.hpp>

#include <stdexcept>

using namespace sift;
using sift::testing::account;
using sift::testing::account_schema;
using sift::testing::user;

TEST_CASE("Schema construction", "[core][schema]") {
    SECTION("fields keep declaration order") {
        auto schema = account_schema();
        REQUIRE(schema->name() == "Account");
        REQUIRE(schema->fields().front().name == "Id");
        REQUIRE(schema->field_index("Revenue") == 2U);
        REQUIRE(schema->find_field("Parent")->is_relation());
        REQUIRE(schema->find_field("Parent")->relation == "Account");
        REQUIRE(schema->find_field("Missing") == nullptr);
    }

    SECTION("invalid definitions throw") {
        REQUIRE_THROWS_AS(Schema::Builder("").field("A", ValueKind::Text).build(),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(
            Schema::Builder("T").field("A", ValueKind::Text).field("A", ValueKind::Numeric).build(),
            std::invalid_argument);
        REQUIRE_THROWS_AS(Schema::Builder("T").field("A.B", ValueKind::Text).build(),
                          std::invalid_argument);
    }

    SECTION("assignability is by schema name") {
        auto other = Schema::Builder("Account").build();
        auto user_schema = sift::testing::user_schema();
        REQUIRE(other->is_assignable_to(*account_schema()));
        REQUIRE_FALSE(user_schema->is_assignable_to(*account_schema()));
    }
}

TEST_CASE("FieldRef parsing", "[core][field_ref]") {
    SECTION("plain name is direct") {
        FieldRef ref("Name");
        REQUIRE(ref.is_direct());
        REQUIRE(ref.head() == "Name");
        REQUIRE(ref.to_string() == "Name");
    }

    SECTION("dotted name is a relation path") {
        FieldRef ref = FieldRef::parse("Parent.Owner.Name");
        REQUIRE_FALSE(ref.is_direct());
        REQUIRE(ref.head() == "Parent");
        REQUIRE(std::get<RelationPath>(ref.node()).segments.size() == 3);
        REQUIRE(ref.to_string() == "Parent.Owner.Name");
    }

    SECTION("explicit forms") {
        REQUIRE(FieldRef(DirectField{"Name"}) == FieldRef("Name"));
        REQUIRE(FieldRef(RelationPath{{"Parent", "Name"}}) == FieldRef("Parent.Name"));
        REQUIRE_THROWS_AS(FieldRef(RelationPath{{"Name"}}), std::invalid_argument);
    }

    SECTION("empty segments throw") {
        REQUIRE_THROWS_AS(FieldRef(""), std::invalid_argument);
        REQUIRE_THROWS_AS(FieldRef("Parent..Name"), std::invalid_argument);
        REQUIRE_THROWS_AS(FieldRef("Parent."), std::invalid_argument);
    }
}

TEST_CASE("Record field states", "[core][record]") {
    auto rec = std::make_shared<Record>(account_schema());

    SECTION("fields start unloaded") {
        REQUIRE_FALSE(rec->is_loaded("Name"));
        auto value = rec->get("Name");
        REQUIRE_FALSE(value.has_value());
        REQUIRE(value.error().code == ErrorCode::FieldNotLoaded);
        REQUIRE(rec->populated_fields().empty());
    }

    SECTION("loaded null is distinct from unloaded") {
        rec->set("Name", Value{});
        REQUIRE(rec->is_loaded("Name"));
        auto value = rec->get("Name");
        REQUIRE(value.has_value());
        REQUIRE(value->is_null());
    }

    SECTION("unset returns a field to unloaded") {
        rec->set("Revenue", 10);
        rec->unset("Revenue");
        REQUIRE_FALSE(rec->is_loaded("Revenue"));
    }

    SECTION("populated_fields follows schema order") {
        rec->set("Revenue", 1);
        rec->set("Id", Value{Id{"001"}});
        auto fields = rec->populated_fields();
        REQUIRE(fields.size() == 2);
        REQUIRE(fields[0]->name == "Id");
        REQUIRE(fields[1]->name == "Revenue");
    }

    SECTION("text is accepted for identifier fields") {
        rec->set("Id", "001A");
        auto id = rec->get("Id");
        REQUIRE(id.has_value());
        REQUIRE(id->kind() == ValueKind::Identifier);
    }

    SECTION("unknown field") {
        REQUIRE_THROWS_AS(rec->set("Missing", 1), UnknownFieldError);
        REQUIRE_FALSE(rec->is_loaded("Missing"));
        REQUIRE(rec->get("Missing").error().code == ErrorCode::UnknownField);
    }

    SECTION("kind mismatch") {
        REQUIRE_THROWS_AS(rec->set("Revenue", "lots"), FieldTypeError);
        REQUIRE_THROWS_AS(rec->set("Parent", "x"), FieldTypeError);
        REQUIRE_THROWS_AS(rec->set_relation("Name", nullptr), FieldTypeError);
    }
}

TEST_CASE("Record relations", "[core][record]") {
    auto child = account("Child", 1);
    auto parent = account("Parent", 2);

    SECTION("set and read a relation") {
        child->set_relation("Parent", parent);
        auto related = child->related("Parent");
        REQUIRE(related.has_value());
        REQUIRE(*related == parent);
    }

    SECTION("null relation is loaded") {
        child->set("Parent", Value{});
        REQUIRE(child->is_loaded("Parent"));
        REQUIRE(*child->related("Parent") == nullptr);
    }

    SECTION("unloaded relation") {
        REQUIRE(child->related("Owner").error().code == ErrorCode::FieldNotLoaded);
    }

    SECTION("wrong target schema") {
        REQUIRE_THROWS_AS(child->set_relation("Parent", user("Ann")), SchemaAssignabilityError);
        REQUIRE_NOTHROW(child->set_relation("Owner", user("Ann")));
    }

    SECTION("get on a relation is a type error") {
        child->set_relation("Parent", parent);
        REQUIRE(child->get("Parent").error().code == ErrorCode::FieldType);
    }
}

TEST_CASE("Record with_fields", "[core][record]") {
    auto rec = account("Acme", 100);

    auto picked = rec->with_fields({"Name"});
    REQUIRE(picked.has_value());
    REQUIRE((*picked)->is_loaded("Name"));
    REQUIRE_FALSE((*picked)->is_loaded("Revenue"));
    REQUIRE((*picked)->schema() == rec->schema());
    REQUIRE(rec->is_loaded("Revenue"));

    REQUIRE(rec->with_fields({"Founded"}).error().code == ErrorCode::FieldNotLoaded);
    REQUIRE(rec->with_fields({"Nope"}).error().code == ErrorCode::UnknownField);
}

TEST_CASE("Record requires a schema", "[core][record]") {
    REQUIRE_THROWS_AS(Record(nullptr), std::invalid_argument);
}

TEST_CASE("throw_error maps codes to exception types", "[core][error]") {
    REQUIRE_THROWS_AS(throw_error({ErrorCode::FieldNotLoaded, "x"}), FieldNotLoadedError);
    REQUIRE_THROWS_AS(throw_error({ErrorCode::UnsupportedComparisonType, "x"}),
                      UnsupportedComparisonTypeError);
    REQUIRE_THROWS_AS(throw_error({ErrorCode::SchemaAssignability, "x"}),
                      SchemaAssignabilityError);
    REQUIRE_THROWS_AS(throw_error({ErrorCode::FieldType, "x"}), SiftError);
    REQUIRE(to_string(ErrorCode::UnknownField) == "unknown field");
}
