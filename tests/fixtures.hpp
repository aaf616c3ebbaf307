#pragma once

#include <sift/core/record.hpp>
#include <sift/core/schema.hpp>
#include <sift/core/value.hpp>

#include <string>

namespace sift::testing {

// Account has a self relation (Parent) and a relation to User (Owner).
inline auto user_schema() -> SchemaPtr {
    static const SchemaPtr schema = Schema::Builder("User")
                                        .field("Id", ValueKind::Identifier)
                                        .field("Name", ValueKind::Text)
                                        .field("IsActive", ValueKind::Boolean)
                                        .build();
    return schema;
}

inline auto account_schema() -> SchemaPtr {
    static const SchemaPtr schema = Schema::Builder("Account")
                                        .field("Id", ValueKind::Identifier)
                                        .field("Name", ValueKind::Text)
                                        .field("Revenue", ValueKind::Numeric)
                                        .field("Founded", ValueKind::Date)
                                        .field("LastModified", ValueKind::Datetime)
                                        .field("IsActive", ValueKind::Boolean)
                                        .field("Logo", ValueKind::Blob)
                                        .relation("Parent", "Account")
                                        .relation("Owner", "User")
                                        .build();
    return schema;
}

inline auto account(const std::string& name, Value revenue) -> std::shared_ptr<Record> {
    return make_record(account_schema(), {{"Name", Value{name}}, {"Revenue", std::move(revenue)}});
}

inline auto user(const std::string& name) -> std::shared_ptr<Record> {
    return make_record(user_schema(), {{"Name", Value{name}}});
}

}  // namespace sift::testing
