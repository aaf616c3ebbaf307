#pragma once

#include <sift/core/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sift {

/// A field definition: either a primitive field of a declared kind, or a
/// relation to a record of another (or the same) schema.
struct FieldDef {
    std::string name;
    ValueKind kind = ValueKind::Text;
    /// Target schema name for relation fields; empty for primitive fields.
    std::string relation;

    [[nodiscard]] auto is_relation() const noexcept -> bool { return !relation.empty(); }
};

/// A named record type with an ordered, immutable set of fields.
///
/// Relations refer to their target by schema name so that schemas may be
/// self-referential (e.g. Account.Parent -> Account).
class Schema {
   public:
    class Builder;

    /// Throws std::invalid_argument on an empty name or duplicate field names.
    Schema(std::string name, std::vector<FieldDef> fields);

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto fields() const noexcept -> const std::vector<FieldDef>& { return fields_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }

    [[nodiscard]] auto find_field(std::string_view name) const -> const FieldDef*;
    [[nodiscard]] auto field_index(std::string_view name) const -> std::optional<std::size_t>;

    /// Records of this schema may be used where `target` is expected.
    [[nodiscard]] auto is_assignable_to(const Schema& target) const noexcept -> bool {
        return name_ == target.name_;
    }

   private:
    std::string name_;
    std::vector<FieldDef> fields_;
    std::unordered_map<std::string, std::size_t> index_;
};

using SchemaPtr = std::shared_ptr<const Schema>;

/// Fluent construction of an immutable schema.
///
///   auto account = Schema::Builder("Account")
///                      .field("Name", ValueKind::Text)
///                      .field("AnnualRevenue", ValueKind::Numeric)
///                      .relation("Parent", "Account")
///                      .build();
class Schema::Builder {
   public:
    explicit Builder(std::string name) : name_(std::move(name)) {}

    auto field(std::string name, ValueKind kind) -> Builder& {
        fields_.push_back(FieldDef{.name = std::move(name), .kind = kind, .relation = {}});
        return *this;
    }

    auto relation(std::string name, std::string target_schema) -> Builder& {
        fields_.push_back(FieldDef{
            .name = std::move(name), .kind = ValueKind::Text, .relation = std::move(target_schema)});
        return *this;
    }

    [[nodiscard]] auto build() const -> SchemaPtr {
        return std::make_shared<const Schema>(name_, fields_);
    }

   private:
    std::string name_;
    std::vector<FieldDef> fields_;
};

}  // namespace sift
