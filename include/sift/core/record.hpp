#pragma once

#include <sift/core/error.hpp>
#include <sift/core/schema.hpp>
#include <sift/core/value.hpp>

#include <expected>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sift {

class Record;

/// Records are shared, never owned by a view; identity is pointer identity.
using RecordPtr = std::shared_ptr<const Record>;

/// An instance of a schema whose fields may or may not be loaded.
///
/// A field is either not loaded, loaded with a (possibly null) value, or,
/// for relation fields, loaded with a (possibly null) related record.
class Record {
   public:
    /// Throws std::invalid_argument when `schema` is null.
    explicit Record(SchemaPtr schema);

    [[nodiscard]] auto schema() const noexcept -> const SchemaPtr& { return schema_; }

    /// Load a primitive field. A null value on a relation field loads a null relation.
    /// Throws UnknownFieldError or FieldTypeError.
    void set(std::string_view field, Value value);

    /// Load a relation field. Throws UnknownFieldError, FieldTypeError when the field
    /// is not a relation, or SchemaAssignabilityError when `related` has another schema.
    void set_relation(std::string_view field, RecordPtr related);

    /// Return a field to the not-loaded state. Throws UnknownFieldError.
    void unset(std::string_view field);

    /// Whether the field has been populated. Unknown fields are never loaded.
    [[nodiscard]] auto is_loaded(std::string_view field) const -> bool;

    /// Value of a loaded primitive field.
    [[nodiscard]] auto get(std::string_view field) const -> std::expected<Value, Error>;

    /// Related record of a loaded relation field; nullptr when the relation is null.
    [[nodiscard]] auto related(std::string_view field) const -> std::expected<RecordPtr, Error>;

    /// Definitions of loaded fields, in schema order.
    [[nodiscard]] auto populated_fields() const -> std::vector<const FieldDef*>;

    /// A new record of the same schema with only `fields` copied over.
    [[nodiscard]] auto with_fields(const std::vector<std::string>& fields) const
        -> std::expected<RecordPtr, Error>;

   private:
    struct Unloaded {
        auto operator==(const Unloaded&) const -> bool = default;
    };
    using Slot = std::variant<Unloaded, Value, RecordPtr>;

    [[nodiscard]] auto lookup(std::string_view field) const -> std::expected<std::size_t, Error>;
    [[nodiscard]] auto lookup_or_throw(std::string_view field) const -> std::size_t;

    SchemaPtr schema_;
    std::vector<Slot> slots_;
};

/// Convenience factory: a record of `schema` with the given primitive fields loaded.
[[nodiscard]] auto make_record(SchemaPtr schema,
                               std::initializer_list<std::pair<std::string_view, Value>> fields)
    -> std::shared_ptr<Record>;

}  // namespace sift
