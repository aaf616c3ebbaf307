#pragma once

#include <sift/core/error.hpp>
#include <sift/core/field_ref.hpp>
#include <sift/core/record.hpp>
#include <sift/core/value.hpp>

#include <expected>
#include <optional>

namespace sift::runtime {

/// A resolved field: its value and the kind the terminal field declares.
/// `declared` is nullopt when resolution stopped at a null relation.
struct FieldValue {
    Value value;
    std::optional<ValueKind> declared;
};

/// Resolve `field` against `record`, walking relations for dotted paths.
///
/// A relation that is loaded but null yields a null value, not an error.
/// Fails with FieldNotLoaded when a field or relation on the path was never
/// populated, UnknownField when the schema lacks a segment, and FieldType when
/// a relation is used as a terminal or a primitive as a relation.
[[nodiscard]] auto resolve(const Record& record, const FieldRef& field)
    -> std::expected<FieldValue, Error>;

}  // namespace sift::runtime
