#pragma once

#include <sift/core/error.hpp>
#include <sift/core/value.hpp>

#include <concepts>
#include <expected>
#include <optional>
#include <string>

namespace sift::view {

/// Per-type extraction rules for pluck_as / group_by_as.
///
/// `kind` is the ValueKind the C++ type reads; `read` converts a non-null
/// value whose kind passed can_coerce(kind_of_value, kind).
template <typename T>
struct KindTraits;

template <>
struct KindTraits<bool> {
    static constexpr ValueKind kind = ValueKind::Boolean;
    static auto read(const Value& v) -> bool { return *v.get_if<bool>(); }
};

template <>
struct KindTraits<double> {
    static constexpr ValueKind kind = ValueKind::Numeric;
    static auto read(const Value& v) -> double { return *v.as_double(); }
};

template <>
struct KindTraits<Date> {
    static constexpr ValueKind kind = ValueKind::Date;
    static auto read(const Value& v) -> Date { return *v.get_if<Date>(); }
};

template <>
struct KindTraits<Timestamp> {
    static constexpr ValueKind kind = ValueKind::Datetime;
    static auto read(const Value& v) -> Timestamp { return *v.get_if<Timestamp>(); }
};

template <>
struct KindTraits<Id> {
    static constexpr ValueKind kind = ValueKind::Identifier;
    static auto read(const Value& v) -> Id {
        if (const auto* id = v.get_if<Id>()) {
            return *id;
        }
        return Id{*v.get_if<std::string>()};
    }
};

template <>
struct KindTraits<std::string> {
    static constexpr ValueKind kind = ValueKind::Text;
    static auto read(const Value& v) -> std::string {
        if (const auto* s = v.get_if<std::string>()) {
            return *s;
        }
        return v.get_if<Id>()->value;
    }
};

template <typename T>
concept Extractable = requires(const Value& v) {
    { KindTraits<T>::kind } -> std::convertible_to<ValueKind>;
    { KindTraits<T>::read(v) } -> std::same_as<T>;
};

[[nodiscard]] auto extract_error(ValueKind from, ValueKind to) -> Error;

/// Read `value` as T: null yields nullopt, a non-coercible kind a FieldType error.
template <Extractable T>
[[nodiscard]] auto extract_as(const Value& value) -> std::expected<std::optional<T>, Error> {
    if (value.is_null()) {
        return std::optional<T>{};
    }
    const ValueKind kind = *value.kind();
    if (!can_coerce(kind, KindTraits<T>::kind)) {
        return std::unexpected(extract_error(kind, KindTraits<T>::kind));
    }
    return std::optional<T>{KindTraits<T>::read(value)};
}

}  // namespace sift::view
