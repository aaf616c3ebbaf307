#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sift {

/// Declared primitive type of a record field.
enum class ValueKind : std::uint8_t {
    Boolean,
    Date,
    Datetime,
    Numeric,
    Identifier,
    Text,
    Blob,
};

inline constexpr std::size_t kValueKindCount = 7;

/// Payload of a Date field: whole days counted from 1970-01-01.
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Payload of a Datetime field: UTC nanoseconds counted from 1970-01-01T00:00:00.
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Record identifier. Comparable for equality only.
struct Id {
    std::string value;
    auto operator==(const Id&) const -> bool = default;
};

/// Opaque binary payload.
struct Blob {
    std::vector<std::uint8_t> bytes;
    auto operator==(const Blob&) const -> bool = default;
};

/// A nullable, dynamically typed field value.
///
/// Integers and doubles share the Numeric kind and compare numerically.
/// Unsigned integers above the int64 range are held as double.
class Value {
   public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, Date, Timestamp, Id,
                                 std::string, Blob>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) {
        if constexpr (std::unsigned_integral<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (v > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                data_ = static_cast<double>(v);
                return;
            }
        }
        data_ = static_cast<std::int64_t>(v);
    }
    Value(double v) : data_(v) {}
    Value(Date v) : data_(v) {}
    Value(Timestamp v) : data_(v) {}
    Value(Id v) : data_(std::move(v)) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(std::string_view v) : data_(std::string(v)) {}
    Value(Blob v) : data_(std::move(v)) {}

    [[nodiscard]] auto is_null() const noexcept -> bool {
        return std::holds_alternative<std::monostate>(data_);
    }

    /// Kind of the held value; nullopt for null.
    [[nodiscard]] auto kind() const noexcept -> std::optional<ValueKind>;

    [[nodiscard]] auto storage() const noexcept -> const Storage& { return data_; }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data_);
    }

    /// Numeric content widened to double; nullopt for non-numeric values.
    [[nodiscard]] auto as_double() const noexcept -> std::optional<double>;

    /// Coerced equality (see values_equal).
    friend auto operator==(const Value& lhs, const Value& rhs) -> bool;

   private:
    Storage data_;
};

[[nodiscard]] auto kind_name(ValueKind kind) -> std::string_view;

/// Ordering comparisons are defined for these kinds only.
[[nodiscard]] constexpr auto is_orderable(ValueKind kind) noexcept -> bool {
    return kind == ValueKind::Numeric || kind == ValueKind::Date ||
           kind == ValueKind::Datetime || kind == ValueKind::Text;
}

/// Element kinds accepted in a membership (is_in / is_not_in) set.
[[nodiscard]] constexpr auto is_set_element_kind(ValueKind kind) noexcept -> bool {
    return kind != ValueKind::Blob;
}

/// Whether a value of kind `from` may be compared with or read as kind `to`.
[[nodiscard]] auto can_coerce(ValueKind from, ValueKind to) noexcept -> bool;

/// Equality with null == null, numeric widening and Identifier/Text interchange.
/// Kinds that cannot be coerced compare unequal.
[[nodiscard]] auto values_equal(const Value& lhs, const Value& rhs) -> bool;

/// Exact three-way comparison of two Numeric values. An int64 is never
/// rounded to double; NaN is unordered against everything.
[[nodiscard]] auto compare_numeric(const Value& lhs, const Value& rhs) noexcept
    -> std::partial_ordering;

/// Human-readable rendering: dates as YYYY-MM-DD, timestamps with nanoseconds.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Hash consistent with values_equal.
struct ValueHash {
    auto operator()(const Value& value) const noexcept -> std::size_t;
};

struct ValueEq {
    auto operator()(const Value& lhs, const Value& rhs) const -> bool {
        return values_equal(lhs, rhs);
    }
};

}  // namespace sift

namespace std {

template <>
struct hash<sift::Date> {
    auto operator()(const sift::Date& date) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(date.days);
    }
};

template <>
struct hash<sift::Timestamp> {
    auto operator()(const sift::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

template <>
struct hash<sift::Id> {
    auto operator()(const sift::Id& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

}  // namespace std
