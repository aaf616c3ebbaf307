#pragma once

#include <sift/core/error.hpp>
#include <sift/core/value.hpp>
#include <sift/runtime/resolve.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <variant>
#include <vector>

namespace sift::runtime {

/// Comparison operators available to field conditions.
enum class Comparison : std::uint8_t {
    Equals,
    NotEquals,
    LessThan,
    LessOrEqual,
    GreaterThan,
    GreaterOrEqual,
    IsIn,
    IsNotIn,
    HasValue,
};

[[nodiscard]] auto to_string(Comparison op) -> std::string_view;

/// A deduplicated set of comparison values for is_in / is_not_in.
///
/// The element type is validated when the set is used in a comparison: all
/// elements must share one supported primitive kind (no nulls, no blobs).
class ValueSet {
   public:
    ValueSet() : ValueSet(std::vector<Value>{}) {}
    ValueSet(std::initializer_list<Value> values) : ValueSet(std::vector<Value>(values)) {}
    explicit ValueSet(std::vector<Value> values);

    /// Build from any range whose elements convert to Value.
    template <std::ranges::input_range R>
        requires std::constructible_from<Value, std::ranges::range_reference_t<R>>
    [[nodiscard]] static auto from(const R& range) -> ValueSet {
        std::vector<Value> values;
        for (const auto& v : range) {
            values.emplace_back(v);
        }
        return ValueSet(std::move(values));
    }

    [[nodiscard]] auto elements() const noexcept -> const std::vector<Value>& { return values_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    /// The common element kind, nullopt for an empty set.
    [[nodiscard]] auto element_kind() const -> std::expected<std::optional<ValueKind>, Error>;

    /// Membership under values_equal.
    [[nodiscard]] auto contains(const Value& value) const -> bool;

   private:
    struct Index;

    std::vector<Value> values_;
    std::shared_ptr<const Index> index_;
};

/// Right-hand side of a condition.
using Operand = std::variant<Value, ValueSet>;

/// Evaluate `field <op> operand`.
///
/// Equality never fails: kinds that cannot be coerced compare unequal and
/// null equals only null. Ordering requires an orderable declared kind and a
/// compatible operand, otherwise UnsupportedComparisonType; a null on either
/// side makes an ordering false. HasValue ignores the operand.
[[nodiscard]] auto compare(const FieldValue& field, Comparison op, const Operand& operand)
    -> std::expected<bool, Error>;

}  // namespace sift::runtime
