#pragma once

#include <sift/core/error.hpp>
#include <sift/core/field_ref.hpp>
#include <sift/core/record.hpp>
#include <sift/runtime/compare.hpp>

#include <expected>
#include <vector>

namespace sift::match {

using runtime::Comparison;
using runtime::Operand;
using runtime::ValueSet;

/// One `field <op> operand` test.
struct Condition {
    FieldRef field;
    Comparison op = Comparison::Equals;
    Operand operand;
};

class FieldsMatch;

/// A field-condition list whose last field still awaits its comparator.
///
/// Comparators are rvalue-qualified: supplying one consumes the pending
/// state, so a pending field receives exactly one comparator. This object
/// cannot be evaluated.
class IncompleteFieldsMatch {
   public:
    explicit IncompleteFieldsMatch(FieldRef pending) : pending_(std::move(pending)) {}
    IncompleteFieldsMatch(std::vector<Condition> prior, FieldRef pending)
        : prior_(std::move(prior)), pending_(std::move(pending)) {}

    [[nodiscard]] auto equals(Value value) && -> FieldsMatch;
    [[nodiscard]] auto not_equals(Value value) && -> FieldsMatch;
    [[nodiscard]] auto less_than(Value value) && -> FieldsMatch;
    [[nodiscard]] auto less_or_equal(Value value) && -> FieldsMatch;
    [[nodiscard]] auto greater_than(Value value) && -> FieldsMatch;
    [[nodiscard]] auto greater_or_equal(Value value) && -> FieldsMatch;
    [[nodiscard]] auto is_in(ValueSet values) && -> FieldsMatch;
    [[nodiscard]] auto is_not_in(ValueSet values) && -> FieldsMatch;
    [[nodiscard]] auto has_value() && -> FieldsMatch;

    [[nodiscard]] auto eq(Value value) && -> FieldsMatch;
    [[nodiscard]] auto neq(Value value) && -> FieldsMatch;
    [[nodiscard]] auto lt(Value value) && -> FieldsMatch;
    [[nodiscard]] auto le(Value value) && -> FieldsMatch;
    [[nodiscard]] auto gt(Value value) && -> FieldsMatch;
    [[nodiscard]] auto ge(Value value) && -> FieldsMatch;

    [[nodiscard]] auto pending() const noexcept -> const FieldRef& { return pending_; }
    [[nodiscard]] auto prior() const noexcept -> const std::vector<Condition>& { return prior_; }

   private:
    [[nodiscard]] auto complete(Comparison op, Operand operand) && -> FieldsMatch;

    std::vector<Condition> prior_;
    FieldRef pending_;
};

/// A non-empty, ordered conjunction of field conditions.
///
/// Conditions run in declaration order and evaluation stops at the first
/// false. Extending with also() never modifies this object.
class FieldsMatch {
   public:
    [[nodiscard]] auto also(FieldRef field) const -> IncompleteFieldsMatch {
        return IncompleteFieldsMatch(conditions_, std::move(field));
    }

    [[nodiscard]] auto field(FieldRef field) const -> IncompleteFieldsMatch {
        return also(std::move(field));
    }

    [[nodiscard]] auto conditions() const noexcept -> const std::vector<Condition>& {
        return conditions_;
    }

    [[nodiscard]] auto evaluate(const Record& record) const -> std::expected<bool, Error>;

    /// Throwing form of evaluate().
    [[nodiscard]] auto matches(const Record& record) const -> bool;

   private:
    friend class IncompleteFieldsMatch;

    explicit FieldsMatch(std::vector<Condition> conditions) : conditions_(std::move(conditions)) {}

    std::vector<Condition> conditions_;
};

}  // namespace sift::match
