#pragma once

#include <sift/core/error.hpp>
#include <sift/core/field_ref.hpp>
#include <sift/core/record.hpp>
#include <sift/match/fields_match.hpp>
#include <sift/match/record_match.hpp>

#include <expected>
#include <memory>
#include <variant>

namespace sift::match {

class Predicate;

/// Logical negation of a predicate.
struct Not {
    std::shared_ptr<const Predicate> operand;
};

/// Closed set of predicate forms sharing one evaluation function.
class Predicate {
   public:
    using Node = std::variant<FieldsMatch, RecordMatch, Not>;

    Predicate(FieldsMatch match) : node_(std::move(match)) {}
    Predicate(RecordMatch match) : node_(std::move(match)) {}

    [[nodiscard]] auto node() const noexcept -> const Node& { return node_; }

    /// Negated copy. Negating a negation yields the original predicate.
    [[nodiscard]] auto negate() const -> Predicate;

    [[nodiscard]] auto evaluate(const Record& record) const -> std::expected<bool, Error>;

    /// Throwing form of evaluate().
    [[nodiscard]] auto matches(const Record& record) const -> bool;

    friend auto operator!(const Predicate& predicate) -> Predicate { return predicate.negate(); }

   private:
    explicit Predicate(Not negation) : node_(std::move(negation)) {}

    Node node_;
};

/// Start a field-condition chain: match::field("Name").equals("Acme").
[[nodiscard]] inline auto field(FieldRef field) -> IncompleteFieldsMatch {
    return IncompleteFieldsMatch(std::move(field));
}

/// Prototype match: match::record(prototype).
[[nodiscard]] inline auto record(RecordPtr prototype) -> RecordMatch {
    return RecordMatch(std::move(prototype));
}

}  // namespace sift::match
