#include <sift/match/fields_match.hpp>
#include <sift/runtime/resolve.hpp>

#include <fmt/format.h>

#include <utility>

namespace sift::match {

auto IncompleteFieldsMatch::complete(Comparison op, Operand operand) && -> FieldsMatch {
    std::vector<Condition> conditions = std::move(prior_);
    conditions.push_back(
        Condition{.field = std::move(pending_), .op = op, .operand = std::move(operand)});
    return FieldsMatch(std::move(conditions));
}

auto IncompleteFieldsMatch::equals(Value value) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::Equals, std::move(value));
}

auto IncompleteFieldsMatch::not_equals(Value value) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::NotEquals, std::move(value));
}

auto IncompleteFieldsMatch::less_than(Value value) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::LessThan, std::move(value));
}

auto IncompleteFieldsMatch::less_or_equal(Value value) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::LessOrEqual, std::move(value));
}

auto IncompleteFieldsMatch::greater_than(Value value) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::GreaterThan, std::move(value));
}

auto IncompleteFieldsMatch::greater_or_equal(Value value) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::GreaterOrEqual, std::move(value));
}

auto IncompleteFieldsMatch::is_in(ValueSet values) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::IsIn, std::move(values));
}

auto IncompleteFieldsMatch::is_not_in(ValueSet values) && -> FieldsMatch {
    return std::move(*this).complete(Comparison::IsNotIn, std::move(values));
}

auto IncompleteFieldsMatch::has_value() && -> FieldsMatch {
    return std::move(*this).complete(Comparison::HasValue, Value{});
}

auto IncompleteFieldsMatch::eq(Value value) && -> FieldsMatch {
    return std::move(*this).equals(std::move(value));
}

auto IncompleteFieldsMatch::neq(Value value) && -> FieldsMatch {
    return std::move(*this).not_equals(std::move(value));
}

auto IncompleteFieldsMatch::lt(Value value) && -> FieldsMatch {
    return std::move(*this).less_than(std::move(value));
}

auto IncompleteFieldsMatch::le(Value value) && -> FieldsMatch {
    return std::move(*this).less_or_equal(std::move(value));
}

auto IncompleteFieldsMatch::gt(Value value) && -> FieldsMatch {
    return std::move(*this).greater_than(std::move(value));
}

auto IncompleteFieldsMatch::ge(Value value) && -> FieldsMatch {
    return std::move(*this).greater_or_equal(std::move(value));
}

auto FieldsMatch::evaluate(const Record& record) const -> std::expected<bool, Error> {
    for (const auto& condition : conditions_) {
        auto resolved = runtime::resolve(record, condition.field);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        auto result = runtime::compare(*resolved, condition.op, condition.operand);
        if (!result) {
            return std::unexpected(Error{
                .code = result.error().code,
                .message = fmt::format("{} {}: {}", condition.field.to_string(),
                                       runtime::to_string(condition.op), result.error().message),
            });
        }
        if (!*result) {
            return false;
        }
    }
    return true;
}

auto FieldsMatch::matches(const Record& record) const -> bool {
    auto result = evaluate(record);
    if (!result) {
        throw_error(result.error());
    }
    return *result;
}

}  // namespace sift::match
