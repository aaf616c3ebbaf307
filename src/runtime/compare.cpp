#include <sift/runtime/compare.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <compare>

namespace sift::runtime {

struct ValueSet::Index {
    robin_hood::unordered_flat_set<Value, ValueHash, ValueEq> members;
};

namespace {

auto unsupported(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.code = ErrorCode::UnsupportedComparisonType, .message = std::move(message)});
}

// Three-way comparison of two non-null values of one orderable kind.
auto order(const Value& lhs, const Value& rhs, ValueKind kind) -> std::partial_ordering {
    switch (kind) {
        case ValueKind::Numeric:
            return compare_numeric(lhs, rhs);
        case ValueKind::Date:
            return *lhs.get_if<Date>() <=> *rhs.get_if<Date>();
        case ValueKind::Datetime:
            return *lhs.get_if<Timestamp>() <=> *rhs.get_if<Timestamp>();
        case ValueKind::Text:
            return lhs.get_if<std::string>()->compare(*rhs.get_if<std::string>()) <=> 0;
        default:
            return std::partial_ordering::unordered;
    }
}

auto compare_ordering(const FieldValue& field, Comparison op, const Value& operand)
    -> std::expected<bool, Error> {
    std::optional<ValueKind> kind = field.declared ? field.declared : field.value.kind();
    const std::optional<ValueKind> operand_kind = operand.kind();
    if (!kind) {
        kind = operand_kind;
    }
    if (kind && !is_orderable(*kind)) {
        return unsupported(
            fmt::format("{} values cannot be ordered with '{}'", kind_name(*kind), to_string(op)));
    }
    if (kind && operand_kind && *operand_kind != *kind) {
        return unsupported(fmt::format("cannot order a {} field against a {} value",
                                       kind_name(*kind), kind_name(*operand_kind)));
    }
    if (field.value.is_null() || operand.is_null()) {
        return false;
    }

    const auto cmp = order(field.value, operand, *kind);
    switch (op) {
        case Comparison::LessThan:
            return cmp < 0;
        case Comparison::LessOrEqual:
            return cmp <= 0;
        case Comparison::GreaterThan:
            return cmp > 0;
        case Comparison::GreaterOrEqual:
            return cmp >= 0;
        default:
            return false;
    }
}

}  // namespace

auto to_string(Comparison op) -> std::string_view {
    switch (op) {
        case Comparison::Equals:
            return "==";
        case Comparison::NotEquals:
            return "!=";
        case Comparison::LessThan:
            return "<";
        case Comparison::LessOrEqual:
            return "<=";
        case Comparison::GreaterThan:
            return ">";
        case Comparison::GreaterOrEqual:
            return ">=";
        case Comparison::IsIn:
            return "in";
        case Comparison::IsNotIn:
            return "notin";
        case Comparison::HasValue:
            return "has value";
    }
    return "?";
}

ValueSet::ValueSet(std::vector<Value> values) {
    auto index = std::make_shared<Index>();
    index->members.reserve(values.size());
    values_.reserve(values.size());
    for (auto& v : values) {
        if (index->members.insert(v).second) {
            values_.push_back(std::move(v));
        }
    }
    index_ = std::move(index);
}

auto ValueSet::element_kind() const -> std::expected<std::optional<ValueKind>, Error> {
    std::optional<ValueKind> common;
    for (const auto& v : values_) {
        const auto kind = v.kind();
        if (!kind) {
            return unsupported("membership sets may not contain null");
        }
        if (!is_set_element_kind(*kind)) {
            return unsupported(
                fmt::format("membership sets of {} values are not supported", kind_name(*kind)));
        }
        if (common && *common != *kind) {
            return unsupported(fmt::format("membership set mixes {} and {} values",
                                           kind_name(*common), kind_name(*kind)));
        }
        common = kind;
    }
    return common;
}

auto ValueSet::contains(const Value& value) const -> bool {
    return index_->members.find(value) != index_->members.end();
}

auto compare(const FieldValue& field, Comparison op, const Operand& operand)
    -> std::expected<bool, Error> {
    switch (op) {
        case Comparison::HasValue:
            return !field.value.is_null();
        case Comparison::IsIn:
        case Comparison::IsNotIn: {
            const auto* set = std::get_if<ValueSet>(&operand);
            if (set == nullptr) {
                return unsupported(fmt::format("'{}' needs a set operand", to_string(op)));
            }
            auto kind = set->element_kind();
            if (!kind) {
                return std::unexpected(kind.error());
            }
            const bool found = !field.value.is_null() && set->contains(field.value);
            return op == Comparison::IsIn ? found : !found;
        }
        default:
            break;
    }

    const auto* value = std::get_if<Value>(&operand);
    if (value == nullptr) {
        return unsupported(fmt::format("'{}' needs a single value operand", to_string(op)));
    }
    if (op == Comparison::Equals) {
        return values_equal(field.value, *value);
    }
    if (op == Comparison::NotEquals) {
        return !values_equal(field.value, *value);
    }
    return compare_ordering(field, op, *value);
}

}  // namespace sift::runtime
