#include <sift/match/predicate.hpp>

namespace sift::match {

auto Predicate::negate() const -> Predicate {
    if (const auto* negation = std::get_if<Not>(&node_)) {
        return *negation->operand;
    }
    return Predicate(Not{.operand = std::make_shared<const Predicate>(*this)});
}

auto Predicate::evaluate(const Record& record) const -> std::expected<bool, Error> {
    return std::visit(
        [&record](const auto& node) -> std::expected<bool, Error> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Not>) {
                auto inner = node.operand->evaluate(record);
                if (!inner) {
                    return std::unexpected(inner.error());
                }
                return !*inner;
            } else {
                return node.evaluate(record);
            }
        },
        node_);
}

auto Predicate::matches(const Record& record) const -> bool {
    auto result = evaluate(record);
    if (!result) {
        throw_error(result.error());
    }
    return *result;
}

}  // namespace sift::match
