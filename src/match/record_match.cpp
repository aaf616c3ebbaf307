#include <sift/match/record_match.hpp>

#include <robin_hood.h>

#include <functional>
#include <stdexcept>
#include <utility>

namespace sift::match {

namespace {

using RecordPair = std::pair<const Record*, const Record*>;

struct RecordPairHash {
    auto operator()(const RecordPair& pair) const noexcept -> std::size_t {
        const auto h1 = std::hash<const Record*>{}(pair.first);
        const auto h2 = std::hash<const Record*>{}(pair.second);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// (prototype, target) pairs entered so far during one evaluation.
using Visited = robin_hood::unordered_flat_set<RecordPair, RecordPairHash>;

auto match_fields(const Record& prototype, const Record& target, Visited& visited)
    -> std::expected<bool, Error> {
    // A repeated pair is still being matched higher up a relation cycle, or has matched.
    if (!visited.insert(RecordPair{&prototype, &target}).second) {
        return true;
    }
    for (const FieldDef* def : prototype.populated_fields()) {
        if (def->is_relation()) {
            auto expected_rel = prototype.related(def->name);
            if (!expected_rel) {
                return std::unexpected(expected_rel.error());
            }
            auto actual_rel = target.related(def->name);
            if (!actual_rel) {
                return std::unexpected(actual_rel.error());
            }
            if (*expected_rel == nullptr || *actual_rel == nullptr) {
                if (*expected_rel != *actual_rel) {
                    return false;
                }
                continue;
            }
            auto nested = match_fields(**expected_rel, **actual_rel, visited);
            if (!nested || !*nested) {
                return nested;
            }
            continue;
        }

        auto expected_value = prototype.get(def->name);
        if (!expected_value) {
            return std::unexpected(expected_value.error());
        }
        auto actual_value = target.get(def->name);
        if (!actual_value) {
            return std::unexpected(actual_value.error());
        }
        if (!values_equal(*expected_value, *actual_value)) {
            return false;
        }
    }
    return true;
}

}  // namespace

RecordMatch::RecordMatch(RecordPtr prototype) : prototype_(std::move(prototype)) {
    if (prototype_ == nullptr) {
        throw std::invalid_argument("record match requires a prototype");
    }
}

auto RecordMatch::evaluate(const Record& record) const -> std::expected<bool, Error> {
    Visited visited;
    return match_fields(*prototype_, record, visited);
}

auto RecordMatch::matches(const Record& record) const -> bool {
    auto result = evaluate(record);
    if (!result) {
        throw_error(result.error());
    }
    return *result;
}

}  // namespace sift::match
