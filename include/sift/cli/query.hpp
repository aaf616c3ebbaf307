#pragma once

#include <sift/core/schema.hpp>
#include <sift/match/fields_match.hpp>
#include <sift/runtime/compare.hpp>

#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sift::cli {

/// Options of a sift_query run.
struct QueryConfig {
    bool verbose = false;
    std::string csv_path;
    /// Schema name given to the records loaded from the CSV file.
    std::string schema_name = "Row";
    /// Conditions a record must all satisfy to be kept.
    std::vector<std::string> where;
    /// Conditions that each drop the records they match.
    std::vector<std::string> exclude;
    /// Fields to keep on every output record; empty keeps all.
    std::vector<std::string> pick;
    /// When set, print this field's values instead of the table.
    std::string pluck;
    /// When set, print group keys and sizes for this field.
    std::string group_by;
};

/// A condition as written on the command line, before typing its operands.
struct ConditionText {
    std::string field;
    runtime::Comparison op = runtime::Comparison::Equals;
    std::vector<std::string> operands;
};

/// Parse `field op value`, `field in a|b|c`, `field notin a|b` or `field?`.
[[nodiscard]] auto parse_condition(std::string_view text) -> std::expected<ConditionText, std::string>;

/// Type the operands against `schema` and chain the conditions into one FieldsMatch.
[[nodiscard]] auto build_match(const std::vector<ConditionText>& conditions, const Schema& schema)
    -> std::expected<match::FieldsMatch, std::string>;

/// Load, filter, reshape and print according to `config`.
[[nodiscard]] auto run_query(const QueryConfig& config, std::ostream& out)
    -> std::expected<void, std::string>;

}  // namespace sift::cli
