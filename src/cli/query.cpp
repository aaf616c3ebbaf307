#include <sift/cli/query.hpp>
#include <sift/io/csv.hpp>
#include <sift/io/parse.hpp>
#include <sift/io/print.hpp>
#include <sift/match/predicate.hpp>
#include <sift/view/collection.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <utility>

namespace sift::cli {

namespace {

using runtime::Comparison;

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

auto split_operands(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        auto bar = text.find('|', start);
        auto item = trim(text.substr(start, bar == std::string_view::npos ? text.size() - start
                                                                           : bar - start));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (bar == std::string_view::npos) {
            break;
        }
        start = bar + 1;
    }
    return out;
}

struct OpToken {
    std::string_view text;
    Comparison op;
};

// Two-character operators first so "<=" is not read as "<".
constexpr std::array<OpToken, 6> kSymbolOps{{
    {"==", Comparison::Equals},
    {"!=", Comparison::NotEquals},
    {"<=", Comparison::LessOrEqual},
    {">=", Comparison::GreaterOrEqual},
    {"<", Comparison::LessThan},
    {">", Comparison::GreaterThan},
}};

constexpr std::array<OpToken, 2> kWordOps{{
    {" notin ", Comparison::IsNotIn},
    {" in ", Comparison::IsIn},
}};

auto complete(match::IncompleteFieldsMatch pending, Comparison op, Value value,
              runtime::ValueSet set) -> match::FieldsMatch {
    switch (op) {
        case Comparison::Equals:
            return std::move(pending).equals(std::move(value));
        case Comparison::NotEquals:
            return std::move(pending).not_equals(std::move(value));
        case Comparison::LessThan:
            return std::move(pending).less_than(std::move(value));
        case Comparison::LessOrEqual:
            return std::move(pending).less_or_equal(std::move(value));
        case Comparison::GreaterThan:
            return std::move(pending).greater_than(std::move(value));
        case Comparison::GreaterOrEqual:
            return std::move(pending).greater_or_equal(std::move(value));
        case Comparison::IsIn:
            return std::move(pending).is_in(std::move(set));
        case Comparison::IsNotIn:
            return std::move(pending).is_not_in(std::move(set));
        case Comparison::HasValue:
            break;
    }
    return std::move(pending).has_value();
}

auto load_filter(const std::vector<std::string>& texts, const Schema& schema)
    -> std::expected<std::optional<match::FieldsMatch>, std::string> {
    if (texts.empty()) {
        return std::optional<match::FieldsMatch>{};
    }
    std::vector<ConditionText> conditions;
    for (const auto& text : texts) {
        auto parsed = parse_condition(text);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        conditions.push_back(std::move(*parsed));
    }
    auto built = build_match(conditions, schema);
    if (!built) {
        return std::unexpected(built.error());
    }
    return std::optional<match::FieldsMatch>{std::move(*built)};
}

void print_values(const std::vector<Value>& values, std::ostream& out) {
    for (const auto& v : values) {
        out << format_value(v) << "\n";
    }
}

void print_groups(const view::Groups& groups, std::ostream& out) {
    for (const auto& entry : groups) {
        out << fmt::format("{}\t{}\n", format_value(entry.key), entry.records.size());
    }
}

}  // namespace

auto parse_condition(std::string_view text) -> std::expected<ConditionText, std::string> {
    const auto cond = trim(text);
    if (cond.empty()) {
        return std::unexpected("empty condition");
    }
    const auto pos = cond.find_first_of("=!<>");

    // A word operator counts only when it precedes any symbol operator.
    for (const auto& token : kWordOps) {
        auto word = cond.find(token.text);
        if (word == std::string_view::npos || (pos != std::string_view::npos && pos < word)) {
            continue;
        }
        auto field = trim(cond.substr(0, word));
        if (field.empty()) {
            return std::unexpected(fmt::format("condition '{}' has no field", cond));
        }
        return ConditionText{.field = std::string(field),
                             .op = token.op,
                             .operands = split_operands(cond.substr(word + token.text.size()))};
    }

    if (pos == std::string_view::npos) {
        if (cond.back() == '?') {
            auto field = trim(cond.substr(0, cond.size() - 1));
            if (field.empty()) {
                return std::unexpected(fmt::format("condition '{}' has no field", cond));
            }
            return ConditionText{
                .field = std::string(field), .op = Comparison::HasValue, .operands = {}};
        }
        return std::unexpected(fmt::format("condition '{}' has no operator", cond));
    }
    for (const auto& token : kSymbolOps) {
        if (cond.substr(pos, token.text.size()) != token.text) {
            continue;
        }
        auto field = trim(cond.substr(0, pos));
        auto operand = trim(cond.substr(pos + token.text.size()));
        if (field.empty() || operand.empty()) {
            return std::unexpected(fmt::format("condition '{}' is incomplete", cond));
        }
        return ConditionText{
            .field = std::string(field), .op = token.op, .operands = {std::string(operand)}};
    }
    return std::unexpected(fmt::format("condition '{}' has an unknown operator", cond));
}

auto build_match(const std::vector<ConditionText>& conditions, const Schema& schema)
    -> std::expected<match::FieldsMatch, std::string> {
    std::optional<match::FieldsMatch> result;
    for (const auto& cond : conditions) {
        const FieldDef* def = schema.find_field(cond.field);
        if (def == nullptr || def->is_relation()) {
            return std::unexpected(
                fmt::format("{} has no field '{}'", schema.name(), cond.field));
        }

        Value value;
        std::vector<Value> members;
        const bool is_set = cond.op == Comparison::IsIn || cond.op == Comparison::IsNotIn;
        if (cond.op != Comparison::HasValue) {
            for (const auto& text : cond.operands) {
                auto parsed = io::parse_value(text, def->kind);
                if (!parsed) {
                    return std::unexpected(fmt::format("{}: {}", cond.field, parsed.error()));
                }
                members.push_back(std::move(*parsed));
            }
            if (!is_set) {
                if (members.size() != 1) {
                    return std::unexpected(
                        fmt::format("{}: expected exactly one operand", cond.field));
                }
                value = std::move(members.front());
                members.clear();
            }
        }

        auto pending = result ? result->also(cond.field) : match::field(cond.field);
        result.emplace(complete(std::move(pending), cond.op, std::move(value),
                                runtime::ValueSet(std::move(members))));
    }
    if (!result) {
        return std::unexpected("no conditions given");
    }
    return std::move(*result);
}

auto run_query(const QueryConfig& config, std::ostream& out) -> std::expected<void, std::string> {
    auto loaded = io::read_csv(config.csv_path, config.schema_name);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    spdlog::debug("loaded {} {} records from {}", loaded->records.size(), config.schema_name,
                  config.csv_path);
    const Schema& schema = *loaded->schema;

    auto where = load_filter(config.where, schema);
    if (!where) {
        return std::unexpected(where.error());
    }
    std::vector<match::FieldsMatch> excludes;
    for (const auto& text : config.exclude) {
        auto one = load_filter({text}, schema);
        if (!one) {
            return std::unexpected(one.error());
        }
        excludes.push_back(std::move(**one));
    }

    try {
        auto current = view::Collection::of(std::move(loaded->records), loaded->schema);
        if (*where) {
            current = current.filter(**where);
        }
        for (const auto& exclude : excludes) {
            current = current.remove(exclude);
        }
        if (!config.pick.empty()) {
            current = current.pick(config.pick);
        }

        if (!config.pluck.empty()) {
            print_values(current.pluck(config.pluck), out);
        } else if (!config.group_by.empty()) {
            print_groups(current.group_by(config.group_by), out);
        } else {
            io::print(current, out);
        }
    } catch (const SiftError& e) {
        return std::unexpected(std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return std::unexpected(std::string(e.what()));
    }
    return {};
}

}  // namespace sift::cli
