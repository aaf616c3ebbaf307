#include <sift/io/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>

namespace sift::io {

namespace {

auto format_cell(const Record& record, const FieldDef& def) -> std::string {
    if (!record.is_loaded(def.name)) {
        return {};
    }
    if (def.is_relation()) {
        auto related = record.related(def.name);
        if (!related || *related == nullptr) {
            return "null";
        }
        return fmt::format("<{}>", (*related)->schema()->name());
    }
    auto value = record.get(def.name);
    return value ? format_value(*value) : std::string{};
}

using Row = std::vector<std::string>;

void emit(const Row& row, const std::vector<std::size_t>& widths, std::ostream& out) {
    std::string line;
    for (std::size_t c = 0; c < row.size(); ++c) {
        fmt::format_to(std::back_inserter(line), "{}{:<{}}", c > 0 ? "  " : "", row[c], widths[c]);
    }
    out << line << '\n';
}

}  // namespace

void print(const view::Collection& collection, std::ostream& out) {
    if (collection.empty()) {
        out << "(empty collection)\n";
        return;
    }
    const SchemaPtr& schema =
        collection.schema() != nullptr ? collection.schema() : collection.at(0)->schema();
    const auto& fields = schema->fields();

    // table[0] holds the field names; a dashed rule is inserted after it once widths are known.
    std::vector<Row> table;
    table.reserve(collection.size() + 2);
    auto& names = table.emplace_back();
    for (const auto& def : fields) {
        names.push_back(def.name);
    }
    for (const auto& record : collection) {
        auto& row = table.emplace_back();
        row.reserve(fields.size());
        for (const auto& def : fields) {
            const FieldDef* own = record->schema()->find_field(def.name);
            row.push_back(own != nullptr ? format_cell(*record, *own) : std::string{});
        }
    }

    std::vector<std::size_t> widths(fields.size(), 0);
    for (const auto& row : table) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }
    Row rule;
    for (std::size_t width : widths) {
        rule.emplace_back(width, '-');
    }
    table.insert(table.begin() + 1, std::move(rule));

    for (const auto& row : table) {
        emit(row, widths, out);
    }
}

}  // namespace sift::io
