#include <sift/io/csv.hpp>
#include <sift/io/parse.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string_view>

namespace sift::io {

namespace {

// Comma-separated cells of one line; n commas give n + 1 cells.
auto split_cells(std::string_view line) -> std::vector<std::string> {
    std::vector<std::string> cells;
    if (line.empty()) {
        return cells;
    }
    std::size_t start = 0;
    for (;;) {
        const std::size_t comma = line.find(',', start);
        cells.emplace_back(line.substr(start, comma - start));
        if (comma == std::string_view::npos) {
            return cells;
        }
        start = comma + 1;
    }
}

// Next line without its LF or CRLF terminator; false at end of input.
auto read_line(std::istream& input, std::string& line) -> bool {
    if (!std::getline(input, line)) {
        return false;
    }
    if (line.ends_with('\r')) {
        line.pop_back();
    }
    return true;
}

// Most specific kind that accepts every non-empty cell; Text otherwise.
auto infer_kind(const std::vector<std::string>& cells) -> ValueKind {
    constexpr std::array<ValueKind, 4> kCandidates{ValueKind::Numeric, ValueKind::Boolean,
                                                   ValueKind::Datetime, ValueKind::Date};
    for (ValueKind kind : kCandidates) {
        bool all = true;
        bool any = false;
        for (const auto& cell : cells) {
            if (cell.empty()) {
                continue;
            }
            any = true;
            auto parsed = parse_value(cell, kind);
            if (!parsed || parsed->is_null()) {
                all = false;
                break;
            }
        }
        if (all && any) {
            return kind;
        }
    }
    return ValueKind::Text;
}

}  // namespace

auto parse_csv(std::istream& input, std::string schema_name)
    -> std::expected<CsvRecords, std::string> {
    std::string header_line;
    if (!read_line(input, header_line)) {
        return std::unexpected("csv is empty");
    }

    auto headers = split_cells(header_line);
    if (headers.empty()) {
        return std::unexpected("csv has no headers");
    }

    std::vector<std::vector<std::string>> columns(headers.size());
    std::string line;
    while (read_line(input, line)) {
        if (line.empty()) {
            continue;
        }
        auto fields = split_cells(line);
        if (fields.size() != headers.size()) {
            return std::unexpected("csv row has wrong number of columns");
        }
        for (std::size_t i = 0; i < fields.size(); ++i) {
            columns[i].push_back(std::move(fields[i]));
        }
    }

    Schema::Builder builder(std::move(schema_name));
    std::vector<ValueKind> kinds;
    kinds.reserve(headers.size());
    for (std::size_t i = 0; i < headers.size(); ++i) {
        kinds.push_back(infer_kind(columns[i]));
        spdlog::debug("csv: column '{}' inferred as {}", headers[i], kind_name(kinds.back()));
        builder.field(headers[i], kinds.back());
    }

    CsvRecords out;
    try {
        out.schema = builder.build();
    } catch (const std::invalid_argument& e) {
        return std::unexpected(std::string(e.what()));
    }

    const std::size_t rows = columns.front().size();
    out.records.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        auto record = std::make_shared<Record>(out.schema);
        for (std::size_t c = 0; c < headers.size(); ++c) {
            const auto& cell = columns[c][r];
            if (cell.empty()) {
                record->set(headers[c], Value{});
                continue;
            }
            auto value = parse_value(cell, kinds[c]);
            if (!value) {
                return std::unexpected(fmt::format("row {}: {}", r + 1, value.error()));
            }
            record->set(headers[c], std::move(*value));
        }
        out.records.push_back(std::move(record));
    }
    return out;
}

auto read_csv(std::string_view path, std::string schema_name)
    -> std::expected<CsvRecords, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected("failed to open csv: " + std::string(path));
    }
    return parse_csv(input, std::move(schema_name));
}

}  // namespace sift::io
