#pragma once

#include <sift/core/record.hpp>
#include <sift/core/schema.hpp>

#include <expected>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace sift::io {

/// Records loaded from a CSV file together with the inferred schema.
struct CsvRecords {
    SchemaPtr schema;
    std::vector<RecordPtr> records;
};

/// Simple CSV reader (comma-separated, header line, no quotes/escapes).
///
/// Column kinds are inferred from the non-empty cells: Numeric, Boolean,
/// Datetime, Date, then Text. Empty cells load as null; every field of every
/// record is loaded.
[[nodiscard]] auto read_csv(std::string_view path, std::string schema_name = "Row")
    -> std::expected<CsvRecords, std::string>;

/// Same as read_csv, reading from an open stream.
[[nodiscard]] auto parse_csv(std::istream& input, std::string schema_name = "Row")
    -> std::expected<CsvRecords, std::string>;

}  // namespace sift::io
