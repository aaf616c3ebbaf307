#pragma once

#include <sift/core/value.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace sift::io {

/// Parse YYYY-MM-DD.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Parse "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS" (UTC).
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

/// Parse `text` as a literal of `kind`. "null" yields a null value.
[[nodiscard]] auto parse_value(std::string_view text, ValueKind kind)
    -> std::expected<Value, std::string>;

}  // namespace sift::io
