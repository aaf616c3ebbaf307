#include <sift/io/parse.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstdlib>

namespace sift::io {

namespace {

auto parse_int(std::string_view text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto parse_double(std::string_view text, double& out) -> bool {
    std::string owned(text);
    char* end = nullptr;
    out = std::strtod(owned.c_str(), &end);
    return !owned.empty() && end != owned.c_str() && *end == '\0';
}

// Fixed-width unsigned field, e.g. the "08" in "2024-08-01".
auto parse_fixed(std::string_view text, std::size_t pos, std::size_t width, int& out) -> bool {
    if (pos + width > text.size()) {
        return false;
    }
    auto field = text.substr(pos, width);
    auto result = std::from_chars(field.data(), field.data() + field.size(), out);
    return result.ec == std::errc() && result.ptr == field.data() + field.size();
}

}  // namespace

auto parse_date(std::string_view text) -> std::optional<Date> {
    using namespace std::chrono;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parse_fixed(text, 0, 4, y) || !parse_fixed(text, 5, 2, m) ||
        !parse_fixed(text, 8, 2, d)) {
        return std::nullopt;
    }
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(sys_days{ymd}.time_since_epoch().count())};
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    using namespace std::chrono;
    if (text.size() != 19 || (text[10] != ' ' && text[10] != 'T') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    auto date = parse_date(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!parse_fixed(text, 11, 2, hh) || !parse_fixed(text, 14, 2, mm) ||
        !parse_fixed(text, 17, 2, ss) || hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    auto tp = sys_days{days{date->days}} + hours{hh} + minutes{mm} + seconds{ss};
    return Timestamp{duration_cast<nanoseconds>(tp.time_since_epoch()).count()};
}

auto parse_value(std::string_view text, ValueKind kind) -> std::expected<Value, std::string> {
    if (text == "null") {
        return Value{};
    }
    switch (kind) {
        case ValueKind::Boolean:
            if (text == "true") {
                return Value{true};
            }
            if (text == "false") {
                return Value{false};
            }
            break;
        case ValueKind::Numeric: {
            std::int64_t i = 0;
            if (parse_int(text, i)) {
                return Value{i};
            }
            double d = 0.0;
            if (parse_double(text, d)) {
                return Value{d};
            }
            break;
        }
        case ValueKind::Date:
            if (auto date = parse_date(text)) {
                return Value{*date};
            }
            break;
        case ValueKind::Datetime:
            if (auto ts = parse_timestamp(text)) {
                return Value{*ts};
            }
            break;
        case ValueKind::Identifier:
            return Value{Id{std::string(text)}};
        case ValueKind::Text:
            return Value{std::string(text)};
        case ValueKind::Blob:
            return std::unexpected("blob literals are not supported");
    }
    return std::unexpected(fmt::format("'{}' is not a valid {} literal", text, kind_name(kind)));
}

}  // namespace sift::io
