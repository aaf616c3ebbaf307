#include <sift/core/value.hpp>

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cmath>
#include <compare>
#include <functional>

namespace sift {

namespace {

using CoercionRow = std::array<bool, kValueKindCount>;

constexpr auto kind_index(ValueKind kind) -> std::size_t {
    return static_cast<std::size_t>(kind);
}

// Rows are the source kind, columns the target kind, both in ValueKind order:
// Boolean, Date, Datetime, Numeric, Identifier, Text, Blob.
constexpr std::array<CoercionRow, kValueKindCount> kCoercion{{
    {true, false, false, false, false, false, false},
    {false, true, false, false, false, false, false},
    {false, false, true, false, false, false, false},
    {false, false, false, true, false, false, false},
    {false, false, false, false, true, true, false},
    {false, false, false, false, true, true, false},
    {false, false, false, false, false, false, true},
}};

auto text_of(const Value& value) -> std::string_view {
    if (const auto* id = value.get_if<Id>()) {
        return id->value;
    }
    if (const auto* s = value.get_if<std::string>()) {
        return *s;
    }
    return {};
}

// 2^63 as a double; every int64 lies in [-2^63, 2^63).
constexpr double kInt64Bound = 9223372036854775808.0;

auto compare_int_double(std::int64_t i, double d) noexcept -> std::partial_ordering {
    if (std::isnan(d)) {
        return std::partial_ordering::unordered;
    }
    if (d >= kInt64Bound) {
        return std::partial_ordering::less;
    }
    if (d < -kInt64Bound) {
        return std::partial_ordering::greater;
    }
    const double whole = std::trunc(d);
    const auto whole_int = static_cast<std::int64_t>(whole);
    if (i != whole_int) {
        return i <=> whole_int;
    }
    // Same integral part; the fraction decides.
    return 0.0 <=> d - whole;
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

}  // namespace

auto Value::kind() const noexcept -> std::optional<ValueKind> {
    return std::visit(
        [](const auto& v) -> std::optional<ValueKind> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, bool>) {
                return ValueKind::Boolean;
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                return ValueKind::Numeric;
            } else if constexpr (std::is_same_v<T, Date>) {
                return ValueKind::Date;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return ValueKind::Datetime;
            } else if constexpr (std::is_same_v<T, Id>) {
                return ValueKind::Identifier;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ValueKind::Text;
            } else {
                return ValueKind::Blob;
            }
        },
        data_);
}

auto Value::as_double() const noexcept -> std::optional<double> {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&data_)) {
        return *d;
    }
    return std::nullopt;
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    return values_equal(lhs, rhs);
}

auto kind_name(ValueKind kind) -> std::string_view {
    switch (kind) {
        case ValueKind::Boolean:
            return "Boolean";
        case ValueKind::Date:
            return "Date";
        case ValueKind::Datetime:
            return "Datetime";
        case ValueKind::Numeric:
            return "Numeric";
        case ValueKind::Identifier:
            return "Identifier";
        case ValueKind::Text:
            return "Text";
        case ValueKind::Blob:
            return "Blob";
    }
    return "?";
}

auto can_coerce(ValueKind from, ValueKind to) noexcept -> bool {
    return kCoercion[kind_index(from)][kind_index(to)];
}

auto values_equal(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.is_null() || rhs.is_null()) {
        return lhs.is_null() && rhs.is_null();
    }
    const ValueKind lk = *lhs.kind();
    const ValueKind rk = *rhs.kind();
    if (!can_coerce(lk, rk)) {
        return false;
    }
    switch (lk) {
        case ValueKind::Numeric:
            return compare_numeric(lhs, rhs) == 0;
        case ValueKind::Identifier:
        case ValueKind::Text:
            return text_of(lhs) == text_of(rhs);
        default:
            return lhs.storage() == rhs.storage();
    }
}

auto compare_numeric(const Value& lhs, const Value& rhs) noexcept -> std::partial_ordering {
    const auto* li = lhs.get_if<std::int64_t>();
    const auto* ri = rhs.get_if<std::int64_t>();
    const auto* ld = lhs.get_if<double>();
    const auto* rd = rhs.get_if<double>();
    if (li != nullptr && ri != nullptr) {
        return *li <=> *ri;
    }
    if (li != nullptr && rd != nullptr) {
        return compare_int_double(*li, *rd);
    }
    if (ld != nullptr && ri != nullptr) {
        return 0 <=> compare_int_double(*ri, *ld);
    }
    if (ld != nullptr && rd != nullptr) {
        return *ld <=> *rd;
    }
    return std::partial_ordering::unordered;
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, Id>) {
                return v.value;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("<blob {} bytes>", v.bytes.size());
            }
        },
        value.storage());
}

auto ValueHash::operator()(const Value& value) const noexcept -> std::size_t {
    // Numeric values hash through double and Identifier/Text through their
    // characters so that values_equal(a, b) implies equal hashes.
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return 0x9e3779b97f4a7c15ULL;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::hash<double>{}(static_cast<double>(v));
            } else if constexpr (std::is_same_v<T, Id>) {
                return std::hash<std::string_view>{}(v.value);
            } else if constexpr (std::is_same_v<T, Blob>) {
                return std::hash<std::string_view>{}(std::string_view(
                    reinterpret_cast<const char*>(v.bytes.data()), v.bytes.size()));
            } else {
                return std::hash<T>{}(v);
            }
        },
        value.storage());
}

}  // namespace sift
