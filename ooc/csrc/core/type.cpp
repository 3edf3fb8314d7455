#include "ooc/core/type.hpp"
#include "ooc/core/error.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace ooc {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) return false;
    }
    return true;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') return std::nullopt;
    }
    if (text.empty()) return std::nullopt;

    std::int64_t out = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return out;
}

std::optional<double> parse_float(std::string_view text) {
    std::string_view body = text;
    bool negative = false;
    if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    if (body.empty()) return std::nullopt;

    if (equals_ignore_case(body, "inf") || equals_ignore_case(body, "infinity")) {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    if (equals_ignore_case(body, "nan")) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // Only plain decimal/scientific text; strtod would also take hex.
    for (char c : body) {
        bool ok = (c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' ||
                  c == '+' || c == '-';
        if (!ok) return std::nullopt;
    }

    std::string buf(text);
    char* end = nullptr;
    double out = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) return std::nullopt;
    return out;
}

} // namespace

// =============================================================================
// Column Types
// =============================================================================

const char* type_name(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Integer:     return "integer";
        case ColumnType::Float:       return "float";
        case ColumnType::String:      return "string";
        case ColumnType::Categorical: return "categorical";
        case ColumnType::Date:        return "date";
        default:                      return "unknown";
    }
}

ColumnType parse_type_name(std::string_view name) {
    if (name == "integer") return ColumnType::Integer;
    if (name == "float") return ColumnType::Float;
    if (name == "string") return ColumnType::String;
    if (name == "categorical") return ColumnType::Categorical;
    if (name == "date") return ColumnType::Date;
    throw ValueError("Unknown column type name: '" + std::string(name) + "'");
}

// =============================================================================
// Date
// =============================================================================

std::optional<Date> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto digits = [&](std::size_t pos, std::size_t len) -> std::optional<int> {
        int v = 0;
        auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, v);
        if (ec != std::errc() || ptr != text.data() + pos + len) return std::nullopt;
        return v;
    };
    auto y = digits(0, 4);
    auto m = digits(5, 2);
    auto d = digits(8, 2);
    if (!y || !m || !d) return std::nullopt;

    std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;

    auto days = std::chrono::sys_days{ymd}.time_since_epoch().count();
    return Date{static_cast<std::int32_t>(days)};
}

std::string format_date(Date date) {
    std::chrono::year_month_day ymd{std::chrono::sys_days{std::chrono::days{date.days}}};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

// =============================================================================
// Values
// =============================================================================

std::optional<Value> parse_value(std::string_view text, ColumnType type) {
    if (text.empty()) return Value{};

    switch (type) {
        case ColumnType::Integer: {
            auto v = parse_integer(text);
            if (!v) return std::nullopt;
            return Value{*v};
        }
        case ColumnType::Float: {
            auto v = parse_float(text);
            if (!v) return std::nullopt;
            return Value{*v};
        }
        case ColumnType::Date: {
            auto v = parse_date(text);
            if (!v) return std::nullopt;
            return Value{*v};
        }
        case ColumnType::String:
        case ColumnType::Categorical:
            return Value{std::string(text)};
    }
    return std::nullopt;
}

std::string format_value(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) {
        return {};
    }
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return std::to_string(*i);
    }
    if (const auto* f = std::get_if<double>(&v)) {
        if (std::isnan(*f)) return "nan";
        if (std::isinf(*f)) return *f > 0 ? "inf" : "-inf";
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *f);
        if (ec != std::errc()) {
            std::snprintf(buf, sizeof(buf), "%.17g", *f);
            return buf;
        }
        return std::string(buf, ptr);
    }
    if (const auto* d = std::get_if<Date>(&v)) {
        return format_date(*d);
    }
    return std::get<std::string>(v);
}

std::size_t estimate_bytes(const Value& v) noexcept {
    if (const auto* s = std::get_if<std::string>(&v)) {
        return s->size() + 32;
    }
    return 8;
}

std::size_t estimate_bytes(const Row& row) noexcept {
    std::size_t total = kRowOverheadBytes;
    for (const auto& v : row) {
        total += estimate_bytes(v);
    }
    return total;
}

// =============================================================================
// Join Keys
// =============================================================================

std::size_t KeyHash::operator()(const Value& v) const noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return std::hash<double>{}(static_cast<double>(*i));
    }
    if (const auto* f = std::get_if<double>(&v)) {
        return std::hash<double>{}(*f);
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        return std::hash<std::string>{}(*s);
    }
    if (const auto* d = std::get_if<Date>(&v)) {
        return std::hash<std::int32_t>{}(d->days);
    }
    return 0;
}

bool KeyEqual::operator()(const Value& a, const Value& b) const noexcept {
    const auto* ai = std::get_if<std::int64_t>(&a);
    const auto* bi = std::get_if<std::int64_t>(&b);
    if (ai && bi) return *ai == *bi;

    const auto* af = std::get_if<double>(&a);
    const auto* bf = std::get_if<double>(&b);
    if ((ai || af) && (bi || bf)) {
        double x = ai ? static_cast<double>(*ai) : *af;
        double y = bi ? static_cast<double>(*bi) : *bf;
        return x == y;
    }
    return a == b;
}

} // namespace ooc
