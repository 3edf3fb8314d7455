#pragma once

#include "ooc/config.hpp"
#include "ooc/core/macros.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// =============================================================================
// FILE: ooc/core/type.hpp
// BRIEF: Column types, cell values and field parsing
// =============================================================================

namespace ooc {

// =============================================================================
// SECTION 1: Column Types
// =============================================================================

enum class ColumnType : std::uint32_t {
    Integer = 0,
    Float = 1,
    String = 2,
    Categorical = 3,
    Date = 4
};

inline constexpr std::uint32_t kColumnTypeCount = 5;

/// Canonical lowercase name ("integer", "float", ...)
const char* type_name(ColumnType type) noexcept;

/// Inverse of type_name. Throws ValueError on an unknown name.
ColumnType parse_type_name(std::string_view name);

/// Numeric (integer/float), Text (string/categorical) or Date.
enum class KeyClass {
    Numeric,
    Text,
    Date
};

constexpr KeyClass key_class(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Integer:
        case ColumnType::Float:
            return KeyClass::Numeric;
        case ColumnType::String:
        case ColumnType::Categorical:
            return KeyClass::Text;
        default:
            return KeyClass::Date;
    }
}

constexpr bool is_numeric(ColumnType type) noexcept {
    return key_class(type) == KeyClass::Numeric;
}

constexpr bool is_text(ColumnType type) noexcept {
    return key_class(type) == KeyClass::Text;
}

// =============================================================================
// SECTION 2: Date
// =============================================================================

/// Calendar day, stored as days since 1970-01-01.
struct Date {
    std::int32_t days = 0;

    friend constexpr auto operator<=>(const Date&, const Date&) = default;
};

/// Parse `YYYY-MM-DD`. Returns nullopt for malformed text or an invalid
/// calendar day.
std::optional<Date> parse_date(std::string_view text);

std::string format_date(Date date);

// =============================================================================
// SECTION 3: Values
// =============================================================================

/// One cell. monostate is NA. Categorical cells carry their level string.
using Value = std::variant<std::monostate, std::int64_t, double, std::string, Date>;
using Row = std::vector<Value>;

inline bool is_na(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

/// Parse one field as `type`. Empty text is NA. Returns nullopt when the
/// text does not parse.
std::optional<Value> parse_value(std::string_view text, ColumnType type);

/// Text form used for delimited output; NA is the empty string.
std::string format_value(const Value& v);

/// Per-cell memory estimate: 8 bytes for numeric and date cells, string
/// length plus 32 for text cells.
std::size_t estimate_bytes(const Value& v) noexcept;

inline constexpr std::size_t kRowOverheadBytes = 24;

/// Row estimate including the fixed per-row overhead.
std::size_t estimate_bytes(const Row& row) noexcept;

/// Numeric key normalization for joins: integer and float keys that are
/// numerically equal hash and compare equal.
struct KeyHash {
    std::size_t operator()(const Value& v) const noexcept;
};

struct KeyEqual {
    bool operator()(const Value& a, const Value& b) const noexcept;
};

} // namespace ooc
