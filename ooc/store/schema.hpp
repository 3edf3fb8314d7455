#pragma once

#include "ooc/core/type.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: ooc/store/schema.hpp
// BRIEF: Ordered, uniquely named column list
// =============================================================================

namespace ooc {

struct ColumnSpec {
    std::string name;
    ColumnType type;

    friend bool operator==(const ColumnSpec&, const ColumnSpec&) = default;
};

/// Immutable once built. Every mutator returns a new Schema.
class Schema {
public:
    Schema() = default;

    /// Throws DuplicateNameError if two columns share a name.
    explicit Schema(std::vector<ColumnSpec> columns);

    OOC_NODISCARD std::size_t size() const noexcept { return columns_.size(); }
    OOC_NODISCARD bool empty() const noexcept { return columns_.empty(); }

    OOC_NODISCARD const ColumnSpec& operator[](std::size_t i) const noexcept { return columns_[i]; }
    OOC_NODISCARD const std::vector<ColumnSpec>& columns() const noexcept { return columns_; }

    OOC_NODISCARD std::optional<std::size_t> index_of(const std::string& name) const;

    /// Like index_of, but throws UnknownColumnError.
    OOC_NODISCARD std::size_t require(const std::string& name) const;

    OOC_NODISCARD bool contains(const std::string& name) const {
        return index_of(name).has_value();
    }

    /// Same columns with `old_name` renamed. Renaming to the same name
    /// returns an equal Schema.
    OOC_NODISCARD Schema rename(const std::string& old_name, const std::string& new_name) const;

    /// Columns `names`, in that order. Throws UnknownColumnError or
    /// DuplicateNameError.
    OOC_NODISCARD Schema project(const std::vector<std::string>& names) const;

    OOC_NODISCARD std::vector<std::string> names() const;
    OOC_NODISCARD std::vector<ColumnType> types() const;

    /// "name:type, name:type"
    OOC_NODISCARD std::string to_string() const;

    friend bool operator==(const Schema& a, const Schema& b) {
        return a.columns_ == b.columns_;
    }

private:
    std::vector<ColumnSpec> columns_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace ooc
