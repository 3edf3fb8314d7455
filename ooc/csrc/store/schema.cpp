#include "ooc/store/schema.hpp"
#include "ooc/core/error.hpp"

#include <unordered_set>

namespace ooc {

Schema::Schema(std::vector<ColumnSpec> columns)
    : columns_(std::move(columns))
{
    index_.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        OOC_CHECK_ARG(!columns_[i].name.empty(), "Column names cannot be empty");
        if (!index_.emplace(columns_[i].name, i).second) {
            throw DuplicateNameError(columns_[i].name);
        }
    }
}

std::optional<std::size_t> Schema::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t Schema::require(const std::string& name) const {
    auto idx = index_of(name);
    if (!idx) {
        throw UnknownColumnError(name);
    }
    return *idx;
}

Schema Schema::rename(const std::string& old_name, const std::string& new_name) const {
    const std::size_t idx = require(old_name);
    if (old_name == new_name) {
        return *this;
    }
    if (contains(new_name)) {
        throw DuplicateNameError(new_name);
    }
    auto columns = columns_;
    columns[idx].name = new_name;
    return Schema(std::move(columns));
}

Schema Schema::project(const std::vector<std::string>& names) const {
    std::vector<ColumnSpec> columns;
    std::unordered_set<std::string> seen;
    columns.reserve(names.size());
    for (const auto& name : names) {
        const std::size_t idx = require(name);
        if (!seen.insert(name).second) {
            throw DuplicateNameError(name);
        }
        columns.push_back(columns_[idx]);
    }
    return Schema(std::move(columns));
}

std::vector<std::string> Schema::names() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& c : columns_) {
        out.push_back(c.name);
    }
    return out;
}

std::vector<ColumnType> Schema::types() const {
    std::vector<ColumnType> out;
    out.reserve(columns_.size());
    for (const auto& c : columns_) {
        out.push_back(c.type);
    }
    return out;
}

std::string Schema::to_string() const {
    std::string out;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) out += ", ";
        out += columns_[i].name;
        out += ':';
        out += type_name(columns_[i].type);
    }
    return out;
}

} // namespace ooc
