#pragma once

#include "ooc/core/error.hpp"
#include "ooc/core/type.hpp"
#include "ooc/store/schema.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: ooc/exec/table.hpp
// BRIEF: Materialized in-memory query result
// =============================================================================

namespace ooc::exec {

class Table {
public:
    Table() = default;

    explicit Table(Schema schema) : schema_(std::move(schema)) {}

    Table(Schema schema, std::vector<Row> rows)
        : schema_(std::move(schema)), rows_(std::move(rows)) {}

    OOC_NODISCARD const Schema& schema() const noexcept { return schema_; }
    OOC_NODISCARD const std::vector<Row>& rows() const noexcept { return rows_; }

    OOC_NODISCARD std::size_t row_count() const noexcept { return rows_.size(); }
    OOC_NODISCARD std::size_t column_count() const noexcept { return schema_.size(); }

    OOC_NODISCARD const Value& at(std::size_t row, std::size_t column) const {
        OOC_CHECK_ARG(row < rows_.size() && column < schema_.size(), "Table index out of range");
        return rows_[row][column];
    }

    /// Copy of one column. Throws UnknownColumnError.
    OOC_NODISCARD std::vector<Value> column(const std::string& name) const {
        const std::size_t idx = schema_.require(name);
        std::vector<Value> out;
        out.reserve(rows_.size());
        for (const auto& r : rows_) {
            out.push_back(r[idx]);
        }
        return out;
    }

    void append(Row row) {
        OOC_ASSERT(row.size() == schema_.size(), "Row width does not match table schema");
        rows_.push_back(std::move(row));
    }

private:
    Schema schema_;
    std::vector<Row> rows_;
};

} // namespace ooc::exec
