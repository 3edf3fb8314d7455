#pragma once

#include "ooc/query/expr.hpp"
#include "ooc/store/chunk_store.hpp"
#include "ooc/store/schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: ooc/query/plan.hpp
// BRIEF: Immutable lazy query plans over a chunked dataset
// =============================================================================

namespace ooc::query {

enum class OpKind { Filter, Select, Join, Head };

const char* op_kind_name(OpKind kind) noexcept;

/// One declared operation together with the schema it produces.
struct PlanOp {
    OpKind kind;

    std::optional<Expr> predicate;      // Filter
    std::vector<std::string> columns;   // Select
    Dataset right;                      // Join
    std::string key;                    // Join
    std::uint64_t limit = 0;            // Head

    /// Filter only: every referenced column comes from the base dataset and
    /// no head precedes it, so it may run at chunk read time.
    bool pushable = false;

    /// Base dataset columns this operation reads.
    std::vector<std::string> base_refs;

    Schema output;
};

/// A base dataset plus an ordered list of operations. Every builder
/// returns a new plan and validates against the projected schema at once;
/// nothing touches disk until an Executor runs the plan.
class QueryPlan {
public:
    static QueryPlan scan(Dataset base);

    /// Throws UnknownColumnError or TypeMismatchError.
    OOC_NODISCARD QueryPlan filter(const Expr& predicate) const;

    /// Text form; syntax errors raise ParseError.
    OOC_NODISCARD QueryPlan filter(std::string_view predicate) const;

    /// Throws UnknownColumnError or DuplicateNameError.
    OOC_NODISCARD QueryPlan select(const std::vector<std::string>& columns) const;

    /// Inner equi-join on `on`. Throws UnknownColumnError,
    /// TypeMismatchError or DuplicateNameError.
    OOC_NODISCARD QueryPlan join(const Dataset& other, const std::string& on) const;

    /// Keep at most the first `n` rows of the stream at this point.
    OOC_NODISCARD QueryPlan head(std::uint64_t n) const;

    OOC_NODISCARD const Dataset& base() const noexcept { return base_; }
    OOC_NODISCARD const Schema& schema() const noexcept { return schema_; }
    OOC_NODISCARD const std::vector<PlanOp>& operations() const noexcept { return ops_; }

    /// Base columns the whole plan reads, in base schema order.
    OOC_NODISCARD std::vector<std::string> required_base_columns() const;

    /// One line per logical operation.
    OOC_NODISCARD std::string to_string() const;

private:
    QueryPlan(Dataset base, Schema schema, std::vector<bool> from_base)
        : base_(std::move(base)), schema_(std::move(schema)), from_base_(std::move(from_base)) {}

    OOC_NODISCARD bool is_base_column(const std::string& name) const;
    OOC_NODISCARD QueryPlan append(PlanOp op, std::vector<bool> from_base) const;

    Dataset base_;
    Schema schema_;
    std::vector<bool> from_base_;   // per column of schema_
    std::vector<PlanOp> ops_;
    bool has_head_ = false;
};

} // namespace ooc::query
