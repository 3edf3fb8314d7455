// =============================================================================
// FILE: ooc/query/plan.h
// BRIEF: API reference for lazy query plans and their execution
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "ooc/query/expr.hpp"
#include "ooc/store/chunk_store.hpp"

namespace ooc::query {

/* -----------------------------------------------------------------------------
 * CLASS: QueryPlan
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Immutable description of a computation: one base dataset plus an
 *     ordered list of filter, select, join and head operations. Builders
 *     return new plans; the source plan is never modified.
 *
 * VALIDATION:
 *     Every builder checks its arguments against the schema produced by
 *     the operations before it, so errors surface when the plan is built,
 *     not when it runs.
 *
 * SEMANTICS:
 *     Operations apply in declared order. head(n) keeps the first n rows
 *     of the stream at that point; a later filter sees only those rows.
 *
 * THREAD SAFETY:
 *     Safe - plans are values and may be shared across threads.
 * -------------------------------------------------------------------------- */
class QueryPlan {
public:
    /* -------------------------------------------------------------------------
     * METHOD: filter
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Keep rows where the predicate is true. NA and false drop the row.
     *
     * THROWS:
     *     ParseError         - text predicate does not parse
     *     UnknownColumnError - predicate names a column not in the schema
     *     TypeMismatchError  - predicate is not boolean or mixes types
     * ---------------------------------------------------------------------- */
    QueryPlan filter(const Expr& predicate) const;
    QueryPlan filter(std::string_view predicate) const;

    /* -------------------------------------------------------------------------
     * METHOD: select
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Keep and reorder columns.
     *
     * THROWS:
     *     ValueError         - empty column list
     *     UnknownColumnError - column not in the schema
     *     DuplicateNameError - column listed twice
     * ---------------------------------------------------------------------- */
    QueryPlan select(const std::vector<std::string>& columns) const;

    /* -------------------------------------------------------------------------
     * METHOD: join
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Inner equi-join with another dataset on a column present in both.
     *     Output is the current columns followed by the other dataset's
     *     columns without its key. NA keys never match. Integer and float
     *     keys compare numerically.
     *
     * THROWS:
     *     UnknownColumnError - key missing on either side
     *     TypeMismatchError  - key types not comparable
     *     DuplicateNameError - a non-key column exists on both sides
     * ---------------------------------------------------------------------- */
    QueryPlan join(const Dataset& other, const std::string& on) const;

    QueryPlan head(std::uint64_t n) const;
};

} // namespace ooc::query

namespace ooc::exec {

/* -----------------------------------------------------------------------------
 * CLASS: Executor
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Runs a QueryPlan as a pull pipeline of operators, one chunk at a
 *     time. Only the columns the plan needs are read, and filters on base
 *     columns that no head precedes are evaluated inside the scan.
 *
 * OPERATIONS:
 *     collect                 Materialize the result as a Table; throws
 *                             MemoryBudgetExceededError above the
 *                             result budget
 *     compute_to_chunk_store  Stream the result into a new dataset
 *     write_delimited         Stream the result as delimited text
 *     explain                 Physical pipeline text for a plan
 *
 * JOIN:
 *     Hash join. The build side is the right dataset unless the base is
 *     smaller and this is the first join, in which case the base is built.
 *     Output keeps streamed side order. A build side larger than the join
 *     budget throws MemoryBudgetExceededError.
 * -------------------------------------------------------------------------- */

} // namespace ooc::exec
