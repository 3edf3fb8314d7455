#include "ooc/exec/executor.hpp"
#include "ooc/core/error.hpp"
#include "ooc/core/log.hpp"
#include "ooc/io/delimited.hpp"

#include <vector>

namespace ooc::exec {

// =============================================================================
// Pipeline Construction
// =============================================================================

OperatorPtr Executor::build(const query::QueryPlan& plan) const {
    const Dataset& base = plan.base();
    OOC_CHECK_ARG(base.valid(), "Plan has no base dataset");

    std::vector<query::Expr> pushed;
    for (const auto& op : plan.operations()) {
        if (op.kind == query::OpKind::Filter && op.pushable) {
            pushed.push_back(*op.predicate);
        }
    }

    OperatorPtr root = std::make_unique<ScanOperator>(base, plan.required_base_columns(), pushed);

    bool first_join = true;
    for (const auto& op : plan.operations()) {
        switch (op.kind) {
            case query::OpKind::Filter:
                if (!op.pushable) {
                    root = std::make_unique<FilterOperator>(std::move(root), *op.predicate);
                }
                break;
            case query::OpKind::Select:
                root = std::make_unique<ProjectOperator>(std::move(root), op.columns);
                break;
            case query::OpKind::Join: {
                // Only the first join sees the base dataset directly, so
                // only there is the left side's stored size known.
                BuildSide side = BuildSide::Right;
                if (first_join && base.row_count() < op.right.row_count()) {
                    side = BuildSide::Left;
                }
                first_join = false;
                root = std::make_unique<HashJoinOperator>(std::move(root), op.right, op.key,
                                                          side, config_.join_memory_budget);
                break;
            }
            case query::OpKind::Head:
                root = std::make_unique<HeadOperator>(std::move(root), op.limit);
                break;
        }
    }

    // Scan may carry columns kept only for later operators
    if (root->schema().names() != plan.schema().names()) {
        root = std::make_unique<ProjectOperator>(std::move(root), plan.schema().names());
    }
    return root;
}

std::string Executor::explain(const query::QueryPlan& plan) const {
    return build(plan)->describe(0);
}

// =============================================================================
// Sinks
// =============================================================================

Table Executor::collect(const query::QueryPlan& plan) const {
    OperatorPtr root = build(plan);
    Table table(root->schema());

    std::size_t used = 0;
    Row row;
    while (root->next(row)) {
        used += estimate_bytes(row);
        if (used > config_.result_memory_budget) {
            OOC_LOG_WARN("collect: result exceeds %zu bytes after %zu rows",
                         config_.result_memory_budget, table.row_count());
            throw MemoryBudgetExceededError("Collected result", used,
                                            config_.result_memory_budget);
        }
        table.append(std::move(row));
        row = Row();
    }
    OOC_LOG_INFO("collect: %zu rows, ~%zu bytes", table.row_count(), used);
    return table;
}

Dataset Executor::compute_to_chunk_store(const query::QueryPlan& plan,
                                         const std::filesystem::path& destination) const {
    OperatorPtr root = build(plan);

    std::uint64_t chunk_rows = config_.output_chunk_rows;
    if (chunk_rows == 0) {
        chunk_rows = plan.base().chunk_row_capacity();
    }

    ChunkStore store(store_);
    DatasetWriter writer = store.open_writer(destination, root->schema(), chunk_rows);
    Row row;
    while (root->next(row)) {
        writer.append(row);
    }
    return writer.finish();
}

std::uint64_t Executor::write_delimited(const query::QueryPlan& plan, std::ostream& out,
                                        const WriteOptions& opts) const {
    OperatorPtr root = build(plan);

    io::DelimitedWriter writer(out, opts);
    writer.write_header(root->schema().names());
    std::uint64_t rows = 0;
    Row row;
    while (root->next(row)) {
        writer.write_row(row);
        ++rows;
    }
    writer.flush();
    return rows;
}

std::uint64_t Executor::write_delimited(const Table& table, std::ostream& out,
                                        const WriteOptions& opts) {
    io::DelimitedWriter writer(out, opts);
    writer.write_header(table.schema().names());
    for (const auto& row : table.rows()) {
        writer.write_row(row);
    }
    writer.flush();
    return table.row_count();
}

} // namespace ooc::exec
