#pragma once

#include "ooc/core/config.hpp"
#include "ooc/exec/operator.hpp"
#include "ooc/exec/table.hpp"
#include "ooc/query/plan.hpp"
#include "ooc/store/chunk_store.hpp"

#include <filesystem>
#include <ostream>
#include <string>

// =============================================================================
// FILE: ooc/exec/executor.hpp
// BRIEF: Streaming evaluation of query plans
// =============================================================================

namespace ooc::exec {

class Executor {
public:
    explicit Executor(ExecConfig config = {}, StoreConfig store = {})
        : config_(config), store_(std::move(store)) {}

    OOC_NODISCARD const ExecConfig& config() const noexcept { return config_; }

    /// Materialize the plan result. Throws MemoryBudgetExceededError once
    /// the estimated size passes result_memory_budget.
    OOC_NODISCARD Table collect(const query::QueryPlan& plan) const;

    /// Stream the plan result into a new dataset at `destination`. On
    /// failure the partial destination is left for ChunkStore::discard.
    Dataset compute_to_chunk_store(const query::QueryPlan& plan,
                                   const std::filesystem::path& destination) const;

    /// Stream the plan result as delimited text. Returns the row count.
    std::uint64_t write_delimited(const query::QueryPlan& plan, std::ostream& out,
                                  const WriteOptions& opts = {}) const;

    static std::uint64_t write_delimited(const Table& table, std::ostream& out,
                                         const WriteOptions& opts = {});

    /// Physical pipeline chosen for `plan`, root operator first.
    OOC_NODISCARD std::string explain(const query::QueryPlan& plan) const;

    /// Operator tree for `plan`. Nothing is read until the root is pulled.
    OOC_NODISCARD OperatorPtr build(const query::QueryPlan& plan) const;

private:
    ExecConfig config_;
    StoreConfig store_;
};

} // namespace ooc::exec
