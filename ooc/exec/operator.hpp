#pragma once

#include "ooc/core/type.hpp"
#include "ooc/query/expr.hpp"
#include "ooc/store/chunk_store.hpp"
#include "ooc/store/schema.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: ooc/exec/operator.hpp
// BRIEF: Pull-based physical operators
//
// Each operator yields rows of its output schema through next(). Operators
// own their input; the root of the tree is driven by the Executor.
// =============================================================================

namespace ooc::exec {

class Operator {
public:
    virtual ~Operator() = default;

    /// Fills `out` and returns true, or returns false when exhausted.
    virtual bool next(Row& out) = 0;

    OOC_NODISCARD virtual const Schema& schema() const noexcept = 0;
    OOC_NODISCARD virtual const char* name() const noexcept = 0;

    /// Physical pipeline description, one line per operator, `indent`
    /// spaces deep.
    OOC_NODISCARD virtual std::string describe(std::size_t indent) const = 0;
};

using OperatorPtr = std::unique_ptr<Operator>;

// =============================================================================
// Scan
// =============================================================================

/// Walks the chunks of a dataset in order, reading only `columns`. Pushed
/// filters are evaluated as each row is pulled from its chunk.
class ScanOperator final : public Operator {
public:
    ScanOperator(Dataset dataset, const std::vector<std::string>& columns,
                 const std::vector<query::Expr>& pushed);

    bool next(Row& out) override;
    OOC_NODISCARD const Schema& schema() const noexcept override { return schema_; }
    OOC_NODISCARD const char* name() const noexcept override { return "Scan"; }
    OOC_NODISCARD std::string describe(std::size_t indent) const override;

    OOC_NODISCARD std::size_t chunks_read() const noexcept { return chunks_opened_; }

private:
    Dataset dataset_;
    Schema schema_;
    std::vector<std::size_t> positions_;
    std::vector<query::Expr> pushed_;
    std::vector<query::BoundExpr> filters_;
    std::size_t next_chunk_ = 0;
    std::size_t chunks_opened_ = 0;
    std::optional<ChunkReader> reader_;
};

// =============================================================================
// Filter / Project / Head
// =============================================================================

class FilterOperator final : public Operator {
public:
    FilterOperator(OperatorPtr input, const query::Expr& predicate);

    bool next(Row& out) override;
    OOC_NODISCARD const Schema& schema() const noexcept override { return input_->schema(); }
    OOC_NODISCARD const char* name() const noexcept override { return "Filter"; }
    OOC_NODISCARD std::string describe(std::size_t indent) const override;

private:
    OperatorPtr input_;
    query::Expr predicate_;
    query::BoundExpr bound_;
};

class ProjectOperator final : public Operator {
public:
    ProjectOperator(OperatorPtr input, const std::vector<std::string>& columns);

    bool next(Row& out) override;
    OOC_NODISCARD const Schema& schema() const noexcept override { return schema_; }
    OOC_NODISCARD const char* name() const noexcept override { return "Project"; }
    OOC_NODISCARD std::string describe(std::size_t indent) const override;

    /// True when the projection keeps every input column in order.
    OOC_NODISCARD bool is_identity() const noexcept;

private:
    OperatorPtr input_;
    Schema schema_;
    std::vector<std::size_t> positions_;
    Row buffer_;
};

/// Stops pulling its input once `limit` rows were produced.
class HeadOperator final : public Operator {
public:
    HeadOperator(OperatorPtr input, std::uint64_t limit)
        : input_(std::move(input)), limit_(limit) {}

    bool next(Row& out) override;
    OOC_NODISCARD const Schema& schema() const noexcept override { return input_->schema(); }
    OOC_NODISCARD const char* name() const noexcept override { return "Head"; }
    OOC_NODISCARD std::string describe(std::size_t indent) const override;

private:
    OperatorPtr input_;
    std::uint64_t limit_;
    std::uint64_t produced_ = 0;
};

// =============================================================================
// Hash Join
// =============================================================================

enum class BuildSide { Left, Right };

/// Inner equi-join of a row stream (left) with a stored dataset (right).
/// The build side is loaded into a hash table keyed by the join column;
/// its estimated size must stay within `budget` bytes.
class HashJoinOperator final : public Operator {
public:
    HashJoinOperator(OperatorPtr left, Dataset right, const std::string& key,
                     BuildSide build, std::size_t budget);

    bool next(Row& out) override;
    OOC_NODISCARD const Schema& schema() const noexcept override { return schema_; }
    OOC_NODISCARD const char* name() const noexcept override { return "HashJoin"; }
    OOC_NODISCARD std::string describe(std::size_t indent) const override;

    OOC_NODISCARD BuildSide build_side() const noexcept { return build_; }

private:
    using HashTable = std::unordered_map<Value, std::vector<Row>, KeyHash, KeyEqual>;

    void build();
    void account(const Row& row);
    bool next_right_row(Row& out);
    void emit(const Row& left, const Row& right, Row& out) const;

    OperatorPtr left_;
    Dataset right_;
    std::string key_;
    BuildSide build_;
    std::size_t budget_;
    Schema schema_;

    std::size_t left_key_ = 0;
    std::size_t right_key_ = 0;
    std::vector<std::size_t> right_payload_;    // right columns except the key

    bool built_ = false;
    std::size_t used_bytes_ = 0;
    HashTable table_;

    // Streamed side state
    Row streamed_;
    const std::vector<Row>* matches_ = nullptr;
    std::size_t match_pos_ = 0;
    std::size_t right_chunk_ = 0;
    std::optional<ChunkReader> right_reader_;
};

} // namespace ooc::exec
