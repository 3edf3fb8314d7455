#include "ooc/exec/operator.hpp"
#include "ooc/core/error.hpp"
#include "ooc/core/log.hpp"

#include <utility>

namespace ooc::exec {

namespace {

std::string pad(std::size_t indent) {
    return std::string(indent, ' ');
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace

// =============================================================================
// ScanOperator
// =============================================================================

ScanOperator::ScanOperator(Dataset dataset, const std::vector<std::string>& columns,
                           const std::vector<query::Expr>& pushed)
    : dataset_(std::move(dataset))
    , pushed_(pushed)
{
    OOC_CHECK_ARG(dataset_.valid(), "Cannot scan an empty dataset handle");
    schema_ = dataset_.schema().project(columns);
    positions_.reserve(columns.size());
    for (const auto& name : columns) {
        positions_.push_back(dataset_.schema().require(name));
    }
    filters_.reserve(pushed_.size());
    for (const auto& expr : pushed_) {
        filters_.push_back(query::BoundExpr::bind_predicate(expr, schema_));
    }
}

bool ScanOperator::next(Row& out) {
    for (;;) {
        if (!reader_) {
            if (next_chunk_ >= dataset_.chunk_count()) {
                return false;
            }
            OOC_LOG_DEBUG("scan %s: chunk %zu", dataset_.directory().c_str(), next_chunk_);
            reader_.emplace(dataset_.read_chunk_columns(next_chunk_++, positions_));
            ++chunks_opened_;
        }
        if (!reader_->next(out)) {
            reader_.reset();
            continue;
        }
        bool keep = true;
        for (const auto& f : filters_) {
            if (f.test(out) != query::Truth::True) {
                keep = false;
                break;
            }
        }
        if (keep) {
            return true;
        }
    }
}

std::string ScanOperator::describe(std::size_t indent) const {
    std::string out = pad(indent) + "Scan " + dataset_.directory().string() +
                      " columns=[" + join_names(schema_.names()) + "] chunks=" +
                      std::to_string(dataset_.chunk_count());
    for (const auto& expr : pushed_) {
        out += "\n" + pad(indent + 2) + "pushed filter " + expr.to_string();
    }
    return out;
}

// =============================================================================
// FilterOperator
// =============================================================================

FilterOperator::FilterOperator(OperatorPtr input, const query::Expr& predicate)
    : input_(std::move(input))
    , predicate_(predicate)
    , bound_(query::BoundExpr::bind_predicate(predicate, input_->schema()))
{}

bool FilterOperator::next(Row& out) {
    while (input_->next(out)) {
        if (bound_.test(out) == query::Truth::True) {
            return true;
        }
    }
    return false;
}

std::string FilterOperator::describe(std::size_t indent) const {
    return pad(indent) + "Filter " + predicate_.to_string() + "\n" + input_->describe(indent + 2);
}

// =============================================================================
// ProjectOperator
// =============================================================================

ProjectOperator::ProjectOperator(OperatorPtr input, const std::vector<std::string>& columns)
    : input_(std::move(input))
{
    const Schema& in = input_->schema();
    schema_ = in.project(columns);
    positions_.reserve(columns.size());
    for (const auto& name : columns) {
        positions_.push_back(in.require(name));
    }
}

bool ProjectOperator::is_identity() const noexcept {
    if (positions_.size() != input_->schema().size()) {
        return false;
    }
    for (std::size_t i = 0; i < positions_.size(); ++i) {
        if (positions_[i] != i) return false;
    }
    return true;
}

bool ProjectOperator::next(Row& out) {
    if (!input_->next(buffer_)) {
        return false;
    }
    out.clear();
    out.reserve(positions_.size());
    for (auto p : positions_) {
        out.push_back(std::move(buffer_[p]));
    }
    return true;
}

std::string ProjectOperator::describe(std::size_t indent) const {
    return pad(indent) + "Project [" + join_names(schema_.names()) + "]\n" +
           input_->describe(indent + 2);
}

// =============================================================================
// HeadOperator
// =============================================================================

bool HeadOperator::next(Row& out) {
    if (produced_ >= limit_) {
        return false;
    }
    if (!input_->next(out)) {
        return false;
    }
    ++produced_;
    return true;
}

std::string HeadOperator::describe(std::size_t indent) const {
    return pad(indent) + "Head " + std::to_string(limit_) + "\n" + input_->describe(indent + 2);
}

// =============================================================================
// HashJoinOperator
// =============================================================================

HashJoinOperator::HashJoinOperator(OperatorPtr left, Dataset right, const std::string& key,
                                   BuildSide build, std::size_t budget)
    : left_(std::move(left))
    , right_(std::move(right))
    , key_(key)
    , build_(build)
    , budget_(budget)
{
    OOC_CHECK_ARG(right_.valid(), "Cannot join an empty dataset handle");
    const Schema& ls = left_->schema();
    const Schema& rs = right_.schema();
    left_key_ = ls.require(key_);
    right_key_ = rs.require(key_);
    if (key_class(ls[left_key_].type) != key_class(rs[right_key_].type)) {
        throw TypeMismatchError("Join key '" + key_ + "' has incompatible types " +
                                type_name(ls[left_key_].type) + " and " +
                                type_name(rs[right_key_].type));
    }

    std::vector<ColumnSpec> columns = ls.columns();
    for (std::size_t i = 0; i < rs.size(); ++i) {
        if (i == right_key_) continue;
        if (ls.contains(rs[i].name)) {
            throw DuplicateNameError(rs[i].name);
        }
        columns.push_back(rs[i]);
        right_payload_.push_back(i);
    }
    schema_ = Schema(std::move(columns));
}

void HashJoinOperator::account(const Row& row) {
    used_bytes_ += estimate_bytes(row);
    if (used_bytes_ > budget_) {
        OOC_LOG_WARN("join on '%s': build side exceeds %zu bytes", key_.c_str(), budget_);
        throw MemoryBudgetExceededError("Hash join build side on '" + key_ + "'",
                                        used_bytes_, budget_);
    }
}

// Right rows are read as [key, payload...]
bool HashJoinOperator::next_right_row(Row& out) {
    for (;;) {
        if (!right_reader_) {
            if (right_chunk_ >= right_.chunk_count()) {
                return false;
            }
            std::vector<std::size_t> positions;
            positions.reserve(right_payload_.size() + 1);
            positions.push_back(right_key_);
            positions.insert(positions.end(), right_payload_.begin(), right_payload_.end());
            right_reader_.emplace(right_.read_chunk_columns(right_chunk_++, std::move(positions)));
        }
        if (right_reader_->next(out)) {
            return true;
        }
        right_reader_.reset();
    }
}

void HashJoinOperator::build() {
    Row row;
    if (build_ == BuildSide::Right) {
        while (next_right_row(row)) {
            if (ooc::is_na(row[0])) continue;
            account(row);
            Value key = row[0];
            table_[std::move(key)].push_back(std::move(row));
        }
    } else {
        while (left_->next(row)) {
            if (ooc::is_na(row[left_key_])) continue;
            account(row);
            Value key = row[left_key_];
            table_[std::move(key)].push_back(std::move(row));
        }
    }
    OOC_LOG_DEBUG("join on '%s': %s build side holds %zu keys (%zu bytes)", key_.c_str(),
                  build_ == BuildSide::Right ? "right" : "left", table_.size(), used_bytes_);
    built_ = true;
}

void HashJoinOperator::emit(const Row& left, const Row& right, Row& out) const {
    out.clear();
    out.reserve(left.size() + right.size() - 1);
    out.insert(out.end(), left.begin(), left.end());
    out.insert(out.end(), right.begin() + 1, right.end());
}

bool HashJoinOperator::next(Row& out) {
    if (!built_) {
        build();
    }
    for (;;) {
        if (matches_ != nullptr && match_pos_ < matches_->size()) {
            const Row& match = (*matches_)[match_pos_++];
            if (build_ == BuildSide::Right) {
                emit(streamed_, match, out);
            } else {
                emit(match, streamed_, out);
            }
            return true;
        }
        matches_ = nullptr;

        const bool more = build_ == BuildSide::Right ? left_->next(streamed_) : next_right_row(streamed_);
        if (!more) {
            return false;
        }
        const Value& key = build_ == BuildSide::Right ? streamed_[left_key_] : streamed_[0];
        if (ooc::is_na(key)) continue;
        auto it = table_.find(key);
        if (it != table_.end()) {
            matches_ = &it->second;
            match_pos_ = 0;
        }
    }
}

std::string HashJoinOperator::describe(std::size_t indent) const {
    std::string out = pad(indent) + "HashJoin on " + key_ + " build=" +
                      (build_ == BuildSide::Right ? "right" : "left") + "\n";
    out += left_->describe(indent + 2) + "\n";
    out += pad(indent + 2) + "Scan " + right_.directory().string() + " columns=[" +
           join_names(right_.schema().names()) + "] chunks=" + std::to_string(right_.chunk_count());
    return out;
}

} // namespace ooc::exec
