#include "ooc/query/plan.hpp"
#include "ooc/core/error.hpp"

#include <algorithm>
#include <unordered_set>

namespace ooc::query {

const char* op_kind_name(OpKind kind) noexcept {
    switch (kind) {
        case OpKind::Filter: return "filter";
        case OpKind::Select: return "select";
        case OpKind::Join:   return "join";
        case OpKind::Head:   return "head";
        default:             return "unknown";
    }
}

QueryPlan QueryPlan::scan(Dataset base) {
    OOC_CHECK_ARG(base.valid(), "Cannot scan an empty dataset handle");
    Schema schema = base.schema();
    std::vector<bool> from_base(schema.size(), true);
    return QueryPlan(std::move(base), std::move(schema), std::move(from_base));
}

bool QueryPlan::is_base_column(const std::string& name) const {
    auto idx = schema_.index_of(name);
    return idx && from_base_[*idx];
}

QueryPlan QueryPlan::append(PlanOp op, std::vector<bool> from_base) const {
    QueryPlan next = *this;
    next.schema_ = op.output;
    next.from_base_ = std::move(from_base);
    next.has_head_ = has_head_ || op.kind == OpKind::Head;
    next.ops_.push_back(std::move(op));
    return next;
}

QueryPlan QueryPlan::filter(const Expr& predicate) const {
    // Validates names and types; the bound form is rebuilt at execution
    (void)BoundExpr::bind_predicate(predicate, schema_);

    PlanOp op{OpKind::Filter};
    op.predicate = predicate;
    op.output = schema_;

    bool all_base = true;
    for (const auto& name : predicate.columns()) {
        if (is_base_column(name)) {
            op.base_refs.push_back(name);
        } else {
            all_base = false;
        }
    }
    op.pushable = all_base && !has_head_;
    return append(std::move(op), from_base_);
}

QueryPlan QueryPlan::filter(std::string_view predicate) const {
    return filter(parse_predicate(predicate));
}

QueryPlan QueryPlan::select(const std::vector<std::string>& columns) const {
    OOC_CHECK_ARG(!columns.empty(), "select() needs at least one column");

    PlanOp op{OpKind::Select};
    op.output = schema_.project(columns);
    op.columns = columns;

    std::vector<bool> from_base;
    from_base.reserve(columns.size());
    for (const auto& name : columns) {
        const bool base = from_base_[schema_.require(name)];
        from_base.push_back(base);
        if (base) {
            op.base_refs.push_back(name);
        }
    }
    return append(std::move(op), std::move(from_base));
}

QueryPlan QueryPlan::join(const Dataset& other, const std::string& on) const {
    OOC_CHECK_ARG(other.valid(), "Cannot join an empty dataset handle");

    const std::size_t left_idx = schema_.require(on);
    const Schema& right = other.schema();
    const std::size_t right_idx = right.require(on);

    const ColumnType lt = schema_[left_idx].type;
    const ColumnType rt = right[right_idx].type;
    if (key_class(lt) != key_class(rt)) {
        throw TypeMismatchError("Join key '" + on + "' has incompatible types " +
                                type_name(lt) + " and " + type_name(rt));
    }

    std::vector<ColumnSpec> columns = schema_.columns();
    std::vector<bool> from_base = from_base_;
    for (std::size_t i = 0; i < right.size(); ++i) {
        if (i == right_idx) continue;
        if (schema_.contains(right[i].name)) {
            throw DuplicateNameError(right[i].name);
        }
        columns.push_back(right[i]);
        from_base.push_back(false);
    }

    PlanOp op{OpKind::Join};
    op.right = other;
    op.key = on;
    op.output = Schema(std::move(columns));
    if (from_base_[left_idx]) {
        op.base_refs.push_back(on);
    }
    return append(std::move(op), std::move(from_base));
}

QueryPlan QueryPlan::head(std::uint64_t n) const {
    PlanOp op{OpKind::Head};
    op.limit = n;
    op.output = schema_;
    return append(std::move(op), from_base_);
}

std::vector<std::string> QueryPlan::required_base_columns() const {
    std::unordered_set<std::string> needed;
    for (std::size_t i = 0; i < schema_.size(); ++i) {
        if (from_base_[i]) {
            needed.insert(schema_[i].name);
        }
    }
    for (const auto& op : ops_) {
        needed.insert(op.base_refs.begin(), op.base_refs.end());
    }

    std::vector<std::string> out;
    for (const auto& column : base_.schema().columns()) {
        if (needed.count(column.name) != 0) {
            out.push_back(column.name);
        }
    }
    return out;
}

std::string QueryPlan::to_string() const {
    std::string out = "scan " + base_.directory().string() + " [" + base_.schema().to_string() + "]";
    for (const auto& op : ops_) {
        out += "\n";
        out += op_kind_name(op.kind);
        switch (op.kind) {
            case OpKind::Filter:
                out += " " + op.predicate->to_string();
                break;
            case OpKind::Select: {
                out += " [";
                for (std::size_t i = 0; i < op.columns.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += op.columns[i];
                }
                out += "]";
                break;
            }
            case OpKind::Join:
                out += " " + op.right.directory().string() + " on " + op.key;
                break;
            case OpKind::Head:
                out += " " + std::to_string(op.limit);
                break;
        }
    }
    return out;
}

} // namespace ooc::query
