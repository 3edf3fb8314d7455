#pragma once

#include "ooc/core/type.hpp"
#include "ooc/store/schema.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// =============================================================================
// FILE: ooc/query/expr.hpp
// BRIEF: Predicate expressions: AST, text parser, typed binding, evaluation
// =============================================================================

namespace ooc::query {

enum class UnaryOp { Not, Negate };

enum class BinaryOp {
    And, Or,
    Eq, Ne, Lt, Le, Gt, Ge,
    Add, Sub, Mul, Div
};

const char* op_symbol(UnaryOp op) noexcept;
const char* op_symbol(BinaryOp op) noexcept;

// =============================================================================
// SECTION 1: Expression Tree
// =============================================================================

/// Immutable expression handle. Copies share the node.
class Expr {
public:
    enum class Kind { Literal, Boolean, Column, Unary, Binary, IsNa };

    struct Node {
        Kind kind;
        Value literal;          // Literal
        bool boolean = false;   // Boolean
        std::string column;     // Column, IsNa
        UnaryOp unary_op = UnaryOp::Not;
        BinaryOp binary_op = BinaryOp::And;
        std::vector<Expr> args;
    };

    static Expr literal(Value v);
    static Expr boolean(bool b);
    static Expr column(std::string name);
    static Expr unary(UnaryOp op, Expr operand);
    static Expr binary(BinaryOp op, Expr lhs, Expr rhs);
    static Expr is_na(std::string column);

    OOC_NODISCARD Kind kind() const noexcept { return node_->kind; }
    OOC_NODISCARD const Node& node() const noexcept { return *node_; }

    /// Fully parenthesized text that parse_predicate reads back.
    OOC_NODISCARD std::string to_string() const;

    /// Column names referenced anywhere in the tree, without duplicates.
    OOC_NODISCARD std::vector<std::string> columns() const;

private:
    explicit Expr(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    std::shared_ptr<const Node> node_;
};

inline Expr col(std::string name) { return Expr::column(std::move(name)); }

inline Expr lit(std::int64_t v) { return Expr::literal(Value{v}); }
inline Expr lit(int v) { return Expr::literal(Value{static_cast<std::int64_t>(v)}); }
inline Expr lit(double v) { return Expr::literal(Value{v}); }
inline Expr lit(std::string v) { return Expr::literal(Value{std::move(v)}); }
inline Expr lit(const char* v) { return Expr::literal(Value{std::string(v)}); }
inline Expr lit(Date v) { return Expr::literal(Value{v}); }
inline Expr lit(bool v) { return Expr::boolean(v); }
inline Expr na() { return Expr::literal(Value{}); }
inline Expr is_na(std::string column) { return Expr::is_na(std::move(column)); }

inline Expr operator==(Expr a, Expr b) { return Expr::binary(BinaryOp::Eq, std::move(a), std::move(b)); }
inline Expr operator!=(Expr a, Expr b) { return Expr::binary(BinaryOp::Ne, std::move(a), std::move(b)); }
inline Expr operator<(Expr a, Expr b)  { return Expr::binary(BinaryOp::Lt, std::move(a), std::move(b)); }
inline Expr operator<=(Expr a, Expr b) { return Expr::binary(BinaryOp::Le, std::move(a), std::move(b)); }
inline Expr operator>(Expr a, Expr b)  { return Expr::binary(BinaryOp::Gt, std::move(a), std::move(b)); }
inline Expr operator>=(Expr a, Expr b) { return Expr::binary(BinaryOp::Ge, std::move(a), std::move(b)); }
inline Expr operator&&(Expr a, Expr b) { return Expr::binary(BinaryOp::And, std::move(a), std::move(b)); }
inline Expr operator||(Expr a, Expr b) { return Expr::binary(BinaryOp::Or, std::move(a), std::move(b)); }
inline Expr operator+(Expr a, Expr b)  { return Expr::binary(BinaryOp::Add, std::move(a), std::move(b)); }
inline Expr operator-(Expr a, Expr b)  { return Expr::binary(BinaryOp::Sub, std::move(a), std::move(b)); }
inline Expr operator*(Expr a, Expr b)  { return Expr::binary(BinaryOp::Mul, std::move(a), std::move(b)); }
inline Expr operator/(Expr a, Expr b)  { return Expr::binary(BinaryOp::Div, std::move(a), std::move(b)); }
inline Expr operator!(Expr a) { return Expr::unary(UnaryOp::Not, std::move(a)); }
inline Expr operator-(Expr a) { return Expr::unary(UnaryOp::Negate, std::move(a)); }

/// Parse the text form of a predicate. Syntax errors raise ParseError
/// with line 1.
Expr parse_predicate(std::string_view text);

// =============================================================================
// SECTION 2: Binding and Evaluation
// =============================================================================

/// Static type of an expression. Null is the type of the NA literal and is
/// compatible with every operand position.
enum class ExprType { Integer, Float, Text, Date, Boolean, Null };

const char* expr_type_name(ExprType type) noexcept;

/// Three-valued truth used by filters.
enum class Truth : std::uint8_t { False, True, Na };

/// Evaluation result: NA, integer, float, text, date or boolean.
using Cell = std::variant<std::monostate, std::int64_t, double, std::string, Date, bool>;

/// Expression resolved against a row layout. Column references become
/// positions; type errors are raised here, not during evaluation.
class BoundExpr {
public:
    struct Node;

    /// Throws UnknownColumnError or TypeMismatchError.
    static BoundExpr bind(const Expr& expr, const Schema& schema);

    /// bind() plus the requirement that the result is boolean.
    static BoundExpr bind_predicate(const Expr& expr, const Schema& schema);

    OOC_NODISCARD ExprType type() const noexcept { return type_; }

    OOC_NODISCARD Cell evaluate(const Row& row) const;

    /// Filter decision. Only True keeps a row.
    OOC_NODISCARD Truth test(const Row& row) const;

private:
    BoundExpr(std::shared_ptr<const Node> root, ExprType type)
        : root_(std::move(root)), type_(type) {}

    std::shared_ptr<const Node> root_;
    ExprType type_ = ExprType::Null;
};

} // namespace ooc::query
