#include "ooc/query/expr.hpp"
#include "ooc/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace ooc::query {

const char* op_symbol(UnaryOp op) noexcept {
    switch (op) {
        case UnaryOp::Not:    return "!";
        case UnaryOp::Negate: return "-";
        default:              return "?";
    }
}

const char* op_symbol(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::And: return "&&";
        case BinaryOp::Or:  return "||";
        case BinaryOp::Eq:  return "==";
        case BinaryOp::Ne:  return "!=";
        case BinaryOp::Lt:  return "<";
        case BinaryOp::Le:  return "<=";
        case BinaryOp::Gt:  return ">";
        case BinaryOp::Ge:  return ">=";
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        default:            return "?";
    }
}

const char* expr_type_name(ExprType type) noexcept {
    switch (type) {
        case ExprType::Integer: return "integer";
        case ExprType::Float:   return "float";
        case ExprType::Text:    return "text";
        case ExprType::Date:    return "date";
        case ExprType::Boolean: return "boolean";
        case ExprType::Null:    return "NA";
        default:                return "unknown";
    }
}

namespace {

bool is_keyword(std::string_view word) {
    return word == "and" || word == "or" || word == "not" || word == "true" ||
           word == "false" || word == "NA";
}

bool is_plain_identifier(std::string_view name) {
    if (name.empty() || is_keyword(name)) return false;
    auto c0 = static_cast<unsigned char>(name.front());
    if (!(std::isalpha(c0) || c0 == '_')) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '_' || u == '.';
    });
}

// A backtick inside a quoted name is doubled
std::string quote_column(const std::string& name) {
    if (is_plain_identifier(name)) return name;
    std::string out = "`";
    for (char c : name) {
        if (c == '`') out += '`';
        out += c;
    }
    out += '`';
    return out;
}

std::string quote_string(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string literal_text(const Value& v) {
    if (ooc::is_na(v)) return "NA";
    if (const auto* s = std::get_if<std::string>(&v)) return quote_string(*s);
    if (const auto* d = std::get_if<Date>(&v)) return "date('" + format_date(*d) + "')";
    if (std::holds_alternative<double>(v)) {
        std::string text = format_value(v);
        if (text == "inf" || text == "-inf" || text == "nan") {
            return "float('" + text + "')";
        }
        if (text.find_first_of(".eE") == std::string::npos) text += ".0";
        return text;
    }
    return format_value(v);
}

} // namespace

// =============================================================================
// Expr
// =============================================================================

Expr Expr::literal(Value v) {
    auto n = std::make_shared<Node>();
    n->kind = Kind::Literal;
    n->literal = std::move(v);
    return Expr(std::move(n));
}

Expr Expr::boolean(bool b) {
    auto n = std::make_shared<Node>();
    n->kind = Kind::Boolean;
    n->boolean = b;
    return Expr(std::move(n));
}

Expr Expr::column(std::string name) {
    auto n = std::make_shared<Node>();
    n->kind = Kind::Column;
    n->column = std::move(name);
    return Expr(std::move(n));
}

Expr Expr::unary(UnaryOp op, Expr operand) {
    auto n = std::make_shared<Node>();
    n->kind = Kind::Unary;
    n->unary_op = op;
    n->args.push_back(std::move(operand));
    return Expr(std::move(n));
}

Expr Expr::binary(BinaryOp op, Expr lhs, Expr rhs) {
    auto n = std::make_shared<Node>();
    n->kind = Kind::Binary;
    n->binary_op = op;
    n->args.push_back(std::move(lhs));
    n->args.push_back(std::move(rhs));
    return Expr(std::move(n));
}

Expr Expr::is_na(std::string column) {
    auto n = std::make_shared<Node>();
    n->kind = Kind::IsNa;
    n->column = std::move(column);
    return Expr(std::move(n));
}

std::string Expr::to_string() const {
    const Node& n = *node_;
    switch (n.kind) {
        case Kind::Literal: return literal_text(n.literal);
        case Kind::Boolean: return n.boolean ? "true" : "false";
        case Kind::Column:  return quote_column(n.column);
        case Kind::IsNa:    return "is_na(" + quote_column(n.column) + ")";
        case Kind::Unary:
            return std::string("(") + op_symbol(n.unary_op) + n.args[0].to_string() + ")";
        case Kind::Binary:
            return "(" + n.args[0].to_string() + " " + op_symbol(n.binary_op) + " " +
                   n.args[1].to_string() + ")";
    }
    return {};
}

std::vector<std::string> Expr::columns() const {
    std::vector<std::string> out;
    std::vector<const Node*> stack{node_.get()};
    while (!stack.empty()) {
        const Node* n = stack.back();
        stack.pop_back();
        if (n->kind == Kind::Column || n->kind == Kind::IsNa) {
            if (std::find(out.begin(), out.end(), n->column) == out.end()) {
                out.push_back(n->column);
            }
        }
        for (auto it = n->args.rbegin(); it != n->args.rend(); ++it) {
            stack.push_back(&it->node());
        }
    }
    return out;
}

// =============================================================================
// Parser
// =============================================================================

namespace {

enum class TokenKind { End, Int, Float, String, Ident, QuotedIdent, Symbol };

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;
    std::size_t offset = 0;
};

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        for (;;) {
            skip_space();
            Token t;
            t.offset = pos_;
            if (pos_ >= src_.size()) {
                out.push_back(t);
                return out;
            }
            char c = src_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && pos_ + 1 < src_.size() &&
                 std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                lex_number(t);
            } else if (c == '\'' || c == '"') {
                lex_string(t, c);
            } else if (c == '`') {
                lex_quoted_ident(t);
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                std::size_t start = pos_;
                while (pos_ < src_.size()) {
                    auto u = static_cast<unsigned char>(src_[pos_]);
                    if (!(std::isalnum(u) || u == '_' || u == '.')) break;
                    ++pos_;
                }
                t.kind = TokenKind::Ident;
                t.text = std::string(src_.substr(start, pos_ - start));
            } else {
                lex_symbol(t);
            }
            out.push_back(std::move(t));
        }
    }

private:
    [[noreturn]] void fail(const std::string& msg, std::size_t at) const {
        throw ParseError(msg + " at offset " + std::to_string(at), 1);
    }

    void skip_space() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    void lex_number(Token& t) {
        std::size_t start = pos_;
        bool is_float = false;
        auto digits = [&] {
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        };
        digits();
        if (pos_ < src_.size() && src_[pos_] == '.') {
            is_float = true;
            ++pos_;
            digits();
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            std::size_t save = pos_;
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) ++pos_;
            if (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                is_float = true;
                digits();
            } else {
                pos_ = save;
            }
        }
        t.kind = is_float ? TokenKind::Float : TokenKind::Int;
        t.text = std::string(src_.substr(start, pos_ - start));
    }

    void lex_string(Token& t, char q) {
        std::size_t start = pos_++;
        std::string out;
        while (pos_ < src_.size()) {
            char c = src_[pos_++];
            if (c == q) {
                if (pos_ < src_.size() && src_[pos_] == q) {
                    out += q;
                    ++pos_;
                    continue;
                }
                t.kind = TokenKind::String;
                t.text = std::move(out);
                return;
            }
            if (c == '\\' && pos_ < src_.size()) {
                char e = src_[pos_++];
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    default:  out += e; break;
                }
                continue;
            }
            out += c;
        }
        fail("unterminated string literal", start);
    }

    void lex_quoted_ident(Token& t) {
        std::size_t start = pos_++;
        std::string name;
        for (;;) {
            std::size_t end = src_.find('`', pos_);
            if (end == std::string_view::npos) {
                fail("unterminated quoted column name", start);
            }
            name.append(src_.substr(pos_, end - pos_));
            pos_ = end + 1;
            if (pos_ < src_.size() && src_[pos_] == '`') {
                name += '`';
                ++pos_;
                continue;
            }
            break;
        }
        if (name.empty()) {
            fail("empty quoted column name", start);
        }
        t.kind = TokenKind::QuotedIdent;
        t.text = std::move(name);
    }

    void lex_symbol(Token& t) {
        static constexpr std::string_view kTwo[] = {"||", "&&", "==", "!=", "<=", ">="};
        static constexpr std::string_view kOne = "&!=<>+-*/()";
        t.kind = TokenKind::Symbol;
        for (auto sym : kTwo) {
            if (src_.substr(pos_, 2) == sym) {
                t.text = std::string(sym);
                pos_ += 2;
                return;
            }
        }
        if (kOne.find(src_[pos_]) != std::string_view::npos) {
            t.text = std::string(1, src_[pos_]);
            ++pos_;
            return;
        }
        fail(std::string("unexpected character '") + src_[pos_] + "'", pos_);
    }

    std::string_view src_;
    std::size_t pos_ = 0;
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Expr parse() {
        if (peek().kind == TokenKind::End) {
            fail("empty predicate");
        }
        Expr e = parse_or();
        if (peek().kind != TokenKind::End) {
            fail("unexpected '" + peek().text + "'");
        }
        return e;
    }

private:
    [[noreturn]] void fail(const std::string& msg) const {
        throw ParseError(msg + " at offset " + std::to_string(peek().offset), 1);
    }

    const Token& peek(std::size_t ahead = 0) const {
        std::size_t i = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[i];
    }

    Token take() {
        Token t = peek();
        if (pos_ < tokens_.size() - 1) ++pos_;
        return t;
    }

    bool symbol(std::string_view s) const {
        return peek().kind == TokenKind::Symbol && peek().text == s;
    }

    bool word(std::string_view s) const {
        return peek().kind == TokenKind::Ident && peek().text == s;
    }

    void expect_symbol(std::string_view s) {
        if (!symbol(s)) {
            fail("expected '" + std::string(s) + "'");
        }
        take();
    }

    Expr parse_or() {
        Expr lhs = parse_and();
        while (symbol("||") || word("or")) {
            take();
            lhs = Expr::binary(BinaryOp::Or, std::move(lhs), parse_and());
        }
        return lhs;
    }

    Expr parse_and() {
        Expr lhs = parse_not();
        while (symbol("&&") || symbol("&") || word("and")) {
            take();
            lhs = Expr::binary(BinaryOp::And, std::move(lhs), parse_not());
        }
        return lhs;
    }

    Expr parse_not() {
        if (symbol("!") || word("not")) {
            take();
            return Expr::unary(UnaryOp::Not, parse_not());
        }
        return parse_cmp();
    }

    Expr parse_cmp() {
        Expr lhs = parse_sum();
        if (peek().kind == TokenKind::Symbol) {
            const std::string& s = peek().text;
            BinaryOp op;
            if (s == "==" || s == "=") op = BinaryOp::Eq;
            else if (s == "!=") op = BinaryOp::Ne;
            else if (s == "<") op = BinaryOp::Lt;
            else if (s == "<=") op = BinaryOp::Le;
            else if (s == ">") op = BinaryOp::Gt;
            else if (s == ">=") op = BinaryOp::Ge;
            else return lhs;
            take();
            return Expr::binary(op, std::move(lhs), parse_sum());
        }
        return lhs;
    }

    Expr parse_sum() {
        Expr lhs = parse_prod();
        while (symbol("+") || symbol("-")) {
            BinaryOp op = take().text == "+" ? BinaryOp::Add : BinaryOp::Sub;
            lhs = Expr::binary(op, std::move(lhs), parse_prod());
        }
        return lhs;
    }

    Expr parse_prod() {
        Expr lhs = parse_unary();
        while (symbol("*") || symbol("/")) {
            BinaryOp op = take().text == "*" ? BinaryOp::Mul : BinaryOp::Div;
            lhs = Expr::binary(op, std::move(lhs), parse_unary());
        }
        return lhs;
    }

    Expr parse_unary() {
        if (symbol("-")) {
            take();
            return Expr::unary(UnaryOp::Negate, parse_unary());
        }
        return parse_primary();
    }

    std::string column_name() {
        const Token& t = peek();
        if (t.kind == TokenKind::QuotedIdent ||
            (t.kind == TokenKind::Ident && !is_keyword(t.text))) {
            return take().text;
        }
        fail("expected a column name");
    }

    Expr parse_primary() {
        const Token& t = peek();
        switch (t.kind) {
            case TokenKind::Int: {
                std::int64_t v = 0;
                auto [ptr, ec] = std::from_chars(t.text.data(), t.text.data() + t.text.size(), v);
                if (ec != std::errc() || ptr != t.text.data() + t.text.size()) {
                    fail("integer literal out of range");
                }
                take();
                return Expr::literal(Value{v});
            }
            case TokenKind::Float: {
                auto v = parse_value(t.text, ColumnType::Float);
                if (!v) {
                    fail("malformed float literal");
                }
                take();
                return Expr::literal(std::move(*v));
            }
            case TokenKind::String:
                return Expr::literal(Value{take().text});
            case TokenKind::QuotedIdent:
                return Expr::column(take().text);
            case TokenKind::Ident: {
                if (t.text == "true" || t.text == "false") {
                    return Expr::boolean(take().text == "true");
                }
                if (t.text == "NA") {
                    take();
                    return Expr::literal(Value{});
                }
                if (t.text == "date" && peek(1).kind == TokenKind::Symbol && peek(1).text == "(") {
                    take();
                    take();
                    if (peek().kind != TokenKind::String) {
                        fail("date() expects a quoted YYYY-MM-DD string");
                    }
                    auto d = parse_date(peek().text);
                    if (!d) {
                        fail("invalid date '" + peek().text + "'");
                    }
                    take();
                    expect_symbol(")");
                    return Expr::literal(Value{*d});
                }
                if (t.text == "float" && peek(1).kind == TokenKind::Symbol && peek(1).text == "(") {
                    take();
                    take();
                    if (peek().kind != TokenKind::String) {
                        fail("float() expects a quoted number, 'inf' or 'nan'");
                    }
                    auto v = parse_value(peek().text, ColumnType::Float);
                    if (!v || ooc::is_na(*v)) {
                        fail("invalid float '" + peek().text + "'");
                    }
                    take();
                    expect_symbol(")");
                    return Expr::literal(std::move(*v));
                }
                if (t.text == "is_na" && peek(1).kind == TokenKind::Symbol && peek(1).text == "(") {
                    take();
                    take();
                    std::string name = column_name();
                    expect_symbol(")");
                    return Expr::is_na(std::move(name));
                }
                if (is_keyword(t.text)) {
                    fail("unexpected keyword '" + t.text + "'");
                }
                return Expr::column(take().text);
            }
            case TokenKind::Symbol:
                if (t.text == "(") {
                    take();
                    Expr e = parse_or();
                    expect_symbol(")");
                    return e;
                }
                fail("unexpected '" + t.text + "'");
            case TokenKind::End:
                fail("unexpected end of predicate");
        }
        fail("unexpected token");
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
};

} // namespace

Expr parse_predicate(std::string_view text) {
    return Parser(Lexer(text).run()).parse();
}

// =============================================================================
// BoundExpr
// =============================================================================

struct BoundExpr::Node {
    Expr::Kind kind;
    ExprType type;
    Cell literal;
    std::size_t column = 0;
    UnaryOp unary_op = UnaryOp::Not;
    BinaryOp binary_op = BinaryOp::And;
    std::vector<std::shared_ptr<const Node>> args;
};

namespace {

using NodePtr = std::shared_ptr<const BoundExpr::Node>;

ExprType column_expr_type(ColumnType t) noexcept {
    switch (t) {
        case ColumnType::Integer: return ExprType::Integer;
        case ColumnType::Float:   return ExprType::Float;
        case ColumnType::Date:    return ExprType::Date;
        default:                  return ExprType::Text;
    }
}

ExprType literal_type(const Value& v) noexcept {
    switch (v.index()) {
        case 1:  return ExprType::Integer;
        case 2:  return ExprType::Float;
        case 3:  return ExprType::Text;
        case 4:  return ExprType::Date;
        default: return ExprType::Null;
    }
}

bool numeric_or_null(ExprType t) noexcept {
    return t == ExprType::Integer || t == ExprType::Float || t == ExprType::Null;
}

bool boolean_or_null(ExprType t) noexcept {
    return t == ExprType::Boolean || t == ExprType::Null;
}

// Comparison class: numeric types compare with each other
int compare_class(ExprType t) noexcept {
    switch (t) {
        case ExprType::Integer:
        case ExprType::Float:   return 0;
        case ExprType::Text:    return 1;
        case ExprType::Date:    return 2;
        case ExprType::Boolean: return 3;
        default:                return -1;
    }
}

Cell to_cell(const Value& v) {
    return std::visit([](const auto& x) -> Cell { return x; }, v);
}

[[noreturn]] void mismatch(const std::string& what, ExprType a, ExprType b, const Expr& at) {
    throw TypeMismatchError(what + " " + expr_type_name(a) + " and " + expr_type_name(b) +
                            " in " + at.to_string());
}

NodePtr bind_node(const Expr& expr, const Schema& schema) {
    const auto& src = expr.node();
    auto n = std::make_shared<BoundExpr::Node>();
    n->kind = src.kind;

    switch (src.kind) {
        case Expr::Kind::Literal:
            n->type = literal_type(src.literal);
            n->literal = to_cell(src.literal);
            break;
        case Expr::Kind::Boolean:
            n->type = ExprType::Boolean;
            n->literal = src.boolean;
            break;
        case Expr::Kind::Column:
            n->column = schema.require(src.column);
            n->type = column_expr_type(schema[n->column].type);
            break;
        case Expr::Kind::IsNa:
            n->column = schema.require(src.column);
            n->type = ExprType::Boolean;
            break;
        case Expr::Kind::Unary: {
            auto arg = bind_node(src.args[0], schema);
            n->unary_op = src.unary_op;
            if (src.unary_op == UnaryOp::Not) {
                if (!boolean_or_null(arg->type)) {
                    throw TypeMismatchError(std::string("'!' needs a boolean operand, got ") +
                                            expr_type_name(arg->type) + " in " + expr.to_string());
                }
                n->type = ExprType::Boolean;
            } else {
                if (!numeric_or_null(arg->type)) {
                    throw TypeMismatchError(std::string("'-' needs a numeric operand, got ") +
                                            expr_type_name(arg->type) + " in " + expr.to_string());
                }
                n->type = arg->type;
            }
            n->args.push_back(std::move(arg));
            break;
        }
        case Expr::Kind::Binary: {
            auto lhs = bind_node(src.args[0], schema);
            auto rhs = bind_node(src.args[1], schema);
            const ExprType a = lhs->type;
            const ExprType b = rhs->type;
            n->binary_op = src.binary_op;

            switch (src.binary_op) {
                case BinaryOp::And:
                case BinaryOp::Or:
                    if (!boolean_or_null(a) || !boolean_or_null(b)) {
                        mismatch("Logical operator needs boolean operands, got", a, b, expr);
                    }
                    n->type = ExprType::Boolean;
                    break;
                case BinaryOp::Eq:
                case BinaryOp::Ne:
                case BinaryOp::Lt:
                case BinaryOp::Le:
                case BinaryOp::Gt:
                case BinaryOp::Ge: {
                    const int ca = compare_class(a);
                    const int cb = compare_class(b);
                    if (ca >= 0 && cb >= 0 && ca != cb) {
                        mismatch("Cannot compare", a, b, expr);
                    }
                    const bool ordering = src.binary_op != BinaryOp::Eq && src.binary_op != BinaryOp::Ne;
                    if (ordering && (a == ExprType::Boolean || b == ExprType::Boolean)) {
                        mismatch("Cannot order", a, b, expr);
                    }
                    n->type = ExprType::Boolean;
                    break;
                }
                case BinaryOp::Add:
                case BinaryOp::Sub:
                case BinaryOp::Mul:
                case BinaryOp::Div:
                    if (!numeric_or_null(a) || !numeric_or_null(b)) {
                        mismatch("Arithmetic needs numeric operands, got", a, b, expr);
                    }
                    if (a == ExprType::Null && b == ExprType::Null) {
                        n->type = ExprType::Null;
                    } else if (src.binary_op == BinaryOp::Div ||
                               a == ExprType::Float || b == ExprType::Float) {
                        n->type = ExprType::Float;
                    } else {
                        n->type = ExprType::Integer;
                    }
                    break;
            }
            n->args.push_back(std::move(lhs));
            n->args.push_back(std::move(rhs));
            break;
        }
    }
    return n;
}

double as_double(const Cell& c) {
    if (const auto* i = std::get_if<std::int64_t>(&c)) return static_cast<double>(*i);
    return std::get<double>(c);
}

// Precondition: neither side is NA and both are in the same comparison class
int compare_cells(const Cell& a, const Cell& b) {
    const auto* ai = std::get_if<std::int64_t>(&a);
    const auto* bi = std::get_if<std::int64_t>(&b);
    if (ai && bi) {
        return (*ai < *bi) ? -1 : (*ai > *bi ? 1 : 0);
    }
    if (ai || bi || std::holds_alternative<double>(a)) {
        const double x = as_double(a);
        const double y = as_double(b);
        if (x < y) return -1;
        if (x > y) return 1;
        if (x == y) return 0;
        return 2;   // unordered (NaN)
    }
    if (const auto* as = std::get_if<std::string>(&a)) {
        const int r = as->compare(std::get<std::string>(b));
        return (r < 0) ? -1 : (r > 0 ? 1 : 0);
    }
    if (const auto* ad = std::get_if<Date>(&a)) {
        const auto bd = std::get<Date>(b);
        return (*ad < bd) ? -1 : (*ad > bd ? 1 : 0);
    }
    const bool ab = std::get<bool>(a);
    const bool bb = std::get<bool>(b);
    return (ab == bb) ? 0 : (ab ? 1 : -1);
}

Cell evaluate_node(const BoundExpr::Node& n, const Row& row);

Cell evaluate_logical(const BoundExpr::Node& n, const Row& row) {
    const bool is_and = n.binary_op == BinaryOp::And;
    const Cell lhs = evaluate_node(*n.args[0], row);
    const auto* lb = std::get_if<bool>(&lhs);
    if (lb && *lb != is_and) {
        return *lb;   // false && x, true || x
    }
    const Cell rhs = evaluate_node(*n.args[1], row);
    const auto* rb = std::get_if<bool>(&rhs);
    if (rb && *rb != is_and) {
        return *rb;
    }
    if (lb && rb) {
        return is_and;
    }
    return std::monostate{};
}

Cell evaluate_arithmetic(BinaryOp op, const Cell& a, const Cell& b) {
    const auto* ai = std::get_if<std::int64_t>(&a);
    const auto* bi = std::get_if<std::int64_t>(&b);
    if (ai && bi) {
        std::int64_t out = 0;
        switch (op) {
            case BinaryOp::Add:
                if (__builtin_add_overflow(*ai, *bi, &out)) return std::monostate{};
                return out;
            case BinaryOp::Sub:
                if (__builtin_sub_overflow(*ai, *bi, &out)) return std::monostate{};
                return out;
            case BinaryOp::Mul:
                if (__builtin_mul_overflow(*ai, *bi, &out)) return std::monostate{};
                return out;
            default:
                if (*bi == 0) return std::monostate{};
                return static_cast<double>(*ai) / static_cast<double>(*bi);
        }
    }
    const double x = as_double(a);
    const double y = as_double(b);
    switch (op) {
        case BinaryOp::Add: return x + y;
        case BinaryOp::Sub: return x - y;
        case BinaryOp::Mul: return x * y;
        default:            return x / y;
    }
}

Cell evaluate_node(const BoundExpr::Node& n, const Row& row) {
    switch (n.kind) {
        case Expr::Kind::Literal:
        case Expr::Kind::Boolean:
            return n.literal;
        case Expr::Kind::Column:
            return to_cell(row[n.column]);
        case Expr::Kind::IsNa:
            return ooc::is_na(row[n.column]);
        case Expr::Kind::Unary: {
            const Cell v = evaluate_node(*n.args[0], row);
            if (std::holds_alternative<std::monostate>(v)) return v;
            if (n.unary_op == UnaryOp::Not) return !std::get<bool>(v);
            if (const auto* i = std::get_if<std::int64_t>(&v)) {
                if (*i == std::numeric_limits<std::int64_t>::min()) return std::monostate{};
                return -*i;
            }
            return -std::get<double>(v);
        }
        case Expr::Kind::Binary: {
            if (n.binary_op == BinaryOp::And || n.binary_op == BinaryOp::Or) {
                return evaluate_logical(n, row);
            }
            const Cell a = evaluate_node(*n.args[0], row);
            const Cell b = evaluate_node(*n.args[1], row);
            if (std::holds_alternative<std::monostate>(a) || std::holds_alternative<std::monostate>(b)) {
                return std::monostate{};
            }
            switch (n.binary_op) {
                case BinaryOp::Eq: return compare_cells(a, b) == 0;
                case BinaryOp::Ne: return compare_cells(a, b) != 0;
                case BinaryOp::Lt: return compare_cells(a, b) == -1;
                case BinaryOp::Le: { int c = compare_cells(a, b); return c == -1 || c == 0; }
                case BinaryOp::Gt: return compare_cells(a, b) == 1;
                case BinaryOp::Ge: { int c = compare_cells(a, b); return c == 1 || c == 0; }
                default:           return evaluate_arithmetic(n.binary_op, a, b);
            }
        }
    }
    return std::monostate{};
}

} // namespace

BoundExpr BoundExpr::bind(const Expr& expr, const Schema& schema) {
    auto root = bind_node(expr, schema);
    const ExprType type = root->type;
    return BoundExpr(std::move(root), type);
}

BoundExpr BoundExpr::bind_predicate(const Expr& expr, const Schema& schema) {
    BoundExpr bound = bind(expr, schema);
    if (!boolean_or_null(bound.type())) {
        throw TypeMismatchError(std::string("Filter predicate must be boolean, got ") +
                                expr_type_name(bound.type()) + " in " + expr.to_string());
    }
    return bound;
}

Cell BoundExpr::evaluate(const Row& row) const {
    return evaluate_node(*root_, row);
}

Truth BoundExpr::test(const Row& row) const {
    const Cell c = evaluate_node(*root_, row);
    if (const auto* b = std::get_if<bool>(&c)) {
        return *b ? Truth::True : Truth::False;
    }
    return Truth::Na;
}

} // namespace ooc::query
