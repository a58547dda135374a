#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry::parser {

struct NullLiteral {};

struct ColumnRefExpr {
    std::optional<std::string> table;
    std::string column;
};

struct LiteralExpr {
    std::variant<NullLiteral, std::int64_t, double, bool, std::string> value;
};

/// Positional `?` placeholder; `index` is zero-based in order of appearance.
struct ParamExpr {
    std::size_t index = 0;
};

enum class UnaryOp : std::uint8_t {
    Negate,
    Not,
    IsNull,
    IsNotNull,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Concat,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct CallExpr {
    std::string callee;
    std::vector<ExprPtr> args;
    /// `count(*)`.
    bool star = false;
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Negate;
    ExprPtr expr;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct Expr {
    std::variant<ColumnRefExpr, LiteralExpr, ParamExpr, CallExpr, UnaryExpr, BinaryExpr> node;
    /// Source text the expression was parsed from; used for labels and errors.
    std::string text;
};

/// `*` or `T.*` in the select list.
struct StarItem {
    std::optional<std::string> table;
};

struct ExprItem {
    ExprPtr expr;
    std::optional<std::string> alias;
};

using SelectItem = std::variant<StarItem, ExprItem>;

struct TableRef {
    /// Cache name qualifier, e.g. `"replicated".Product`.
    std::optional<std::string> schema;
    std::string name;
    std::optional<std::string> alias;
};

struct OrderItem {
    ExprPtr expr;
    bool ascending = true;
};

struct SelectStmt {
    std::vector<SelectItem> items;
    std::vector<TableRef> from;
    ExprPtr where;
    std::vector<ExprPtr> group_by;
    std::vector<OrderItem> order_by;
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> offset;
    /// Number of `?` placeholders.
    std::size_t param_count = 0;
};

}  // namespace quarry::parser
