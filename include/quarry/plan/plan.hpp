#pragma once

#include <quarry/catalog/catalog.hpp>
#include <quarry/core/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry::plan {

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Reference to a position of the working tuple the expression is evaluated on.
struct SlotRef {
    std::size_t slot = 0;
    std::string label;
};

struct Literal {
    Value value;
};

/// Positional query argument, bound at execution time.
struct Param {
    std::size_t index = 0;
};

enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Concat,
};

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

enum class LogicalOp : std::uint8_t {
    And,
    Or,
};

/// Scalar functions evaluated by the materializer.
enum class ScalarFn : std::uint8_t {
    Lower,
    Upper,
    Concat,
    Length,
    Abs,
    Coalesce,
};

struct Arith {
    ArithmeticOp op = ArithmeticOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct Compare {
    CompareOp op = CompareOp::Eq;
    ExprPtr left;
    ExprPtr right;
};

struct Logical {
    LogicalOp op = LogicalOp::And;
    ExprPtr left;
    ExprPtr right;
};

struct Not {
    ExprPtr operand;
};

struct Negate {
    ExprPtr operand;
};

struct NullTest {
    ExprPtr operand;
    bool negated = false;
};

struct Call {
    ScalarFn fn = ScalarFn::Lower;
    std::vector<ExprPtr> args;
};

struct Expr {
    std::variant<SlotRef, Literal, Param, Arith, Compare, Logical, Not, Negate, NullTest, Call> node;
};

enum class AggFunc : std::uint8_t {
    CountStar,
    Count,
    Sum,
    Avg,
    Min,
    Max,
};

/// Aggregate over the joined tuple. `arg` is null for count(*).
struct AggSpec {
    AggFunc func = AggFunc::CountStar;
    ExprPtr arg;
    std::string label;
};

enum class AccessKind : std::uint8_t {
    FullScan,
    IndexEquality,
    IndexRange,
};

/// Index bound; `value` is a Literal or Param expression.
struct BoundExpr {
    ExprPtr value;
    bool inclusive = true;
};

struct AccessPath {
    AccessKind kind = AccessKind::FullScan;
    std::size_t field = 0;
    std::optional<BoundExpr> lower;
    std::optional<BoundExpr> upper;
};

enum class JoinStrategy : std::uint8_t {
    /// First table; scanned in every target partition.
    Driving,
    /// Rows for a given join key live in the same partition as the left side.
    Colocated,
    /// Table lives in a replicated cache; every partition holds a full copy.
    Replicated,
    /// Filtered rows from all partitions are shipped to each partition.
    Broadcast,
};

/// Equi-join key: `left_slot` of the tuple built so far equals `right_field`.
struct JoinKey {
    std::size_t left_slot = 0;
    std::size_t right_field = 0;
};

struct JoinStep {
    std::size_t table = 0;
    const catalog::TypeDescriptor* type = nullptr;
    std::string alias;
    /// First slot of this table within the joined tuple.
    std::size_t offset = 0;
    JoinStrategy strategy = JoinStrategy::Driving;
    AccessPath access;
    /// Single-table conjuncts, bound to the table's own row (slot = field position).
    std::vector<ExprPtr> filters;
    std::vector<JoinKey> keys;
    /// Index into `keys` served by an index lookup per left row.
    std::optional<std::size_t> lookup_key;
};

struct SortKey {
    ExprPtr expr;
    bool ascending = true;
};

enum class RouteKind : std::uint8_t {
    AllPartitions,
    SinglePartition,
};

struct Routing {
    RouteKind kind = RouteKind::AllPartitions;
    /// Placement value deciding the single partition (Literal or Param).
    ExprPtr placement;
};

/// A planned SELECT. Built per execution and never cached.
struct QueryPlan {
    std::string sql;
    std::vector<JoinStep> steps;
    std::size_t tuple_width = 0;
    /// Multi-table conjuncts that are not equi-join keys, over the joined tuple.
    std::vector<ExprPtr> residual;

    std::vector<std::string> columns;
    /// Non-aggregate plans: over the joined tuple. Aggregate plans: over the
    /// group tuple [group keys..., aggregate results...].
    std::vector<ExprPtr> projection;

    bool aggregate = false;
    std::vector<ExprPtr> group_keys;
    std::vector<AggSpec> aggregates;

    /// Same evaluation space as `projection`.
    std::vector<SortKey> order_by;
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> offset;

    Routing routing;
    std::size_t param_count = 0;

    /// Cache whose partitions the main fragment fans out over.
    [[nodiscard]] auto driving() const -> const JoinStep& { return steps.front(); }
};

[[nodiscard]] auto make_slot(std::size_t slot, std::string label = {}) -> ExprPtr;
[[nodiscard]] auto make_literal(Value value) -> ExprPtr;

[[nodiscard]] auto strategy_name(JoinStrategy strategy) noexcept -> const char*;
[[nodiscard]] auto agg_name(AggFunc func) noexcept -> const char*;

/// Render an expression tree in SQL-like form.
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

/// Render a plan as indented text (EXPLAIN output).
[[nodiscard]] auto to_string(const QueryPlan& plan) -> std::string;

}  // namespace quarry::plan
