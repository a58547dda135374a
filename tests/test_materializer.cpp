#include <quarry/plan/plan.hpp>
#include <quarry/runtime/aggregate.hpp>
#include <quarry/runtime/materializer.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using namespace quarry;
using plan::ExprPtr;

auto node(plan::Expr expr) -> ExprPtr {
    return std::make_shared<const plan::Expr>(std::move(expr));
}

auto lit(Value value) -> ExprPtr {
    return plan::make_literal(std::move(value));
}

auto arith(plan::ArithmeticOp op, ExprPtr l, ExprPtr r) -> ExprPtr {
    return node(plan::Expr{.node = plan::Arith{.op = op, .left = std::move(l), .right = std::move(r)}});
}

auto cmp(plan::CompareOp op, ExprPtr l, ExprPtr r) -> ExprPtr {
    return node(plan::Expr{.node = plan::Compare{.op = op, .left = std::move(l), .right = std::move(r)}});
}

auto logical(plan::LogicalOp op, ExprPtr l, ExprPtr r) -> ExprPtr {
    return node(plan::Expr{.node = plan::Logical{.op = op, .left = std::move(l), .right = std::move(r)}});
}

auto call(plan::ScalarFn fn, std::vector<ExprPtr> args) -> ExprPtr {
    return node(plan::Expr{.node = plan::Call{.fn = fn, .args = std::move(args)}});
}

auto eval(const ExprPtr& expr, const Row& tuple = {}, const Row& args = {}) -> Value {
    auto value = runtime::evaluate(*expr, tuple, args);
    if (!value.has_value()) {
        FAIL(value.error().format());
    }
    return std::move(value.value());
}

auto i32(std::int32_t v) -> Value {
    return Value{v};
}

auto i64(std::int64_t v) -> Value {
    return Value{v};
}

auto str(const char* v) -> Value {
    return Value{std::string{v}};
}

}  // namespace

TEST_CASE("Slots and parameters read the tuple and the arguments") {
    const Row tuple{i32(5), str("x")};
    const Row args{str("arg")};
    REQUIRE(eval(plan::make_slot(1), tuple) == str("x"));
    REQUIRE(eval(node(plan::Expr{.node = plan::Param{.index = 0}}), tuple, args) == str("arg"));

    auto missing = runtime::evaluate(plan::Expr{.node = plan::Param{.index = 1}}, tuple, args);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Integer arithmetic keeps width and detects overflow") {
    using plan::ArithmeticOp;
    REQUIRE(eval(arith(ArithmeticOp::Add, lit(i32(2)), lit(i32(3)))) == i32(5));
    REQUIRE(eval(arith(ArithmeticOp::Mul, lit(i32(4)), lit(i64(3)))) == i64(12));
    REQUIRE(eval(arith(ArithmeticOp::Div, lit(i32(7)), lit(i32(2)))) == i32(3));
    REQUIRE(eval(arith(ArithmeticOp::Mod, lit(i32(7)), lit(i32(4)))) == i32(3));

    auto overflow = runtime::evaluate(
        *arith(ArithmeticOp::Add, lit(i32(std::numeric_limits<std::int32_t>::max())), lit(i32(1))),
        {}, {});
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().code == ErrorCode::Execution);

    auto by_zero = runtime::evaluate(*arith(ArithmeticOp::Div, lit(i32(1)), lit(i32(0))), {}, {});
    REQUIRE_FALSE(by_zero.has_value());
    REQUIRE(by_zero.error().code == ErrorCode::Execution);
}

TEST_CASE("BIGINT arithmetic reports overflow instead of wrapping") {
    using plan::ArithmeticOp;
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    auto require_overflow = [](const ExprPtr& expr) {
        auto value = runtime::evaluate(*expr, {}, {});
        REQUIRE_FALSE(value.has_value());
        REQUIRE(value.error().code == ErrorCode::Execution);
        REQUIRE(value.error().message == "BIGINT overflow");
    };

    require_overflow(arith(ArithmeticOp::Add, lit(i64(kMax)), lit(i32(1))));
    require_overflow(arith(ArithmeticOp::Sub, lit(i64(kMin)), lit(i64(1))));
    require_overflow(arith(ArithmeticOp::Mul, lit(i64(kMax / 2 + 1)), lit(i64(2))));
    require_overflow(arith(ArithmeticOp::Div, lit(i64(kMin)), lit(i64(-1))));
    require_overflow(node(plan::Expr{.node = plan::Negate{.operand = lit(i64(kMin))}}));
    require_overflow(call(plan::ScalarFn::Abs, {lit(i64(kMin))}));

    REQUIRE(eval(arith(ArithmeticOp::Mod, lit(i64(kMin)), lit(i64(-1)))) == i64(0));
    REQUIRE(eval(arith(ArithmeticOp::Add, lit(i64(kMax - 1)), lit(i32(1)))) == i64(kMax));
    REQUIRE(eval(arith(ArithmeticOp::Div, lit(i32(std::numeric_limits<std::int32_t>::min())),
                       lit(i64(-1)))) == i64(2147483648LL));
}

TEST_CASE("Integer sums report overflow") {
    runtime::AggState sum;
    REQUIRE(runtime::accumulate(sum, plan::AggFunc::Sum,
                                i64(std::numeric_limits<std::int64_t>::max()))
                .has_value());
    auto status = runtime::accumulate(sum, plan::AggFunc::Sum, i32(1));
    REQUIRE_FALSE(status.has_value());
    REQUIRE(status.error().code == ErrorCode::Execution);

    runtime::AggState left;
    runtime::AggState right;
    REQUIRE(runtime::accumulate(left, plan::AggFunc::Avg,
                                i64(std::numeric_limits<std::int64_t>::min()))
                .has_value());
    REQUIRE(runtime::accumulate(right, plan::AggFunc::Avg, i64(-1)).has_value());
    REQUIRE_FALSE(runtime::merge_state(left, right).has_value());
}

TEST_CASE("Mixed arithmetic promotes to double") {
    auto value = eval(arith(plan::ArithmeticOp::Div, lit(i32(1)), lit(Value{4.0})));
    REQUIRE(std::get<double>(value) == Catch::Approx(0.25));
}

TEST_CASE("Concatenation renders operands as text") {
    REQUIRE(eval(arith(plan::ArithmeticOp::Concat, lit(str("n")), lit(i32(7)))) == str("n7"));
    REQUIRE(is_null(eval(arith(plan::ArithmeticOp::Concat, lit(str("n")), lit(Value{})))));
    REQUIRE(eval(call(plan::ScalarFn::Concat, {lit(str("a")), lit(Value{}), lit(str("b"))})) ==
            str("ab"));
}

TEST_CASE("NULL propagates through arithmetic and comparison") {
    REQUIRE(is_null(eval(arith(plan::ArithmeticOp::Add, lit(Value{}), lit(i32(1))))));
    REQUIRE(is_null(eval(cmp(plan::CompareOp::Eq, lit(Value{}), lit(Value{})))));

    auto predicate = runtime::evaluate_predicate(*cmp(plan::CompareOp::Eq, lit(Value{}), lit(i32(1))),
                                                 {}, {});
    REQUIRE(predicate.has_value());
    REQUIRE_FALSE(*predicate);
}

TEST_CASE("Comparisons cross numeric widths") {
    REQUIRE(eval(cmp(plan::CompareOp::Eq, lit(i32(3)), lit(Value{3.0}))) == Value{true});
    REQUIRE(eval(cmp(plan::CompareOp::Lt, lit(str("abc")), lit(str("abd")))) == Value{true});
    REQUIRE(eval(cmp(plan::CompareOp::Ge, lit(i64(2)), lit(i32(3)))) == Value{false});
}

TEST_CASE("AND and OR follow three-valued logic") {
    using plan::LogicalOp;
    const auto t = lit(Value{true});
    const auto f = lit(Value{false});
    const auto n = lit(Value{});
    REQUIRE(eval(logical(LogicalOp::And, f, n)) == Value{false});
    REQUIRE(is_null(eval(logical(LogicalOp::And, t, n))));
    REQUIRE(eval(logical(LogicalOp::Or, n, t)) == Value{true});
    REQUIRE(is_null(eval(logical(LogicalOp::Or, f, n))));
    REQUIRE(is_null(eval(node(plan::Expr{.node = plan::Not{.operand = n}}))));

    // The right side is never evaluated once the left decides.
    const auto failing = arith(plan::ArithmeticOp::Div, lit(i32(1)), lit(i32(0)));
    REQUIRE(eval(logical(LogicalOp::And, f, failing)) == Value{false});

    auto not_boolean = runtime::evaluate(*logical(LogicalOp::And, lit(i32(1)), t), {}, {});
    REQUIRE_FALSE(not_boolean.has_value());
}

TEST_CASE("Scalar functions") {
    using plan::ScalarFn;
    REQUIRE(eval(call(ScalarFn::Lower, {lit(str("Org1"))})) == str("org1"));
    REQUIRE(eval(call(ScalarFn::Upper, {lit(str("Org1"))})) == str("ORG1"));
    REQUIRE(eval(call(ScalarFn::Length, {lit(str("abcd"))})) == i64(4));
    REQUIRE(eval(call(ScalarFn::Abs, {lit(i32(-3))})) == i32(3));
    REQUIRE(eval(call(ScalarFn::Coalesce, {lit(Value{}), lit(i32(9)), lit(i32(1))})) == i32(9));
    REQUIRE(is_null(eval(call(ScalarFn::Lower, {lit(Value{})}))));
}

TEST_CASE("IS NULL tests") {
    auto is_null_expr = node(plan::Expr{.node = plan::NullTest{.operand = lit(Value{}), .negated = false}});
    auto not_null_expr = node(plan::Expr{.node = plan::NullTest{.operand = lit(i32(1)), .negated = true}});
    REQUIRE(eval(is_null_expr) == Value{true});
    REQUIRE(eval(not_null_expr) == Value{true});
}

TEST_CASE("Projection evaluates each expression in order") {
    const Row tuple{i32(1), str("a"), Value{2.5}};
    auto row = runtime::project({plan::make_slot(2), plan::make_slot(0), lit(str("k"))}, tuple, {});
    REQUIRE(row.has_value());
    REQUIRE(*row == Row{Value{2.5}, i32(1), str("k")});
}

TEST_CASE("Aggregate states finalize by function") {
    using plan::AggFunc;
    runtime::AggState sum;
    for (auto v : {i32(1), i32(2), Value{}, i32(4)}) {
        REQUIRE(runtime::accumulate(sum, AggFunc::Sum, v).has_value());
    }
    REQUIRE(runtime::finalize(sum, AggFunc::Sum) == i64(7));

    runtime::AggState avg;
    for (auto v : {Value{400.0}, Value{700.0}}) {
        REQUIRE(runtime::accumulate(avg, AggFunc::Avg, v).has_value());
    }
    REQUIRE(std::get<double>(runtime::finalize(avg, AggFunc::Avg)) == Catch::Approx(550.0));

    runtime::AggState empty;
    REQUIRE(is_null(runtime::finalize(empty, AggFunc::Avg)));
    REQUIRE(is_null(runtime::finalize(empty, AggFunc::Max)));
    REQUIRE(runtime::finalize(empty, AggFunc::CountStar) == i64(0));
}

TEST_CASE("Partial aggregates merge into the same totals") {
    using plan::AggFunc;
    runtime::AggState left;
    runtime::AggState right;
    REQUIRE(runtime::accumulate(left, AggFunc::Min, str("m")).has_value());
    REQUIRE(runtime::accumulate(right, AggFunc::Min, str("c")).has_value());
    REQUIRE(runtime::accumulate(right, AggFunc::Min, str("x")).has_value());
    REQUIRE(runtime::merge_state(left, right).has_value());
    REQUIRE(runtime::finalize(left, AggFunc::Min) == str("c"));
}

TEST_CASE("GroupTable keeps first-seen group order") {
    const std::vector<plan::AggSpec> specs{
        plan::AggSpec{.func = plan::AggFunc::CountStar, .arg = nullptr, .label = "count(*)"},
        plan::AggSpec{.func = plan::AggFunc::Sum, .arg = plan::make_slot(1), .label = "sum(v)"},
    };
    const std::vector<ExprPtr> keys{plan::make_slot(0)};

    runtime::GroupTable table(specs);
    for (const auto& tuple : std::vector<Row>{{str("b"), i32(1)}, {str("a"), i32(2)}, {str("b"), i32(3)}}) {
        REQUIRE(table.add(keys, tuple, {}).has_value());
    }
    REQUIRE(table.size() == 2);

    auto rows = table.finish(true);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0] == Row{str("b"), i64(2), i64(4)});
    REQUIRE(rows[1] == Row{str("a"), i64(1), i64(2)});

    runtime::GroupTable merged(specs);
    for (const auto& partial : table.partials()) {
        REQUIRE(merged.merge(partial).has_value());
        REQUIRE(merged.merge(partial).has_value());
    }
    REQUIRE(merged.finish(true)[0] == Row{str("b"), i64(4), i64(8)});
}

TEST_CASE("An ungrouped aggregate over no rows yields one row") {
    const std::vector<plan::AggSpec> specs{
        plan::AggSpec{.func = plan::AggFunc::CountStar, .arg = nullptr, .label = "count(*)"},
        plan::AggSpec{.func = plan::AggFunc::Avg, .arg = plan::make_slot(0), .label = "avg(v)"},
    };
    runtime::GroupTable table(specs);
    auto rows = table.finish(false);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0][0] == i64(0));
    REQUIRE(is_null(rows[0][1]));

    REQUIRE(table.finish(true).empty());
}
