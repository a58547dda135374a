#include <quarry/runtime/materializer.hpp>

#include <fmt/core.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace quarry::runtime {

namespace {

auto execution_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorCode::Execution, std::move(message)));
}

auto op_symbol(plan::ArithmeticOp op) -> const char* {
    switch (op) {
        case plan::ArithmeticOp::Add:
            return "+";
        case plan::ArithmeticOp::Sub:
            return "-";
        case plan::ArithmeticOp::Mul:
            return "*";
        case plan::ArithmeticOp::Div:
            return "/";
        case plan::ArithmeticOp::Mod:
            return "%";
        case plan::ArithmeticOp::Concat:
            return "||";
    }
    return "?";
}

auto as_text(const Value& value) -> std::string {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return format_value(value);
}

auto bigint_overflow() -> std::unexpected<Error> {
    return execution_error("BIGINT overflow");
}

auto narrow(std::int64_t value, bool wide) -> Result<Value> {
    if (wide) {
        return Value{value};
    }
    if (value < std::numeric_limits<std::int32_t>::min() ||
        value > std::numeric_limits<std::int32_t>::max()) {
        return execution_error("INT overflow");
    }
    return Value{static_cast<std::int32_t>(value)};
}

auto arithmetic(plan::ArithmeticOp op, const Value& lhs, const Value& rhs) -> Result<Value> {
    if (is_null(lhs) || is_null(rhs)) {
        return Value{};
    }
    if (op == plan::ArithmeticOp::Concat) {
        return Value{as_text(lhs) + as_text(rhs)};
    }
    if (!is_numeric(lhs) || !is_numeric(rhs)) {
        return execution_error(fmt::format("cannot apply '{}' to {} and {}", op_symbol(op),
                                           kind_name(kind_of(lhs)), kind_name(kind_of(rhs))));
    }
    if (!is_integral(lhs) || !is_integral(rhs)) {
        const double l = *as_double(lhs);
        const double r = *as_double(rhs);
        switch (op) {
            case plan::ArithmeticOp::Add:
                return Value{l + r};
            case plan::ArithmeticOp::Sub:
                return Value{l - r};
            case plan::ArithmeticOp::Mul:
                return Value{l * r};
            case plan::ArithmeticOp::Div:
                return Value{l / r};
            case plan::ArithmeticOp::Mod:
                return Value{std::fmod(l, r)};
            case plan::ArithmeticOp::Concat:
                break;
        }
        return execution_error("unsupported arithmetic operator");
    }
    const bool wide = kind_of(lhs) == ValueKind::BigInt || kind_of(rhs) == ValueKind::BigInt;
    const std::int64_t l = *as_int64(lhs);
    const std::int64_t r = *as_int64(rhs);
    std::int64_t out = 0;
    switch (op) {
        case plan::ArithmeticOp::Add:
            if (__builtin_add_overflow(l, r, &out)) {
                return bigint_overflow();
            }
            return narrow(out, wide);
        case plan::ArithmeticOp::Sub:
            if (__builtin_sub_overflow(l, r, &out)) {
                return bigint_overflow();
            }
            return narrow(out, wide);
        case plan::ArithmeticOp::Mul:
            if (__builtin_mul_overflow(l, r, &out)) {
                return bigint_overflow();
            }
            return narrow(out, wide);
        case plan::ArithmeticOp::Div:
            if (r == 0) {
                return execution_error("division by zero");
            }
            if (l == std::numeric_limits<std::int64_t>::min() && r == -1) {
                return bigint_overflow();
            }
            return narrow(l / r, wide);
        case plan::ArithmeticOp::Mod:
            if (r == 0) {
                return execution_error("division by zero");
            }
            // x % -1 is always 0; computing it traps for the minimum BIGINT.
            if (r == -1) {
                return narrow(0, wide);
            }
            return narrow(l % r, wide);
        case plan::ArithmeticOp::Concat:
            break;
    }
    return execution_error("unsupported arithmetic operator");
}

auto comparison(plan::CompareOp op, const Value& lhs, const Value& rhs) -> Value {
    if (is_null(lhs) || is_null(rhs)) {
        return Value{};
    }
    const auto order = compare(lhs, rhs);
    switch (op) {
        case plan::CompareOp::Eq:
            return Value{order == 0};
        case plan::CompareOp::Ne:
            return Value{order != 0};
        case plan::CompareOp::Lt:
            return Value{order < 0};
        case plan::CompareOp::Le:
            return Value{order <= 0};
        case plan::CompareOp::Gt:
            return Value{order > 0};
        case plan::CompareOp::Ge:
            return Value{order >= 0};
    }
    return Value{};
}

// NULL stays NULL; anything else must be BOOLEAN.
auto truth(const Value& value) -> Result<std::optional<bool>> {
    if (is_null(value)) {
        return std::optional<bool>{};
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return std::optional<bool>{*flag};
    }
    return execution_error(
        fmt::format("expected BOOLEAN operand, got {}", kind_name(kind_of(value))));
}

auto call(plan::ScalarFn fn, const std::vector<Value>& args) -> Result<Value> {
    switch (fn) {
        case plan::ScalarFn::Lower:
        case plan::ScalarFn::Upper:
            if (is_null(args.front())) {
                return Value{};
            }
            return Value{fold_case(as_text(args.front()), fn == plan::ScalarFn::Upper)};
        case plan::ScalarFn::Length:
            if (is_null(args.front())) {
                return Value{};
            }
            return Value{static_cast<std::int64_t>(as_text(args.front()).size())};
        case plan::ScalarFn::Abs: {
            const auto& arg = args.front();
            if (is_null(arg)) {
                return Value{};
            }
            if (const auto* v = std::get_if<std::int32_t>(&arg)) {
                return narrow(std::abs(static_cast<std::int64_t>(*v)), false);
            }
            if (const auto* v = std::get_if<std::int64_t>(&arg)) {
                if (*v == std::numeric_limits<std::int64_t>::min()) {
                    return bigint_overflow();
                }
                return Value{std::abs(*v)};
            }
            if (const auto* v = std::get_if<double>(&arg)) {
                return Value{std::fabs(*v)};
            }
            return execution_error(
                fmt::format("abs() expects a numeric argument, got {}", kind_name(kind_of(arg))));
        }
        case plan::ScalarFn::Concat: {
            std::string out;
            for (const auto& arg : args) {
                if (!is_null(arg)) {
                    out += as_text(arg);
                }
            }
            return Value{std::move(out)};
        }
        case plan::ScalarFn::Coalesce:
            for (const auto& arg : args) {
                if (!is_null(arg)) {
                    return arg;
                }
            }
            return Value{};
    }
    return execution_error("unsupported function");
}

}  // namespace

auto materialize(const catalog::TypeDescriptor& type, const cache::Object& object) -> Row {
    Row row;
    row.reserve(type.width());
    for (const auto& field : type.fields) {
        row.push_back(object.data ? field.get(*object.data) : Value{});
    }
    return row;
}

auto fold_case(std::string_view text, bool upper) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        const auto byte = static_cast<unsigned char>(ch);
        out.push_back(static_cast<char>(upper ? std::toupper(byte) : std::tolower(byte)));
    }
    return out;
}

auto evaluate(const plan::Expr& expr, const Row& tuple, const Row& args) -> Result<Value> {
    return std::visit(
        [&](const auto& node) -> Result<Value> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, plan::SlotRef>) {
                if (node.slot >= tuple.size()) {
                    return execution_error(fmt::format("slot {} out of range", node.slot));
                }
                return tuple[node.slot];
            } else if constexpr (std::is_same_v<T, plan::Literal>) {
                return node.value;
            } else if constexpr (std::is_same_v<T, plan::Param>) {
                if (node.index >= args.size()) {
                    return std::unexpected(make_error(
                        ErrorCode::InvalidArgument,
                        fmt::format("no argument bound for parameter {}", node.index + 1)));
                }
                return args[node.index];
            } else if constexpr (std::is_same_v<T, plan::Arith>) {
                auto left = evaluate(*node.left, tuple, args);
                if (!left) {
                    return left;
                }
                auto right = evaluate(*node.right, tuple, args);
                if (!right) {
                    return right;
                }
                return arithmetic(node.op, *left, *right);
            } else if constexpr (std::is_same_v<T, plan::Compare>) {
                auto left = evaluate(*node.left, tuple, args);
                if (!left) {
                    return left;
                }
                auto right = evaluate(*node.right, tuple, args);
                if (!right) {
                    return right;
                }
                return comparison(node.op, *left, *right);
            } else if constexpr (std::is_same_v<T, plan::Logical>) {
                auto left = evaluate(*node.left, tuple, args);
                if (!left) {
                    return left;
                }
                auto lhs = truth(*left);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                // Short-circuit: FALSE AND x, TRUE OR x.
                const bool decisive = node.op == plan::LogicalOp::Or;
                if (lhs->has_value() && **lhs == decisive) {
                    return Value{decisive};
                }
                auto right = evaluate(*node.right, tuple, args);
                if (!right) {
                    return right;
                }
                auto rhs = truth(*right);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                if (rhs->has_value() && **rhs == decisive) {
                    return Value{decisive};
                }
                if (!lhs->has_value() || !rhs->has_value()) {
                    return Value{};
                }
                return Value{!decisive};
            } else if constexpr (std::is_same_v<T, plan::Not>) {
                auto operand = evaluate(*node.operand, tuple, args);
                if (!operand) {
                    return operand;
                }
                auto flag = truth(*operand);
                if (!flag) {
                    return std::unexpected(flag.error());
                }
                if (!flag->has_value()) {
                    return Value{};
                }
                return Value{!**flag};
            } else if constexpr (std::is_same_v<T, plan::Negate>) {
                auto operand = evaluate(*node.operand, tuple, args);
                if (!operand) {
                    return operand;
                }
                if (is_null(*operand)) {
                    return Value{};
                }
                if (const auto* v = std::get_if<std::int32_t>(&*operand)) {
                    return narrow(-static_cast<std::int64_t>(*v), false);
                }
                if (const auto* v = std::get_if<std::int64_t>(&*operand)) {
                    if (*v == std::numeric_limits<std::int64_t>::min()) {
                        return bigint_overflow();
                    }
                    return Value{-*v};
                }
                if (const auto* v = std::get_if<double>(&*operand)) {
                    return Value{-*v};
                }
                return execution_error(
                    fmt::format("cannot negate {}", kind_name(kind_of(*operand))));
            } else if constexpr (std::is_same_v<T, plan::NullTest>) {
                auto operand = evaluate(*node.operand, tuple, args);
                if (!operand) {
                    return operand;
                }
                return Value{is_null(*operand) != node.negated};
            } else {
                std::vector<Value> values;
                values.reserve(node.args.size());
                for (const auto& arg : node.args) {
                    auto value = evaluate(*arg, tuple, args);
                    if (!value) {
                        return value;
                    }
                    values.push_back(std::move(*value));
                }
                return call(node.fn, values);
            }
        },
        expr.node);
}

auto evaluate_predicate(const plan::Expr& expr, const Row& tuple, const Row& args)
    -> Result<bool> {
    auto value = evaluate(expr, tuple, args);
    if (!value) {
        return std::unexpected(value.error());
    }
    auto flag = truth(*value);
    if (!flag) {
        return std::unexpected(flag.error());
    }
    return flag->value_or(false);
}

auto passes(const std::vector<plan::ExprPtr>& filters, const Row& tuple, const Row& args)
    -> Result<bool> {
    for (const auto& filter : filters) {
        auto ok = evaluate_predicate(*filter, tuple, args);
        if (!ok || !*ok) {
            return ok;
        }
    }
    return true;
}

auto project(const std::vector<plan::ExprPtr>& exprs, const Row& tuple, const Row& args)
    -> Result<Row> {
    Row row;
    row.reserve(exprs.size());
    for (const auto& expr : exprs) {
        auto value = evaluate(*expr, tuple, args);
        if (!value) {
            return std::unexpected(value.error());
        }
        row.push_back(std::move(*value));
    }
    return row;
}

}  // namespace quarry::runtime
