#include <quarry/plan/plan.hpp>

#include <fmt/core.h>

#include <utility>

namespace quarry::plan {

namespace {

auto arith_symbol(ArithmeticOp op) -> const char* {
    switch (op) {
        case ArithmeticOp::Add:
            return "+";
        case ArithmeticOp::Sub:
            return "-";
        case ArithmeticOp::Mul:
            return "*";
        case ArithmeticOp::Div:
            return "/";
        case ArithmeticOp::Mod:
            return "%";
        case ArithmeticOp::Concat:
            return "||";
    }
    return "?";
}

auto compare_symbol(CompareOp op) -> const char* {
    switch (op) {
        case CompareOp::Eq:
            return "=";
        case CompareOp::Ne:
            return "<>";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
    }
    return "?";
}

auto fn_name(ScalarFn fn) -> const char* {
    switch (fn) {
        case ScalarFn::Lower:
            return "lower";
        case ScalarFn::Upper:
            return "upper";
        case ScalarFn::Concat:
            return "concat";
        case ScalarFn::Length:
            return "length";
        case ScalarFn::Abs:
            return "abs";
        case ScalarFn::Coalesce:
            return "coalesce";
    }
    return "?";
}

auto access_text(const JoinStep& step) -> std::string {
    const auto& access = step.access;
    if (access.kind == AccessKind::FullScan) {
        return "full scan";
    }
    const auto& column = step.type->fields[access.field].name;
    if (access.kind == AccessKind::IndexEquality) {
        return fmt::format("index equality on {} = {}", column, to_string(*access.lower->value));
    }
    std::string text = fmt::format("index range on {}", column);
    if (access.lower.has_value()) {
        text += fmt::format(" {} {}", access.lower->inclusive ? ">=" : ">",
                            to_string(*access.lower->value));
    }
    if (access.upper.has_value()) {
        text += fmt::format(" {} {}", access.upper->inclusive ? "<=" : "<",
                            to_string(*access.upper->value));
    }
    return text;
}

}  // namespace

auto make_slot(std::size_t slot, std::string label) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{.node = SlotRef{.slot = slot, .label = std::move(label)}});
}

auto make_literal(Value value) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{.node = Literal{.value = std::move(value)}});
}

auto strategy_name(JoinStrategy strategy) noexcept -> const char* {
    switch (strategy) {
        case JoinStrategy::Driving:
            return "driving";
        case JoinStrategy::Colocated:
            return "co-located";
        case JoinStrategy::Replicated:
            return "replicated";
        case JoinStrategy::Broadcast:
            return "broadcast";
    }
    return "?";
}

auto agg_name(AggFunc func) noexcept -> const char* {
    switch (func) {
        case AggFunc::CountStar:
        case AggFunc::Count:
            return "count";
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Avg:
            return "avg";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
    }
    return "?";
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, SlotRef>) {
                return node.label.empty() ? fmt::format("${}", node.slot) : node.label;
            } else if constexpr (std::is_same_v<T, Literal>) {
                if (std::holds_alternative<std::string>(node.value)) {
                    return fmt::format("'{}'", std::get<std::string>(node.value));
                }
                return format_value(node.value);
            } else if constexpr (std::is_same_v<T, Param>) {
                return fmt::format("?{}", node.index + 1);
            } else if constexpr (std::is_same_v<T, Arith>) {
                return fmt::format("({} {} {})", to_string(*node.left), arith_symbol(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, Compare>) {
                return fmt::format("{} {} {}", to_string(*node.left), compare_symbol(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, Logical>) {
                return fmt::format("({} {} {})", to_string(*node.left),
                                   node.op == LogicalOp::And ? "and" : "or",
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, Not>) {
                return fmt::format("not {}", to_string(*node.operand));
            } else if constexpr (std::is_same_v<T, Negate>) {
                return fmt::format("-{}", to_string(*node.operand));
            } else if constexpr (std::is_same_v<T, NullTest>) {
                return fmt::format("{} is {}null", to_string(*node.operand),
                                   node.negated ? "not " : "");
            } else {
                std::string args;
                for (std::size_t i = 0; i < node.args.size(); ++i) {
                    if (i > 0) {
                        args += ", ";
                    }
                    args += to_string(*node.args[i]);
                }
                return fmt::format("{}({})", fn_name(node.fn), args);
            }
        },
        expr.node);
}

auto to_string(const QueryPlan& plan) -> std::string {
    std::string out;
    out += fmt::format("query: {}\n", plan.sql);
    if (plan.routing.kind == RouteKind::SinglePartition) {
        out += fmt::format("routing: single partition ({} = {})\n",
                           plan.driving().type->fields[*plan.driving().type->placement_field].name,
                           to_string(*plan.routing.placement));
    } else {
        out += "routing: all partitions\n";
    }
    for (const auto& step : plan.steps) {
        out += fmt::format("  {} {} [{}] via {}\n", strategy_name(step.strategy), step.type->name,
                           step.type->cache_name, access_text(step));
        for (const auto& key : step.keys) {
            out += fmt::format("    join key ${} = {}.{}\n", key.left_slot, step.alias,
                               step.type->fields[key.right_field].name);
        }
        for (const auto& filter : step.filters) {
            out += fmt::format("    filter {}\n", to_string(*filter));
        }
    }
    for (const auto& residual : plan.residual) {
        out += fmt::format("  residual {}\n", to_string(*residual));
    }
    if (plan.aggregate) {
        std::string keys;
        for (const auto& key : plan.group_keys) {
            keys += keys.empty() ? to_string(*key) : ", " + to_string(*key);
        }
        out += fmt::format("  aggregate by [{}]\n", keys);
        for (const auto& agg : plan.aggregates) {
            out += fmt::format("    {}\n", agg.label);
        }
    }
    std::string columns;
    for (const auto& column : plan.columns) {
        columns += columns.empty() ? column : ", " + column;
    }
    out += fmt::format("  project [{}]\n", columns);
    for (const auto& key : plan.order_by) {
        out += fmt::format("  order by {} {}\n", to_string(*key.expr),
                           key.ascending ? "asc" : "desc");
    }
    if (plan.limit.has_value() || plan.offset.has_value()) {
        out += fmt::format("  limit {} offset {}\n",
                           plan.limit.has_value() ? fmt::format("{}", *plan.limit) : "all",
                           plan.offset.value_or(0));
    }
    return out;
}

}  // namespace quarry::plan
