#include <quarry/parser/parser.hpp>
#include <quarry/plan/planner.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

namespace quarry::plan {

namespace {

auto aggregate_fn(std::string_view name) -> std::optional<AggFunc> {
    if (name == "count") {
        return AggFunc::Count;
    }
    if (name == "sum") {
        return AggFunc::Sum;
    }
    if (name == "avg") {
        return AggFunc::Avg;
    }
    if (name == "min") {
        return AggFunc::Min;
    }
    if (name == "max") {
        return AggFunc::Max;
    }
    return std::nullopt;
}

auto scalar_fn(std::string_view name) -> std::optional<ScalarFn> {
    if (name == "lower") {
        return ScalarFn::Lower;
    }
    if (name == "upper") {
        return ScalarFn::Upper;
    }
    if (name == "concat") {
        return ScalarFn::Concat;
    }
    if (name == "length") {
        return ScalarFn::Length;
    }
    if (name == "abs") {
        return ScalarFn::Abs;
    }
    if (name == "coalesce") {
        return ScalarFn::Coalesce;
    }
    return std::nullopt;
}

auto literal_value(const parser::LiteralExpr& literal) -> Value {
    return std::visit(
        [](const auto& value) -> Value {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, parser::NullLiteral>) {
                return Value{};
            } else {
                return Value{value};
            }
        },
        literal.value);
}

auto compare_op(parser::BinaryOp op) -> std::optional<CompareOp> {
    switch (op) {
        case parser::BinaryOp::Eq:
            return CompareOp::Eq;
        case parser::BinaryOp::Ne:
            return CompareOp::Ne;
        case parser::BinaryOp::Lt:
            return CompareOp::Lt;
        case parser::BinaryOp::Le:
            return CompareOp::Le;
        case parser::BinaryOp::Gt:
            return CompareOp::Gt;
        case parser::BinaryOp::Ge:
            return CompareOp::Ge;
        default:
            return std::nullopt;
    }
}

auto arithmetic_op(parser::BinaryOp op) -> std::optional<ArithmeticOp> {
    switch (op) {
        case parser::BinaryOp::Add:
            return ArithmeticOp::Add;
        case parser::BinaryOp::Sub:
            return ArithmeticOp::Sub;
        case parser::BinaryOp::Mul:
            return ArithmeticOp::Mul;
        case parser::BinaryOp::Div:
            return ArithmeticOp::Div;
        case parser::BinaryOp::Mod:
            return ArithmeticOp::Mod;
        case parser::BinaryOp::Concat:
            return ArithmeticOp::Concat;
        default:
            return std::nullopt;
    }
}

/// `a < col` becomes `col > a`.
auto flip(CompareOp op) -> CompareOp {
    switch (op) {
        case CompareOp::Lt:
            return CompareOp::Gt;
        case CompareOp::Le:
            return CompareOp::Ge;
        case CompareOp::Gt:
            return CompareOp::Lt;
        case CompareOp::Ge:
            return CompareOp::Le;
        default:
            return op;
    }
}

auto contains_aggregate(const parser::Expr& expr) -> bool {
    if (const auto* call = std::get_if<parser::CallExpr>(&expr.node)) {
        if (aggregate_fn(catalog::fold_name(call->callee)).has_value()) {
            return true;
        }
        return std::ranges::any_of(call->args,
                                   [](const auto& arg) { return contains_aggregate(*arg); });
    }
    if (const auto* unary = std::get_if<parser::UnaryExpr>(&expr.node)) {
        return contains_aggregate(*unary->expr);
    }
    if (const auto* binary = std::get_if<parser::BinaryExpr>(&expr.node)) {
        return contains_aggregate(*binary->left) || contains_aggregate(*binary->right);
    }
    return false;
}

void split_conjuncts(const parser::Expr& expr, std::vector<const parser::Expr*>& out) {
    if (const auto* binary = std::get_if<parser::BinaryExpr>(&expr.node)) {
        if (binary->op == parser::BinaryOp::And) {
            split_conjuncts(*binary->left, out);
            split_conjuncts(*binary->right, out);
            return;
        }
    }
    out.push_back(&expr);
}

auto invalid(std::string message, std::string context = {}) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorCode::InvalidQuery, std::move(message), std::move(context)));
}

/// Where a bound expression is evaluated.
enum class Scope : std::uint8_t {
    /// Joined tuple; slot = table offset + field position.
    Tuple,
    /// One table's own row; slot = field position.
    Table,
    /// Group tuple [group keys..., aggregate results...].
    Group,
};

/// `column op constant` usable as an index bound.
struct Candidate {
    std::size_t field = 0;
    CompareOp op = CompareOp::Eq;
    ExprPtr value;
};

class Planner {
   public:
    Planner(const catalog::Catalog& catalog, const CacheLookup& caches)
        : catalog_(catalog), caches_(caches) {}

    auto plan(const parser::SelectStmt& stmt, std::string sql) -> Result<QueryPlan> {
        plan_.sql = std::move(sql);
        plan_.param_count = stmt.param_count;
        if (stmt.from.empty()) {
            return invalid("FROM clause names no tables");
        }
        if (auto status = bind_tables(stmt.from); !status) {
            return std::unexpected(status.error());
        }

        plan_.aggregate = !stmt.group_by.empty();
        for (const auto& item : stmt.items) {
            if (const auto* expr_item = std::get_if<parser::ExprItem>(&item)) {
                plan_.aggregate = plan_.aggregate || contains_aggregate(*expr_item->expr);
            }
        }
        for (const auto& item : stmt.order_by) {
            plan_.aggregate = plan_.aggregate || contains_aggregate(*item.expr);
        }

        if (stmt.where) {
            if (contains_aggregate(*stmt.where)) {
                return invalid("aggregate functions are not allowed in WHERE", stmt.where->text);
            }
            if (auto status = bind_where(*stmt.where); !status) {
                return std::unexpected(status.error());
            }
        }
        choose_access_paths();
        choose_strategies();
        choose_routing();

        for (const auto& key : stmt.group_by) {
            if (contains_aggregate(*key)) {
                return invalid("aggregate functions are not allowed in GROUP BY", key->text);
            }
            auto bound = bind(*key, Scope::Tuple);
            if (!bound) {
                return std::unexpected(bound.error());
            }
            plan_.group_keys.push_back(std::move(*bound));
            group_texts_.push_back(catalog::fold_name(key->text));
        }

        if (auto status = bind_select(stmt.items); !status) {
            return std::unexpected(status.error());
        }
        if (auto status = bind_order_by(stmt.order_by); !status) {
            return std::unexpected(status.error());
        }

        if (stmt.limit.has_value() && *stmt.limit < 0) {
            return invalid("LIMIT must not be negative");
        }
        if (stmt.offset.has_value() && *stmt.offset < 0) {
            return invalid("OFFSET must not be negative");
        }
        plan_.limit = stmt.limit;
        plan_.offset = stmt.offset;

        spdlog::debug("planned {} table(s), {} partition routing, aggregate={}",
                      plan_.steps.size(),
                      plan_.routing.kind == RouteKind::SinglePartition ? "single" : "all",
                      plan_.aggregate);
        return std::move(plan_);
    }

   private:
    struct TableBinding {
        const cache::Cache* cache = nullptr;
        std::string key;
    };

    struct ColumnBinding {
        std::size_t table = 0;
        const catalog::FieldDescriptor* field = nullptr;
    };

    auto bind_tables(const std::vector<parser::TableRef>& from) -> Status {
        std::size_t offset = 0;
        for (const auto& ref : from) {
            const auto* type = catalog_.find_type(ref.name);
            if (type == nullptr) {
                return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                                  fmt::format("table '{}' not found", ref.name),
                                                  ref.name));
            }
            if (ref.schema.has_value() &&
                catalog::fold_name(*ref.schema) != catalog::fold_name(type->cache_name)) {
                return std::unexpected(make_error(
                    ErrorCode::UnresolvedTable,
                    fmt::format("table '{}' not found in schema '{}'", ref.name, *ref.schema),
                    fmt::format("{}.{}", *ref.schema, ref.name)));
            }
            const auto* cache = caches_(type->cache_name);
            if (cache == nullptr) {
                return std::unexpected(make_error(
                    ErrorCode::UnresolvedTable,
                    fmt::format("cache '{}' of table '{}' does not exist", type->cache_name,
                                type->name),
                    ref.name));
            }
            auto alias = ref.alias.value_or(ref.name);
            auto key = catalog::fold_name(alias);
            if (std::ranges::any_of(tables_, [&](const auto& t) { return t.key == key; })) {
                return invalid(fmt::format("table name '{}' specified more than once", alias),
                               alias);
            }
            plan_.steps.push_back(JoinStep{
                .table = plan_.steps.size(),
                .type = type,
                .alias = alias,
                .offset = offset,
                .strategy = JoinStrategy::Driving,
                .access = {},
                .filters = {},
                .keys = {},
                .lookup_key = std::nullopt,
            });
            tables_.push_back(TableBinding{.cache = cache, .key = std::move(key)});
            offset += type->width();
        }
        plan_.tuple_width = offset;
        candidates_.resize(plan_.steps.size());
        return {};
    }

    auto resolve_column(const parser::ColumnRefExpr& ref, const std::string& text)
        -> Result<ColumnBinding> {
        if (ref.table.has_value()) {
            const auto key = catalog::fold_name(*ref.table);
            for (std::size_t i = 0; i < tables_.size(); ++i) {
                if (tables_[i].key != key) {
                    continue;
                }
                const auto* field = plan_.steps[i].type->find(ref.column);
                if (field == nullptr) {
                    return std::unexpected(make_error(
                        ErrorCode::UnresolvedColumn,
                        fmt::format("column '{}' not found in '{}'", ref.column, *ref.table),
                        text));
                }
                return ColumnBinding{.table = i, .field = field};
            }
            return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                              fmt::format("table or alias '{}' not found",
                                                          *ref.table),
                                              text));
        }
        std::optional<ColumnBinding> found;
        for (std::size_t i = 0; i < plan_.steps.size(); ++i) {
            const auto* field = plan_.steps[i].type->find(ref.column);
            if (field == nullptr) {
                continue;
            }
            if (found.has_value()) {
                return std::unexpected(make_error(
                    ErrorCode::UnresolvedColumn,
                    fmt::format("column '{}' is ambiguous", ref.column), text));
            }
            found = ColumnBinding{.table = i, .field = field};
        }
        if (!found.has_value()) {
            return std::unexpected(make_error(ErrorCode::UnresolvedColumn,
                                              fmt::format("column '{}' not found", ref.column),
                                              text));
        }
        return *found;
    }

    auto tuple_slot(const ColumnBinding& column) const -> std::size_t {
        return plan_.steps[column.table].offset + column.field->position;
    }

    auto table_of_slot(std::size_t slot) const -> std::size_t {
        std::size_t table = 0;
        for (std::size_t i = 0; i < plan_.steps.size(); ++i) {
            if (plan_.steps[i].offset <= slot) {
                table = i;
            }
        }
        return table;
    }

    auto column_label(const ColumnBinding& column) const -> std::string {
        return fmt::format("{}.{}", plan_.steps[column.table].alias, column.field->name);
    }

    // Tables referenced by an expression, in first-reference order.
    auto referenced_tables(const parser::Expr& expr, std::vector<std::size_t>& out) -> Status {
        if (const auto* ref = std::get_if<parser::ColumnRefExpr>(&expr.node)) {
            auto column = resolve_column(*ref, expr.text);
            if (!column) {
                return std::unexpected(column.error());
            }
            if (std::ranges::find(out, column->table) == out.end()) {
                out.push_back(column->table);
            }
            return {};
        }
        if (const auto* call = std::get_if<parser::CallExpr>(&expr.node)) {
            for (const auto& arg : call->args) {
                if (auto status = referenced_tables(*arg, out); !status) {
                    return status;
                }
            }
            return {};
        }
        if (const auto* unary = std::get_if<parser::UnaryExpr>(&expr.node)) {
            return referenced_tables(*unary->expr, out);
        }
        if (const auto* binary = std::get_if<parser::BinaryExpr>(&expr.node)) {
            if (auto status = referenced_tables(*binary->left, out); !status) {
                return status;
            }
            return referenced_tables(*binary->right, out);
        }
        return {};
    }

    auto bind_where(const parser::Expr& where) -> Status {
        std::vector<const parser::Expr*> conjuncts;
        split_conjuncts(where, conjuncts);
        for (const auto* conjunct : conjuncts) {
            std::vector<std::size_t> tables;
            if (auto status = referenced_tables(*conjunct, tables); !status) {
                return status;
            }
            if (tables.size() <= 1) {
                const std::size_t table = tables.empty() ? 0 : tables.front();
                auto bound = bind(*conjunct, Scope::Table, table);
                if (!bound) {
                    return std::unexpected(bound.error());
                }
                plan_.steps[table].filters.push_back(std::move(*bound));
                if (auto candidate = access_candidate(*conjunct, table)) {
                    candidates_[table].push_back(std::move(*candidate));
                }
                continue;
            }
            if (add_join_key(*conjunct)) {
                continue;
            }
            auto bound = bind(*conjunct, Scope::Tuple);
            if (!bound) {
                return std::unexpected(bound.error());
            }
            plan_.residual.push_back(std::move(*bound));
        }
        return {};
    }

    // `a.x = b.y` across two tables becomes a key of the later table.
    auto add_join_key(const parser::Expr& conjunct) -> bool {
        const auto* binary = std::get_if<parser::BinaryExpr>(&conjunct.node);
        if (binary == nullptr || binary->op != parser::BinaryOp::Eq) {
            return false;
        }
        const auto* left_ref = std::get_if<parser::ColumnRefExpr>(&binary->left->node);
        const auto* right_ref = std::get_if<parser::ColumnRefExpr>(&binary->right->node);
        if (left_ref == nullptr || right_ref == nullptr) {
            return false;
        }
        auto left = resolve_column(*left_ref, binary->left->text);
        auto right = resolve_column(*right_ref, binary->right->text);
        if (!left || !right || left->table == right->table) {
            return false;
        }
        if (left->table > right->table) {
            std::swap(left, right);
        }
        plan_.steps[right->table].keys.push_back(
            JoinKey{.left_slot = tuple_slot(*left), .right_field = right->field->position});
        return true;
    }

    auto access_candidate(const parser::Expr& conjunct, std::size_t table)
        -> std::optional<Candidate> {
        const auto* binary = std::get_if<parser::BinaryExpr>(&conjunct.node);
        if (binary == nullptr) {
            return std::nullopt;
        }
        auto op = compare_op(binary->op);
        if (!op.has_value() || *op == CompareOp::Ne) {
            return std::nullopt;
        }
        const parser::Expr* column_side = binary->left.get();
        const parser::Expr* value_side = binary->right.get();
        if (!std::holds_alternative<parser::ColumnRefExpr>(column_side->node)) {
            std::swap(column_side, value_side);
            op = flip(*op);
        }
        const auto* ref = std::get_if<parser::ColumnRefExpr>(&column_side->node);
        if (ref == nullptr) {
            return std::nullopt;
        }
        ExprPtr value;
        if (const auto* literal = std::get_if<parser::LiteralExpr>(&value_side->node)) {
            auto constant = literal_value(*literal);
            if (is_null(constant)) {
                return std::nullopt;
            }
            value = make_literal(std::move(constant));
        } else if (const auto* param = std::get_if<parser::ParamExpr>(&value_side->node)) {
            value = std::make_shared<const Expr>(Expr{.node = Param{.index = param->index}});
        } else {
            return std::nullopt;
        }
        auto column = resolve_column(*ref, column_side->text);
        if (!column || column->table != table) {
            return std::nullopt;
        }
        return Candidate{.field = column->field->position, .op = *op, .value = std::move(value)};
    }

    void choose_access_paths() {
        for (std::size_t t = 0; t < plan_.steps.size(); ++t) {
            auto& step = plan_.steps[t];
            const auto& type = *step.type;
            const Candidate* equality = nullptr;
            for (const auto& candidate : candidates_[t]) {
                if (candidate.op != CompareOp::Eq || !type.fields[candidate.field].indexed()) {
                    continue;
                }
                const bool placement = type.placement_field == candidate.field;
                if (equality == nullptr ||
                    (placement && type.placement_field != equality->field)) {
                    equality = &candidate;
                }
            }
            if (equality != nullptr) {
                step.access = AccessPath{
                    .kind = AccessKind::IndexEquality,
                    .field = equality->field,
                    .lower = BoundExpr{.value = equality->value, .inclusive = true},
                    .upper = BoundExpr{.value = equality->value, .inclusive = true},
                };
                continue;
            }
            for (const auto& candidate : candidates_[t]) {
                if (candidate.op == CompareOp::Eq ||
                    type.fields[candidate.field].index != catalog::IndexKind::Ordered) {
                    continue;
                }
                AccessPath range{.kind = AccessKind::IndexRange, .field = candidate.field};
                for (const auto& bound : candidates_[t]) {
                    if (bound.field != candidate.field) {
                        continue;
                    }
                    const bool lower = bound.op == CompareOp::Gt || bound.op == CompareOp::Ge;
                    const bool upper = bound.op == CompareOp::Lt || bound.op == CompareOp::Le;
                    if (lower && !range.lower.has_value()) {
                        range.lower = BoundExpr{.value = bound.value,
                                                .inclusive = bound.op == CompareOp::Ge};
                    } else if (upper && !range.upper.has_value()) {
                        range.upper = BoundExpr{.value = bound.value,
                                                .inclusive = bound.op == CompareOp::Le};
                    }
                }
                step.access = std::move(range);
                break;
            }
        }
    }

    auto colocated(std::size_t t) const -> bool {
        const auto& step = plan_.steps[t];
        if (!step.type->placement_field.has_value()) {
            return false;
        }
        for (const auto& key : step.keys) {
            if (key.right_field != *step.type->placement_field) {
                continue;
            }
            const auto left = table_of_slot(key.left_slot);
            const auto& left_step = plan_.steps[left];
            if (left_step.strategy != JoinStrategy::Driving &&
                left_step.strategy != JoinStrategy::Colocated) {
                continue;
            }
            if (left_step.type->placement_field != key.left_slot - left_step.offset) {
                continue;
            }
            const auto* left_cache = tables_[left].cache;
            if (left_cache->mode() != cache::CacheMode::Partitioned ||
                left_cache->partition_count() != tables_[t].cache->partition_count()) {
                continue;
            }
            return true;
        }
        return false;
    }

    void choose_strategies() {
        for (std::size_t t = 1; t < plan_.steps.size(); ++t) {
            auto& step = plan_.steps[t];
            if (tables_[t].cache->mode() == cache::CacheMode::Replicated) {
                step.strategy = JoinStrategy::Replicated;
            } else if (colocated(t)) {
                step.strategy = JoinStrategy::Colocated;
            } else {
                step.strategy = JoinStrategy::Broadcast;
            }
            if (step.strategy != JoinStrategy::Broadcast) {
                for (std::size_t k = 0; k < step.keys.size(); ++k) {
                    if (step.type->fields[step.keys[k].right_field].indexed()) {
                        step.lookup_key = k;
                        break;
                    }
                }
            }
            spdlog::debug("join step {} ({}): {}", t, step.type->name,
                          strategy_name(step.strategy));
        }
    }

    void choose_routing() {
        const auto& driving = plan_.steps.front();
        if (!driving.type->placement_field.has_value() ||
            tables_.front().cache->mode() != cache::CacheMode::Partitioned) {
            return;
        }
        for (const auto& candidate : candidates_.front()) {
            if (candidate.op == CompareOp::Eq && candidate.field == *driving.type->placement_field) {
                plan_.routing = Routing{.kind = RouteKind::SinglePartition,
                                        .placement = candidate.value};
                return;
            }
        }
    }

    auto bind_select(const std::vector<parser::SelectItem>& items) -> Status {
        for (const auto& item : items) {
            if (const auto* star = std::get_if<parser::StarItem>(&item)) {
                if (plan_.aggregate) {
                    return invalid("'*' is not allowed in an aggregate query", "*");
                }
                if (auto status = expand_star(*star); !status) {
                    return status;
                }
                continue;
            }
            const auto& expr_item = std::get<parser::ExprItem>(item);
            const auto& expr = *expr_item.expr;
            auto bound = bind(expr, plan_.aggregate ? Scope::Group : Scope::Tuple);
            if (!bound) {
                return std::unexpected(bound.error());
            }
            std::string label;
            if (expr_item.alias.has_value()) {
                label = *expr_item.alias;
                aliases_.emplace_back(catalog::fold_name(label), plan_.projection.size());
            } else if (const auto* ref = std::get_if<parser::ColumnRefExpr>(&expr.node)) {
                auto column = resolve_column(*ref, expr.text);
                label = column ? column->field->name : ref->column;
            } else {
                label = expr.text;
            }
            plan_.columns.push_back(std::move(label));
            plan_.projection.push_back(std::move(*bound));
        }
        return {};
    }

    auto expand_star(const parser::StarItem& star) -> Status {
        bool matched = false;
        for (std::size_t t = 0; t < plan_.steps.size(); ++t) {
            if (star.table.has_value() && tables_[t].key != catalog::fold_name(*star.table)) {
                continue;
            }
            matched = true;
            const auto& step = plan_.steps[t];
            for (const auto& field : step.type->fields) {
                plan_.columns.push_back(field.name);
                plan_.projection.push_back(make_slot(step.offset + field.position,
                                                     fmt::format("{}.{}", step.alias, field.name)));
            }
        }
        if (!matched) {
            return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                              fmt::format("table or alias '{}' not found",
                                                          star.table.value_or("")),
                                              fmt::format("{}.*", star.table.value_or(""))));
        }
        return {};
    }

    auto bind_order_by(const std::vector<parser::OrderItem>& items) -> Status {
        for (const auto& item : items) {
            const auto& expr = *item.expr;
            ExprPtr key;
            if (const auto* literal = std::get_if<parser::LiteralExpr>(&expr.node)) {
                if (const auto* ordinal = std::get_if<std::int64_t>(&literal->value)) {
                    if (*ordinal < 1 || static_cast<std::size_t>(*ordinal) > plan_.projection.size()) {
                        return invalid(
                            fmt::format("ORDER BY position {} is not in the select list", *ordinal),
                            expr.text);
                    }
                    key = plan_.projection[static_cast<std::size_t>(*ordinal) - 1];
                }
            } else if (const auto* ref = std::get_if<parser::ColumnRefExpr>(&expr.node)) {
                if (!ref->table.has_value()) {
                    const auto folded = catalog::fold_name(ref->column);
                    for (const auto& [alias, index] : aliases_) {
                        if (alias == folded) {
                            key = plan_.projection[index];
                            break;
                        }
                    }
                }
            }
            if (!key) {
                auto bound = bind(expr, plan_.aggregate ? Scope::Group : Scope::Tuple);
                if (!bound) {
                    return std::unexpected(bound.error());
                }
                key = std::move(*bound);
            }
            plan_.order_by.push_back(SortKey{.expr = std::move(key), .ascending = item.ascending});
        }
        return {};
    }

    auto bind(const parser::Expr& expr, Scope scope, std::size_t table = 0) -> Result<ExprPtr> {
        if (scope == Scope::Group) {
            const auto folded = catalog::fold_name(expr.text);
            for (std::size_t i = 0; i < group_texts_.size(); ++i) {
                if (group_texts_[i] == folded) {
                    return make_slot(i, expr.text);
                }
            }
        }
        return std::visit(
            [&](const auto& node) -> Result<ExprPtr> { return bind_node(node, expr, scope, table); },
            expr.node);
    }

    auto bind_node(const parser::ColumnRefExpr& ref, const parser::Expr& expr, Scope scope,
                   std::size_t table) -> Result<ExprPtr> {
        auto column = resolve_column(ref, expr.text);
        if (!column) {
            return std::unexpected(column.error());
        }
        if (scope == Scope::Table) {
            if (column->table != table) {
                return std::unexpected(make_error(ErrorCode::Execution,
                                                  "column bound outside its table", expr.text));
            }
            return make_slot(column->field->position, column_label(*column));
        }
        const auto slot = tuple_slot(*column);
        if (scope == Scope::Group) {
            for (std::size_t i = 0; i < plan_.group_keys.size(); ++i) {
                const auto* key = std::get_if<SlotRef>(&plan_.group_keys[i]->node);
                if (key != nullptr && key->slot == slot) {
                    return make_slot(i, column_label(*column));
                }
            }
            return invalid(fmt::format("column '{}' must appear in GROUP BY or in an aggregate",
                                       expr.text),
                           expr.text);
        }
        return make_slot(slot, column_label(*column));
    }

    auto bind_node(const parser::LiteralExpr& literal, const parser::Expr& /*expr*/,
                   Scope /*scope*/, std::size_t /*table*/) -> Result<ExprPtr> {
        return make_literal(literal_value(literal));
    }

    auto bind_node(const parser::ParamExpr& param, const parser::Expr& /*expr*/, Scope /*scope*/,
                   std::size_t /*table*/) -> Result<ExprPtr> {
        return std::make_shared<const Expr>(Expr{.node = Param{.index = param.index}});
    }

    auto bind_node(const parser::UnaryExpr& unary, const parser::Expr& /*expr*/, Scope scope,
                   std::size_t table) -> Result<ExprPtr> {
        auto operand = bind(*unary.expr, scope, table);
        if (!operand) {
            return operand;
        }
        switch (unary.op) {
            case parser::UnaryOp::Negate:
                return std::make_shared<const Expr>(Expr{.node = Negate{.operand = *operand}});
            case parser::UnaryOp::Not:
                return std::make_shared<const Expr>(Expr{.node = Not{.operand = *operand}});
            case parser::UnaryOp::IsNull:
                return std::make_shared<const Expr>(
                    Expr{.node = NullTest{.operand = *operand, .negated = false}});
            case parser::UnaryOp::IsNotNull:
                return std::make_shared<const Expr>(
                    Expr{.node = NullTest{.operand = *operand, .negated = true}});
        }
        return invalid("unsupported unary operator");
    }

    auto bind_node(const parser::BinaryExpr& binary, const parser::Expr& /*expr*/, Scope scope,
                   std::size_t table) -> Result<ExprPtr> {
        auto left = bind(*binary.left, scope, table);
        if (!left) {
            return left;
        }
        auto right = bind(*binary.right, scope, table);
        if (!right) {
            return right;
        }
        if (auto op = arithmetic_op(binary.op)) {
            return std::make_shared<const Expr>(
                Expr{.node = Arith{.op = *op, .left = *left, .right = *right}});
        }
        if (auto op = compare_op(binary.op)) {
            return std::make_shared<const Expr>(
                Expr{.node = Compare{.op = *op, .left = *left, .right = *right}});
        }
        const auto op = binary.op == parser::BinaryOp::And ? LogicalOp::And : LogicalOp::Or;
        return std::make_shared<const Expr>(
            Expr{.node = Logical{.op = op, .left = *left, .right = *right}});
    }

    auto bind_node(const parser::CallExpr& call, const parser::Expr& expr, Scope scope,
                   std::size_t table) -> Result<ExprPtr> {
        const auto name = catalog::fold_name(call.callee);
        if (auto agg = aggregate_fn(name)) {
            if (scope != Scope::Group) {
                return invalid(fmt::format("aggregate function '{}' is not allowed here", name),
                               expr.text);
            }
            return bind_aggregate(call, *agg, expr);
        }
        if (call.star) {
            return invalid(fmt::format("'*' is only valid as the argument of count"), expr.text);
        }
        auto fn = scalar_fn(name);
        if (!fn.has_value()) {
            return invalid(fmt::format("unknown function '{}'", call.callee), expr.text);
        }
        const bool unary = *fn == ScalarFn::Lower || *fn == ScalarFn::Upper ||
                           *fn == ScalarFn::Length || *fn == ScalarFn::Abs;
        if ((unary && call.args.size() != 1) || call.args.empty()) {
            return invalid(fmt::format("wrong number of arguments to '{}'", name), expr.text);
        }
        Call bound{.fn = *fn, .args = {}};
        for (const auto& arg : call.args) {
            auto value = bind(*arg, scope, table);
            if (!value) {
                return value;
            }
            bound.args.push_back(std::move(*value));
        }
        return std::make_shared<const Expr>(Expr{.node = std::move(bound)});
    }

    auto bind_aggregate(const parser::CallExpr& call, AggFunc func, const parser::Expr& expr)
        -> Result<ExprPtr> {
        const auto text = catalog::fold_name(expr.text);
        for (std::size_t i = 0; i < plan_.aggregates.size(); ++i) {
            if (agg_texts_[i] == text) {
                return make_slot(plan_.group_keys.size() + i, expr.text);
            }
        }
        AggSpec spec{.func = func, .arg = nullptr, .label = expr.text};
        if (call.star) {
            if (func != AggFunc::Count) {
                return invalid(fmt::format("'*' is only valid as the argument of count"),
                               expr.text);
            }
            spec.func = AggFunc::CountStar;
        } else {
            if (call.args.size() != 1) {
                return invalid(fmt::format("aggregate '{}' takes one argument", agg_name(func)),
                               expr.text);
            }
            if (contains_aggregate(*call.args.front())) {
                return invalid("aggregate functions cannot be nested", expr.text);
            }
            auto arg = bind(*call.args.front(), Scope::Tuple);
            if (!arg) {
                return arg;
            }
            spec.arg = std::move(*arg);
        }
        plan_.aggregates.push_back(std::move(spec));
        agg_texts_.push_back(text);
        return make_slot(plan_.group_keys.size() + plan_.aggregates.size() - 1, expr.text);
    }

    const catalog::Catalog& catalog_;
    const CacheLookup& caches_;
    QueryPlan plan_;
    std::vector<TableBinding> tables_;
    std::vector<std::vector<Candidate>> candidates_;
    std::vector<std::string> group_texts_;
    std::vector<std::string> agg_texts_;
    std::vector<std::pair<std::string, std::size_t>> aliases_;
};

}  // namespace

auto plan_query(const parser::SelectStmt& stmt, const catalog::Catalog& catalog,
                const CacheLookup& caches, std::string sql) -> Result<QueryPlan> {
    Planner planner(catalog, caches);
    return planner.plan(stmt, std::move(sql));
}

auto plan_query(std::string_view sql, const catalog::Catalog& catalog, const CacheLookup& caches)
    -> Result<QueryPlan> {
    auto stmt = parser::parse(sql);
    if (!stmt) {
        const auto& error = stmt.error();
        return std::unexpected(make_error(ErrorCode::Parse, error.format(), error.fragment));
    }
    return plan_query(*stmt, catalog, caches, std::string(sql));
}

}  // namespace quarry::plan
