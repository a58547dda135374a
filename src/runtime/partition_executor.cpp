#include <quarry/runtime/materializer.hpp>
#include <quarry/runtime/partition_executor.hpp>

#include <fmt/core.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace quarry::runtime {

namespace {

struct LockTarget {
    const cache::Cache* cache = nullptr;
    cache::PartitionId partition = 0;
};

/// One sub-request evaluated while every partition it reads is locked.
class FragmentRun {
   public:
    FragmentRun(const plan::QueryPlan& plan, const SubRequest& request,
                const index::IndexManager& indexes, std::vector<const cache::PartitionView*> views)
        : plan_(plan), request_(request), indexes_(indexes), views_(std::move(views)) {}

    auto run() -> Result<SubResponse> {
        SubResponse response;
        if (request_.fragment == FragmentKind::Broadcast) {
            auto rows = scan_table(request_.fragment_table);
            if (!rows) {
                return std::unexpected(rows.error());
            }
            response.rows = std::move(*rows);
            return response;
        }

        auto tuples = join();
        if (!tuples) {
            return std::unexpected(tuples.error());
        }

        if (plan_.aggregate) {
            GroupTable groups(plan_.aggregates);
            for (const auto& tuple : *tuples) {
                if (auto status = groups.add(plan_.group_keys, tuple, request_.args); !status) {
                    return std::unexpected(status.error());
                }
            }
            response.groups = groups.partials();
            return response;
        }

        response.rows.reserve(tuples->size());
        for (const auto& tuple : *tuples) {
            auto row = project(plan_.projection, tuple, request_.args);
            if (!row) {
                return std::unexpected(row.error());
            }
            for (const auto& key : plan_.order_by) {
                auto value = evaluate(*key.expr, tuple, request_.args);
                if (!value) {
                    return std::unexpected(value.error());
                }
                row->push_back(std::move(*value));
            }
            response.rows.push_back(std::move(*row));
        }
        if (!plan_.order_by.empty()) {
            const auto first = plan_.columns.size();
            std::stable_sort(response.rows.begin(), response.rows.end(),
                             [&](const Row& lhs, const Row& rhs) {
                                 return compare_sort_keys(lhs, rhs, plan_.order_by, first) < 0;
                             });
        }
        // Rows past offset + limit can never reach the final result. A sum past the
        // BIGINT range bounds nothing.
        std::int64_t keep = 0;
        if (plan_.limit.has_value() &&
            !__builtin_add_overflow(*plan_.limit, plan_.offset.value_or(0), &keep) &&
            response.rows.size() > static_cast<std::size_t>(keep)) {
            response.rows.resize(static_cast<std::size_t>(keep));
        }
        return response;
    }

   private:
    auto bound_value(const plan::BoundExpr& bound) const -> Result<Value> {
        static const Row empty;
        return evaluate(*bound.value, empty, request_.args);
    }

    auto open_cursor(std::size_t t) const -> Result<std::optional<index::IndexCursor>> {
        const auto& step = plan_.steps[t];
        const auto& access = step.access;
        if (access.kind == plan::AccessKind::FullScan) {
            return std::optional<index::IndexCursor>{};
        }
        index::KeyRange range;
        if (access.lower.has_value()) {
            auto value = bound_value(*access.lower);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (is_null(*value)) {
                return std::optional<index::IndexCursor>{index::IndexCursor{}};
            }
            range.lower = index::Bound{.value = std::move(*value), .inclusive = access.lower->inclusive};
        }
        if (access.upper.has_value()) {
            auto value = bound_value(*access.upper);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (is_null(*value)) {
                return std::optional<index::IndexCursor>{index::IndexCursor{}};
            }
            range.upper = index::Bound{.value = std::move(*value), .inclusive = access.upper->inclusive};
        }
        return indexes_.lookup(*step.type, access.field, views_[t]->id(), range);
    }

    // Materialize the entries of step `t` that pass its local filters.
    auto scan_table(std::size_t t) const -> Result<std::vector<Row>> {
        const auto& step = plan_.steps[t];
        const auto* view = views_[t];
        std::vector<Row> rows;
        auto accept = [&](const cache::Object& object) -> Status {
            if (object.type_name != step.type->name) {
                return {};
            }
            Row row = materialize(*step.type, object);
            auto ok = passes(step.filters, row, request_.args);
            if (!ok) {
                return std::unexpected(ok.error());
            }
            if (*ok) {
                rows.push_back(std::move(row));
            }
            return {};
        };

        auto cursor = open_cursor(t);
        if (!cursor) {
            return std::unexpected(cursor.error());
        }
        if (cursor->has_value()) {
            auto& keys = **cursor;
            while (const auto* key = keys.next()) {
                const auto* object = view->find(*key);
                if (object == nullptr) {
                    continue;
                }
                if (auto status = accept(*object); !status) {
                    return std::unexpected(status.error());
                }
            }
            return rows;
        }
        Status status;
        view->for_each([&](const cache::CacheKey& /*key*/, const cache::Object& object) {
            if (status) {
                status = accept(object);
            }
        });
        if (!status) {
            return std::unexpected(status.error());
        }
        return rows;
    }

    auto table_rows(std::size_t t) const -> Result<std::vector<Row>> {
        if (plan_.steps[t].strategy == plan::JoinStrategy::Broadcast) {
            return request_.broadcast[t];
        }
        return scan_table(t);
    }

    auto place(const Row& left, const Row& right, std::size_t offset) const -> Row {
        Row tuple = left;
        std::copy(right.begin(), right.end(), tuple.begin() + static_cast<std::ptrdiff_t>(offset));
        return tuple;
    }

    static auto keys_match(const Row& left, const Row& right, const std::vector<plan::JoinKey>& keys)
        -> bool {
        return std::ranges::all_of(keys, [&](const plan::JoinKey& key) {
            const auto& l = left[key.left_slot];
            const auto& r = right[key.right_field];
            return !is_null(l) && !is_null(r) && values_equal(l, r);
        });
    }

    auto join() const -> Result<std::vector<Row>> {
        auto first = table_rows(0);
        if (!first) {
            return std::unexpected(first.error());
        }
        std::vector<Row> tuples;
        tuples.reserve(first->size());
        const Row blank(plan_.tuple_width);
        for (const auto& row : *first) {
            tuples.push_back(place(blank, row, 0));
        }

        for (std::size_t t = 1; t < plan_.steps.size() && !tuples.empty(); ++t) {
            auto joined = plan_.steps[t].lookup_key.has_value() ? index_join(t, tuples)
                                                                 : hash_join(t, tuples);
            if (!joined) {
                return std::unexpected(joined.error());
            }
            tuples = std::move(*joined);
        }

        if (plan_.residual.empty()) {
            return tuples;
        }
        std::vector<Row> kept;
        for (auto& tuple : tuples) {
            auto ok = passes(plan_.residual, tuple, request_.args);
            if (!ok) {
                return std::unexpected(ok.error());
            }
            if (*ok) {
                kept.push_back(std::move(tuple));
            }
        }
        return kept;
    }

    // Index nested loop: probe the right table's index once per left tuple.
    auto index_join(std::size_t t, const std::vector<Row>& left) const
        -> Result<std::vector<Row>> {
        const auto& step = plan_.steps[t];
        const auto& lookup = step.keys[*step.lookup_key];
        const auto* view = views_[t];
        std::vector<Row> out;
        for (const auto& tuple : left) {
            const auto& probe = tuple[lookup.left_slot];
            if (is_null(probe)) {
                continue;
            }
            auto cursor = indexes_.lookup(*step.type, lookup.right_field, view->id(),
                                          index::KeyRange::equal(probe));
            if (!cursor.has_value()) {
                return hash_join(t, left);
            }
            while (const auto* key = cursor->next()) {
                const auto* object = view->find(*key);
                if (object == nullptr || object->type_name != step.type->name) {
                    continue;
                }
                Row row = materialize(*step.type, *object);
                if (!keys_match(tuple, row, step.keys)) {
                    continue;
                }
                auto ok = passes(step.filters, row, request_.args);
                if (!ok) {
                    return std::unexpected(ok.error());
                }
                if (*ok) {
                    out.push_back(place(tuple, row, step.offset));
                }
            }
        }
        return out;
    }

    // Hash join on the equi-keys; a cross product when there are none.
    auto hash_join(std::size_t t, const std::vector<Row>& left) const
        -> Result<std::vector<Row>> {
        const auto& step = plan_.steps[t];
        auto right = table_rows(t);
        if (!right) {
            return std::unexpected(right.error());
        }
        std::vector<Row> out;
        if (step.keys.empty()) {
            out.reserve(left.size() * right->size());
            for (const auto& tuple : left) {
                for (const auto& row : *right) {
                    out.push_back(place(tuple, row, step.offset));
                }
            }
            return out;
        }

        robin_hood::unordered_flat_map<Row, std::vector<std::size_t>, RowHash, RowEq> build;
        build.reserve(right->size());
        for (std::size_t i = 0; i < right->size(); ++i) {
            Row key;
            key.reserve(step.keys.size());
            for (const auto& k : step.keys) {
                key.push_back((*right)[i][k.right_field]);
            }
            if (std::ranges::any_of(key, [](const Value& v) { return is_null(v); })) {
                continue;
            }
            build[std::move(key)].push_back(i);
        }
        for (const auto& tuple : left) {
            Row key;
            key.reserve(step.keys.size());
            for (const auto& k : step.keys) {
                key.push_back(tuple[k.left_slot]);
            }
            auto it = build.find(key);
            if (it == build.end()) {
                continue;
            }
            for (auto i : it->second) {
                out.push_back(place(tuple, (*right)[i], step.offset));
            }
        }
        return out;
    }

    const plan::QueryPlan& plan_;
    const SubRequest& request_;
    const index::IndexManager& indexes_;
    std::vector<const cache::PartitionView*> views_;
};

}  // namespace

auto compare_sort_keys(const Row& lhs, const Row& rhs, const std::vector<plan::SortKey>& keys,
                       std::size_t first) -> std::weak_ordering {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        const auto order = compare(lhs[first + i], rhs[first + i]);
        if (order != 0) {
            return keys[i].ascending ? order : 0 <=> order;
        }
    }
    return std::weak_ordering::equivalent;
}

auto PartitionExecutor::execute(const plan::QueryPlan& plan, const SubRequest& request) const
    -> Result<SubResponse> {
    const bool broadcast = request.fragment == FragmentKind::Broadcast;
    if (broadcast && request.fragment_table >= plan.steps.size()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            fmt::format("broadcast fragment names join step {}", request.fragment_table)));
    }

    // Distinct (cache, partition) pairs, locked once each in a fixed order.
    std::vector<LockTarget> targets;
    std::vector<std::size_t> target_of(plan.steps.size(), 0);
    std::vector<bool> reads(plan.steps.size(), false);
    for (std::size_t t = 0; t < plan.steps.size(); ++t) {
        const auto& step = plan.steps[t];
        if (broadcast ? t != request.fragment_table
                      : step.strategy == plan::JoinStrategy::Broadcast) {
            if (!broadcast && request.broadcast.size() <= t) {
                return std::unexpected(make_error(
                    ErrorCode::InvalidArgument,
                    fmt::format("no broadcast rows for table '{}'", step.type->name)));
            }
            continue;
        }
        const auto* cache = caches_(step.type->cache_name);
        if (cache == nullptr) {
            return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                              fmt::format("cache '{}' does not exist",
                                                          step.type->cache_name),
                                              step.type->cache_name));
        }
        const cache::PartitionId partition =
            !broadcast && step.strategy == plan::JoinStrategy::Replicated ? 0 : request.partition;
        if (partition >= cache->partition_count()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                fmt::format("partition {} out of range for cache '{}'", partition, cache->name())));
        }
        auto it = std::ranges::find_if(targets, [&](const LockTarget& target) {
            return target.cache == cache && target.partition == partition;
        });
        if (it == targets.end()) {
            targets.push_back(LockTarget{.cache = cache, .partition = partition});
        }
        reads[t] = true;
    }
    std::ranges::sort(targets, [](const LockTarget& lhs, const LockTarget& rhs) {
        if (lhs.cache->name() != rhs.cache->name()) {
            return lhs.cache->name() < rhs.cache->name();
        }
        return lhs.partition < rhs.partition;
    });
    for (std::size_t t = 0; t < plan.steps.size(); ++t) {
        if (!reads[t]) {
            continue;
        }
        const auto* cache = caches_(plan.steps[t].type->cache_name);
        const cache::PartitionId partition =
            !broadcast && plan.steps[t].strategy == plan::JoinStrategy::Replicated
                ? 0
                : request.partition;
        target_of[t] = static_cast<std::size_t>(
            std::ranges::find_if(targets, [&](const LockTarget& target) {
                return target.cache == cache && target.partition == partition;
            }) -
            targets.begin());
    }

    Result<SubResponse> result =
        std::unexpected(make_error(ErrorCode::Execution, "sub-request did not run"));
    std::vector<const cache::PartitionView*> locked(targets.size(), nullptr);
    std::function<void(std::size_t)> acquire = [&](std::size_t i) {
        if (i == targets.size()) {
            std::vector<const cache::PartitionView*> views(plan.steps.size(), nullptr);
            for (std::size_t t = 0; t < plan.steps.size(); ++t) {
                if (reads[t]) {
                    views[t] = locked[target_of[t]];
                }
            }
            FragmentRun run(plan, request, indexes_, std::move(views));
            result = run.run();
            return;
        }
        targets[i].cache->read_partition(targets[i].partition,
                                         [&](const cache::PartitionView& view) {
                                             locked[i] = &view;
                                             acquire(i + 1);
                                         });
    };
    acquire(0);

    if (result) {
        spdlog::debug("partition {} {} fragment: {} row(s), {} group(s)", request.partition,
                      broadcast ? "broadcast" : "main", result->rows.size(),
                      result->groups.size());
    }
    return result;
}

auto PartitionExecutor::execute(const SubRequest& request) const -> Result<SubResponse> {
    auto plan = plan::plan_query(request.sql, catalog_, caches_);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    return execute(*plan, request);
}

}  // namespace quarry::runtime
