#include <quarry/runtime/coordinator.hpp>
#include <quarry/runtime/materializer.hpp>
#include <quarry/runtime/wire.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <iterator>
#include <optional>
#include <utility>

namespace quarry::runtime {

namespace {

void apply_window(std::vector<Row>& rows, std::optional<std::int64_t> limit,
                  std::optional<std::int64_t> offset) {
    const auto skip = static_cast<std::size_t>(offset.value_or(0));
    if (skip >= rows.size()) {
        rows.clear();
        return;
    }
    if (skip > 0) {
        rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(skip));
    }
    if (limit.has_value() && rows.size() > static_cast<std::size_t>(*limit)) {
        rows.resize(static_cast<std::size_t>(*limit));
    }
}

void strip_sort_keys(std::vector<Row>& rows, std::size_t width) {
    for (auto& row : rows) {
        row.resize(width);
    }
}

// K-way merge of locally sorted partials. Ties go to the lower partition.
auto merge_sorted(std::vector<SubResponse>& responses, const plan::QueryPlan& plan)
    -> std::vector<Row> {
    const auto first = plan.columns.size();
    std::vector<std::size_t> heads(responses.size(), 0);
    std::size_t total = 0;
    for (const auto& response : responses) {
        total += response.rows.size();
    }
    std::vector<Row> out;
    out.reserve(total);
    while (out.size() < total) {
        std::optional<std::size_t> best;
        for (std::size_t i = 0; i < responses.size(); ++i) {
            if (heads[i] >= responses[i].rows.size()) {
                continue;
            }
            if (!best.has_value() ||
                compare_sort_keys(responses[i].rows[heads[i]],
                                  responses[*best].rows[heads[*best]], plan.order_by, first) < 0) {
                best = i;
            }
        }
        out.push_back(std::move(responses[*best].rows[heads[*best]++]));
    }
    return out;
}

}  // namespace

auto LocalTransport::send(const plan::QueryPlan& plan, const SubRequest& request)
    -> Result<SubResponse> {
    return executor_.execute(plan, request);
}

auto LoopbackWireTransport::send(const plan::QueryPlan& /*plan*/, const SubRequest& request)
    -> Result<SubResponse> {
    const auto request_bytes = encode_request(request);
    if (!request_bytes) {
        return std::unexpected(request_bytes.error());
    }
    auto received = decode_request(*request_bytes);
    if (!received) {
        return std::unexpected(received.error());
    }
    const auto response_bytes = encode_response(executor_.execute(*received));
    if (!response_bytes) {
        return std::unexpected(response_bytes.error());
    }
    return decode_response(*response_bytes);
}

auto Coordinator::target_partitions(const plan::QueryPlan& plan, const Row& args) const
    -> Result<std::vector<cache::PartitionId>> {
    const auto& driving = plan.driving();
    const auto* cache = caches_(driving.type->cache_name);
    if (cache == nullptr) {
        return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                          fmt::format("cache '{}' does not exist",
                                                      driving.type->cache_name),
                                          driving.type->cache_name));
    }
    if (plan.routing.kind == plan::RouteKind::SinglePartition) {
        static const Row empty;
        auto placement = evaluate(*plan.routing.placement, empty, args);
        if (!placement) {
            return std::unexpected(placement.error());
        }
        const auto partition = cache->partition_of(*placement);
        spdlog::debug("routing to partition {} of '{}' on {}", partition, cache->name(),
                      format_value(*placement));
        return std::vector<cache::PartitionId>{partition};
    }
    std::vector<cache::PartitionId> partitions(cache->partition_count());
    for (std::size_t i = 0; i < partitions.size(); ++i) {
        partitions[i] = static_cast<cache::PartitionId>(i);
    }
    return partitions;
}

auto Coordinator::fan_out(const std::shared_ptr<const plan::QueryPlan>& plan,
                          std::vector<SubRequest> requests, Clock::time_point deadline)
    -> Result<std::vector<SubResponse>> {
    struct Pending {
        std::shared_ptr<const SubRequest> request;
        std::future<Result<SubResponse>> future;
        // Set by the worker when it picks the request up; max() while queued.
        std::shared_ptr<std::atomic<Clock::time_point>> started;
        std::size_t attempts = 0;
    };

    auto submit = [&](Pending& pending) {
        auto* transport = &transport_;
        auto request = pending.request;
        auto started = std::make_shared<std::atomic<Clock::time_point>>(Clock::time_point::max());
        pending.started = started;
        pending.future = pool_.submit([transport, plan, request,
                                       started]() -> Result<SubResponse> {
            started->store(Clock::now());
            try {
                return transport->send(*plan, *request);
            } catch (const std::exception& e) {
                return std::unexpected(make_error(
                    ErrorCode::Execution,
                    fmt::format("partition {} raised: {}", request->partition, e.what())));
            }
        });
        ++pending.attempts;
    };

    std::vector<Pending> pending(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        pending[i].request = std::make_shared<const SubRequest>(std::move(requests[i]));
        submit(pending[i]);
    }

    // Time spent queued behind other requests does not count against request_timeout.
    const auto queue_poll = std::max(config_.request_timeout / 4, std::chrono::milliseconds{1});

    std::vector<SubResponse> responses;
    responses.reserve(pending.size());
    for (auto& entry : pending) {
        for (;;) {
            const auto started = entry.started->load();
            const bool queued = started == Clock::time_point::max();
            const auto request_deadline =
                queued ? std::min(Clock::now() + queue_poll, deadline)
                       : std::min(started + config_.request_timeout, deadline);
            Error failure;
            if (entry.future.wait_until(request_deadline) == std::future_status::ready) {
                auto response = entry.future.get();
                if (response) {
                    responses.push_back(std::move(*response));
                    break;
                }
                if (!is_transient(response.error().code)) {
                    return std::unexpected(response.error());
                }
                failure = response.error();
            } else {
                if (Clock::now() >= deadline) {
                    return std::unexpected(make_error(
                        ErrorCode::QueryTimeout,
                        fmt::format("query exceeded {} ms", config_.query_timeout.count()),
                        plan->sql));
                }
                if (queued) {
                    continue;
                }
                failure = make_error(ErrorCode::PartitionUnavailable,
                                     fmt::format("request timed out after {} ms",
                                                 config_.request_timeout.count()));
            }
            if (entry.attempts > config_.max_retries) {
                return std::unexpected(make_error(
                    ErrorCode::PartialResult,
                    fmt::format("partition {} failed after {} attempt(s): {}",
                                entry.request->partition, entry.attempts, failure.message),
                    plan->sql));
            }
            spdlog::warn("partition {} failed ({}), retrying", entry.request->partition,
                         failure.format());
            submit(entry);
        }
    }
    return responses;
}

auto Coordinator::merge(const plan::QueryPlan& plan, std::vector<SubResponse> responses,
                        const Row& args) const -> Result<QueryResult> {
    QueryResult result;
    result.columns = plan.columns;
    const auto width = plan.columns.size();

    if (plan.aggregate) {
        GroupTable groups(plan.aggregates);
        for (const auto& response : responses) {
            for (const auto& partial : response.groups) {
                if (auto status = groups.merge(partial); !status) {
                    return std::unexpected(status.error());
                }
            }
        }
        for (const auto& tuple : groups.finish(!plan.group_keys.empty())) {
            auto row = project(plan.projection, tuple, args);
            if (!row) {
                return std::unexpected(row.error());
            }
            for (const auto& key : plan.order_by) {
                auto value = evaluate(*key.expr, tuple, args);
                if (!value) {
                    return std::unexpected(value.error());
                }
                row->push_back(std::move(*value));
            }
            result.rows.push_back(std::move(*row));
        }
        if (!plan.order_by.empty()) {
            std::stable_sort(result.rows.begin(), result.rows.end(),
                             [&](const Row& lhs, const Row& rhs) {
                                 return compare_sort_keys(lhs, rhs, plan.order_by, width) < 0;
                             });
        }
    } else if (plan.order_by.empty()) {
        for (auto& response : responses) {
            std::move(response.rows.begin(), response.rows.end(),
                      std::back_inserter(result.rows));
        }
    } else {
        result.rows = merge_sorted(responses, plan);
    }

    apply_window(result.rows, plan.limit, plan.offset);
    strip_sort_keys(result.rows, width);
    return result;
}

auto Coordinator::execute(std::shared_ptr<const plan::QueryPlan> plan, const Row& args)
    -> Result<QueryResult> {
    if (args.size() != plan->param_count) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            fmt::format("query expects {} argument(s), got {}", plan->param_count, args.size()),
            plan->sql));
    }
    const auto deadline = Clock::now() + config_.query_timeout;

    std::vector<std::vector<Row>> broadcast(plan->steps.size());
    for (std::size_t t = 0; t < plan->steps.size(); ++t) {
        const auto& step = plan->steps[t];
        if (step.strategy != plan::JoinStrategy::Broadcast) {
            continue;
        }
        const auto* cache = caches_(step.type->cache_name);
        if (cache == nullptr) {
            return std::unexpected(make_error(ErrorCode::UnresolvedTable,
                                              fmt::format("cache '{}' does not exist",
                                                          step.type->cache_name),
                                              step.type->cache_name));
        }
        std::vector<SubRequest> requests;
        for (std::size_t p = 0; p < cache->partition_count(); ++p) {
            requests.push_back(SubRequest{
                .sql = plan->sql,
                .args = args,
                .partition = static_cast<cache::PartitionId>(p),
                .fragment = FragmentKind::Broadcast,
                .fragment_table = static_cast<std::uint32_t>(t),
                .broadcast = {},
            });
        }
        auto responses = fan_out(plan, std::move(requests), deadline);
        if (!responses) {
            return std::unexpected(responses.error());
        }
        for (auto& response : *responses) {
            std::move(response.rows.begin(), response.rows.end(),
                      std::back_inserter(broadcast[t]));
        }
        spdlog::debug("broadcast {} row(s) of '{}'", broadcast[t].size(), step.type->name);
    }

    auto targets = target_partitions(*plan, args);
    if (!targets) {
        return std::unexpected(targets.error());
    }
    std::vector<SubRequest> requests;
    requests.reserve(targets->size());
    for (auto partition : *targets) {
        requests.push_back(SubRequest{
            .sql = plan->sql,
            .args = args,
            .partition = partition,
            .fragment = FragmentKind::Main,
            .fragment_table = 0,
            .broadcast = broadcast,
        });
    }
    spdlog::debug("dispatching {} sub-request(s)", requests.size());
    auto responses = fan_out(plan, std::move(requests), deadline);
    if (!responses) {
        return std::unexpected(responses.error());
    }
    return merge(*plan, std::move(*responses), args);
}

}  // namespace quarry::runtime
