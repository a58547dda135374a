#pragma once

#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>
#include <quarry/plan/plan.hpp>
#include <quarry/plan/planner.hpp>
#include <quarry/runtime/partition_executor.hpp>
#include <quarry/runtime/worker_pool.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace quarry::runtime {

struct CoordinatorConfig {
    /// Whole-query deadline; outstanding sub-requests are abandoned when it passes.
    std::chrono::milliseconds query_timeout{30000};
    /// Deadline of a single sub-request, measured from when a worker starts running it.
    std::chrono::milliseconds request_timeout{10000};
    /// Extra attempts granted to a sub-request that failed transiently.
    std::size_t max_retries = 1;
    std::size_t worker_threads = 4;
};

/// Rows of a finished query with their column labels.
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

/// Delivers a sub-request to the node that owns its partition. Called
/// concurrently from worker threads.
class PartitionTransport {
   public:
    virtual ~PartitionTransport() = default;

    [[nodiscard]] virtual auto send(const plan::QueryPlan& plan, const SubRequest& request)
        -> Result<SubResponse> = 0;
};

/// In-process delivery: the partition executor runs the coordinator's plan.
class LocalTransport final : public PartitionTransport {
   public:
    explicit LocalTransport(const PartitionExecutor& executor) : executor_(executor) {}

    [[nodiscard]] auto send(const plan::QueryPlan& plan, const SubRequest& request)
        -> Result<SubResponse> override;

   private:
    const PartitionExecutor& executor_;
};

/// Serializes every request and response through the wire codec; the receiving
/// side re-plans the SQL text it was sent, as a remote node would.
class LoopbackWireTransport final : public PartitionTransport {
   public:
    explicit LoopbackWireTransport(const PartitionExecutor& executor) : executor_(executor) {}

    [[nodiscard]] auto send(const plan::QueryPlan& plan, const SubRequest& request)
        -> Result<SubResponse> override;

   private:
    const PartitionExecutor& executor_;
};

/// Fans a planned query out to partitions, then merges, aggregates, sorts and
/// limits the partial results.
class Coordinator {
   public:
    Coordinator(CoordinatorConfig config, PartitionTransport& transport, WorkerPool& pool,
                plan::CacheLookup caches)
        : config_(config), transport_(transport), pool_(pool), caches_(std::move(caches)) {}

    [[nodiscard]] auto execute(std::shared_ptr<const plan::QueryPlan> plan, const Row& args)
        -> Result<QueryResult>;

    [[nodiscard]] auto config() const noexcept -> const CoordinatorConfig& { return config_; }

   private:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] auto target_partitions(const plan::QueryPlan& plan, const Row& args) const
        -> Result<std::vector<cache::PartitionId>>;
    [[nodiscard]] auto fan_out(const std::shared_ptr<const plan::QueryPlan>& plan,
                               std::vector<SubRequest> requests, Clock::time_point deadline)
        -> Result<std::vector<SubResponse>>;
    [[nodiscard]] auto merge(const plan::QueryPlan& plan, std::vector<SubResponse> responses,
                             const Row& args) const -> Result<QueryResult>;

    CoordinatorConfig config_;
    PartitionTransport& transport_;
    WorkerPool& pool_;
    plan::CacheLookup caches_;
};

}  // namespace quarry::runtime
