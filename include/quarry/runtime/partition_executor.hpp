#pragma once

#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>
#include <quarry/index/index_manager.hpp>
#include <quarry/plan/plan.hpp>
#include <quarry/plan/planner.hpp>
#include <quarry/runtime/aggregate.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace quarry::runtime {

enum class FragmentKind : std::uint8_t {
    /// Full query over the joined tables of one partition.
    Main,
    /// Filtered scan of one broadcast table within one partition.
    Broadcast,
};

/// Work shipped to one partition.
struct SubRequest {
    std::string sql;
    Row args;
    cache::PartitionId partition = 0;
    FragmentKind fragment = FragmentKind::Main;
    /// Join step scanned by a broadcast fragment.
    std::uint32_t fragment_table = 0;
    /// Rows of each broadcast join step, indexed by step; empty for other steps.
    std::vector<std::vector<Row>> broadcast;
};

/// Result of one sub-request. Main fragments of non-aggregate plans return
/// projected rows followed by their ORDER BY keys; aggregate plans return
/// partial groups; broadcast fragments return full-width table rows.
struct SubResponse {
    std::vector<Row> rows;
    std::vector<GroupPartial> groups;
};

/// Order two rows by the sort keys stored from column `first` on.
[[nodiscard]] auto compare_sort_keys(const Row& lhs, const Row& rhs,
                                     const std::vector<plan::SortKey>& keys, std::size_t first)
    -> std::weak_ordering;

/// Runs sub-requests against the partitions stored in this process. The read
/// lock of every partition involved is held for the whole sub-request.
class PartitionExecutor {
   public:
    PartitionExecutor(const catalog::Catalog& catalog, plan::CacheLookup caches,
                      const index::IndexManager& indexes)
        : catalog_(catalog), caches_(std::move(caches)), indexes_(indexes) {}

    /// Execute with an already planned query.
    [[nodiscard]] auto execute(const plan::QueryPlan& plan, const SubRequest& request) const
        -> Result<SubResponse>;

    /// Re-plan `request.sql` locally, then execute. This is the remote entry point.
    [[nodiscard]] auto execute(const SubRequest& request) const -> Result<SubResponse>;

   private:
    const catalog::Catalog& catalog_;
    plan::CacheLookup caches_;
    const index::IndexManager& indexes_;
};

}  // namespace quarry::runtime
