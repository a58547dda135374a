#pragma once

#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>
#include <quarry/index/index_manager.hpp>
#include <quarry/plan/plan.hpp>
#include <quarry/plan/planner.hpp>
#include <quarry/runtime/coordinator.hpp>
#include <quarry/runtime/partition_executor.hpp>
#include <quarry/runtime/worker_pool.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quarry {

struct EngineConfig {
    /// Partition count of caches created without an explicit one.
    std::size_t partitions = 4;
    runtime::CoordinatorConfig coordinator;
    /// Route every sub-request through the wire codec.
    bool loopback_wire = false;
};

/// Owns caches, catalog, indexes and the query pipeline.
class Engine {
   public:
    explicit Engine(EngineConfig config = {});
    ~Engine();

    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;

    auto create_cache(std::string name, cache::CacheMode mode,
                      std::optional<std::size_t> partitions = std::nullopt)
        -> Result<cache::Cache*>;
    [[nodiscard]] auto find_cache(std::string_view name) const -> cache::Cache*;
    [[nodiscard]] auto cache_names() const -> std::vector<std::string>;

    /// Register a type stored in an existing cache and build its indexes.
    auto register_type(std::string type_name, std::string cache_name,
                       std::vector<catalog::FieldSpec> fields, catalog::TypeOptions options = {})
        -> Result<const catalog::TypeDescriptor*>;

    /// Store an object. Its type must live in `cache_name` and its placement
    /// column must equal the key's placement value.
    auto put(std::string_view cache_name, cache::CacheKey key, cache::Object value) -> Status;
    [[nodiscard]] auto get(std::string_view cache_name, const cache::CacheKey& key) const
        -> Result<std::optional<cache::Object>>;
    auto remove(std::string_view cache_name, const cache::CacheKey& key) -> Result<bool>;

    [[nodiscard]] auto execute(std::string_view sql, const Row& args = {})
        -> Result<runtime::QueryResult>;
    [[nodiscard]] auto plan(std::string_view sql) const -> Result<plan::QueryPlan>;
    [[nodiscard]] auto explain(std::string_view sql) const -> Result<std::string>;

    [[nodiscard]] auto catalog() const noexcept -> const catalog::Catalog& { return catalog_; }
    [[nodiscard]] auto indexes() const noexcept -> const index::IndexManager& { return indexes_; }
    [[nodiscard]] auto executor() const noexcept -> const runtime::PartitionExecutor& {
        return *executor_;
    }
    [[nodiscard]] auto cache_lookup() const -> plan::CacheLookup;
    [[nodiscard]] auto config() const noexcept -> const EngineConfig& { return config_; }

   private:
    EngineConfig config_;
    catalog::Catalog catalog_;
    index::IndexManager indexes_;

    mutable std::shared_mutex caches_mutex_;
    std::vector<std::unique_ptr<cache::MemoryCache>> caches_;
    std::unordered_map<std::string, std::size_t> cache_index_;

    std::unique_ptr<runtime::PartitionExecutor> executor_;
    std::unique_ptr<runtime::PartitionTransport> transport_;
    std::unique_ptr<runtime::Coordinator> coordinator_;
    // Declared last so abandoned sub-requests finish before anything they use is destroyed.
    std::unique_ptr<runtime::WorkerPool> pool_;
};

}  // namespace quarry
