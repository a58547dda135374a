#include <quarry/engine.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace quarry {

Engine::Engine(EngineConfig config) : config_(std::move(config)), indexes_(catalog_) {
    executor_ = std::make_unique<runtime::PartitionExecutor>(catalog_, cache_lookup(), indexes_);
    if (config_.loopback_wire) {
        transport_ = std::make_unique<runtime::LoopbackWireTransport>(*executor_);
    } else {
        transport_ = std::make_unique<runtime::LocalTransport>(*executor_);
    }
    pool_ = std::make_unique<runtime::WorkerPool>(config_.coordinator.worker_threads);
    coordinator_ = std::make_unique<runtime::Coordinator>(config_.coordinator, *transport_,
                                                          *pool_, cache_lookup());
}

Engine::~Engine() {
    // Join workers before the transport and executor go away.
    pool_.reset();
}

auto Engine::cache_lookup() const -> plan::CacheLookup {
    return [this](std::string_view name) -> const cache::Cache* { return find_cache(name); };
}

auto Engine::create_cache(std::string name, cache::CacheMode mode,
                          std::optional<std::size_t> partitions) -> Result<cache::Cache*> {
    const auto count = partitions.value_or(config_.partitions);
    if (name.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "cache name is empty"));
    }
    if (count == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("cache '{}' needs at least one partition",
                                                      name),
                                          name));
    }
    std::unique_lock<std::shared_mutex> lock(caches_mutex_);
    auto key = catalog::fold_name(name);
    if (cache_index_.contains(key)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("cache '{}' already exists", name), name));
    }
    auto cache = std::make_unique<cache::MemoryCache>(name, mode, count);
    cache->add_listener(&indexes_);
    auto* raw = cache.get();
    cache_index_.emplace(std::move(key), caches_.size());
    caches_.push_back(std::move(cache));
    spdlog::debug("created {} cache '{}' with {} partition(s)",
                  mode == cache::CacheMode::Replicated ? "replicated" : "partitioned", name,
                  raw->partition_count());
    return raw;
}

auto Engine::find_cache(std::string_view name) const -> cache::Cache* {
    std::shared_lock<std::shared_mutex> lock(caches_mutex_);
    if (auto it = cache_index_.find(catalog::fold_name(name)); it != cache_index_.end()) {
        return caches_[it->second].get();
    }
    return nullptr;
}

auto Engine::cache_names() const -> std::vector<std::string> {
    std::shared_lock<std::shared_mutex> lock(caches_mutex_);
    std::vector<std::string> names;
    names.reserve(caches_.size());
    for (const auto& cache : caches_) {
        names.push_back(cache->name());
    }
    return names;
}

auto Engine::register_type(std::string type_name, std::string cache_name,
                           std::vector<catalog::FieldSpec> fields, catalog::TypeOptions options)
    -> Result<const catalog::TypeDescriptor*> {
    auto* cache = find_cache(cache_name);
    if (cache == nullptr) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("cache '{}' does not exist", cache_name),
                                          cache_name));
    }
    auto type = catalog_.register_type(std::move(type_name), cache->name(), std::move(fields),
                                       std::move(options));
    if (!type) {
        return type;
    }
    indexes_.add_type(**type, *cache);
    return type;
}

auto Engine::put(std::string_view cache_name, cache::CacheKey key, cache::Object value)
    -> Status {
    auto* cache = find_cache(cache_name);
    if (cache == nullptr) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("cache '{}' does not exist", cache_name),
                                          std::string(cache_name)));
    }
    const auto* type = catalog_.find_type(value.type_name);
    if (type == nullptr || catalog::fold_name(type->cache_name) != catalog::fold_name(cache_name)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            fmt::format("type '{}' is not registered in cache '{}'", value.type_name, cache_name),
            value.type_name));
    }
    if (!value.data) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("'{}' object has no payload",
                                                      value.type_name),
                                          value.type_name));
    }
    // Stored under the registered spelling so scans can match on it.
    value.type_name = type->name;
    if (type->has_affinity_column && is_null(key.affinity)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            fmt::format("key of a '{}' object needs an affinity value", type->name), type->name));
    }
    if (type->placement_field.has_value()) {
        const auto& field = type->fields[*type->placement_field];
        const auto placement = field.get(*value.data);
        if (!values_equal(placement, key.placement())) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                fmt::format("{}.{} is {} but the key places the entry by {}", type->name,
                            field.name, format_value(placement), format_value(key.placement())),
                field.name));
        }
    }
    cache->put(std::move(key), std::move(value));
    return {};
}

auto Engine::get(std::string_view cache_name, const cache::CacheKey& key) const
    -> Result<std::optional<cache::Object>> {
    const auto* cache = find_cache(cache_name);
    if (cache == nullptr) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("cache '{}' does not exist", cache_name),
                                          std::string(cache_name)));
    }
    return cache->get(key);
}

auto Engine::remove(std::string_view cache_name, const cache::CacheKey& key) -> Result<bool> {
    auto* cache = find_cache(cache_name);
    if (cache == nullptr) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("cache '{}' does not exist", cache_name),
                                          std::string(cache_name)));
    }
    return cache->remove(key);
}

auto Engine::plan(std::string_view sql) const -> Result<plan::QueryPlan> {
    return plan::plan_query(sql, catalog_, cache_lookup());
}

auto Engine::explain(std::string_view sql) const -> Result<std::string> {
    auto planned = plan(sql);
    if (!planned) {
        return std::unexpected(planned.error());
    }
    return plan::to_string(*planned);
}

auto Engine::execute(std::string_view sql, const Row& args) -> Result<runtime::QueryResult> {
    auto planned = plan(sql);
    if (!planned) {
        spdlog::debug("planning failed: {}", planned.error().format());
        return std::unexpected(planned.error());
    }
    auto shared = std::make_shared<const plan::QueryPlan>(std::move(*planned));
    auto result = coordinator_->execute(std::move(shared), args);
    if (result) {
        spdlog::debug("query returned {} row(s)", result->rows.size());
    }
    return result;
}

}  // namespace quarry
