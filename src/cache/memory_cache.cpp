#include <quarry/cache/cache.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace quarry::cache {

MemoryCache::MemoryCache(std::string name, CacheMode mode, std::size_t partitions)
    : name_(std::move(name)), mode_(mode) {
    const std::size_t count = mode == CacheMode::Replicated ? 1 : std::max<std::size_t>(1, partitions);
    partitions_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        partitions_.push_back(std::make_unique<Partition>());
    }
}

auto MemoryCache::partition_of(const Value& placement) const -> PartitionId {
    return static_cast<PartitionId>(hash_value(placement) % partitions_.size());
}

auto MemoryCache::affinity_partition(const CacheKey& key) const -> PartitionId {
    return partition_of(key.placement());
}

auto MemoryCache::partition_at(PartitionId id) const -> Partition& {
    if (id >= partitions_.size()) {
        throw std::out_of_range(
            fmt::format("cache '{}': partition {} out of range ({} partitions)", name_, id,
                        partitions_.size()));
    }
    return *partitions_[id];
}

void MemoryCache::put(CacheKey key, Object value) {
    const auto id = affinity_partition(key);
    auto& partition = partition_at(id);
    std::unique_lock lock(partition.mutex);
    auto it = partition.entries.find(key);
    if (it == partition.entries.end()) {
        auto [inserted, _] = partition.entries.emplace(std::move(key), std::move(value));
        for (auto* listener : listeners_) {
            listener->on_put(name_, id, inserted->first, nullptr, inserted->second);
        }
        return;
    }
    Object previous = std::exchange(it->second, std::move(value));
    for (auto* listener : listeners_) {
        listener->on_put(name_, id, it->first, &previous, it->second);
    }
}

auto MemoryCache::get(const CacheKey& key) const -> std::optional<Object> {
    auto& partition = partition_at(affinity_partition(key));
    std::shared_lock lock(partition.mutex);
    if (auto it = partition.entries.find(key); it != partition.entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto MemoryCache::remove(const CacheKey& key) -> bool {
    const auto id = affinity_partition(key);
    auto& partition = partition_at(id);
    std::unique_lock lock(partition.mutex);
    auto it = partition.entries.find(key);
    if (it == partition.entries.end()) {
        return false;
    }
    for (auto* listener : listeners_) {
        listener->on_remove(name_, id, it->first, it->second);
    }
    partition.entries.erase(it);
    return true;
}

auto MemoryCache::scan(PartitionId partition_id) const -> std::vector<CacheEntry> {
    auto& partition = partition_at(partition_id);
    std::shared_lock lock(partition.mutex);
    std::vector<CacheEntry> out;
    out.reserve(partition.entries.size());
    for (const auto& [key, object] : partition.entries) {
        out.push_back(CacheEntry{.key = key, .value = object, .partition = partition_id});
    }
    return out;
}

void MemoryCache::read_partition(PartitionId partition_id,
                                 const std::function<void(const PartitionView&)>& reader) const {
    auto& partition = partition_at(partition_id);
    std::shared_lock lock(partition.mutex);
    reader(PartitionView(partition_id, partition.entries));
}

void MemoryCache::add_listener(MutationListener* listener) {
    listeners_.push_back(listener);
}

auto MemoryCache::size() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& partition : partitions_) {
        std::shared_lock lock(partition->mutex);
        total += partition->entries.size();
    }
    return total;
}

}  // namespace quarry::cache
