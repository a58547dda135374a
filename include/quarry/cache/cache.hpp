#pragma once

#include <quarry/core/value.hpp>

#include <robin_hood.h>

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace quarry::cache {

using PartitionId = std::uint32_t;

/// A cached object: the registered type it belongs to plus its payload.
/// The payload is immutable once stored; readers share it.
struct Object {
    std::string type_name;
    std::shared_ptr<const std::any> data;
};

template <typename T>
[[nodiscard]] auto make_object(std::string type_name, T value) -> Object {
    return Object{
        .type_name = std::move(type_name),
        .data = std::make_shared<const std::any>(std::move(value)),
    };
}

/// Cache key. When `affinity` is non-NULL it decides the partition instead of
/// `id`, so entries sharing an affinity value are co-located.
struct CacheKey {
    Value id;
    Value affinity;

    [[nodiscard]] auto placement() const noexcept -> const Value& {
        return is_null(affinity) ? id : affinity;
    }
};

struct CacheKeyHash {
    auto operator()(const CacheKey& key) const noexcept -> std::size_t {
        return hash_value(key.id) * 31 + hash_value(key.affinity);
    }
};

struct CacheKeyEq {
    auto operator()(const CacheKey& lhs, const CacheKey& rhs) const noexcept -> bool {
        return values_equal(lhs.id, rhs.id) && values_equal(lhs.affinity, rhs.affinity);
    }
};

struct CacheEntry {
    CacheKey key;
    Object value;
    PartitionId partition = 0;
};

enum class CacheMode : std::uint8_t {
    Partitioned,
    Replicated,
};

using EntryMap = robin_hood::unordered_node_map<CacheKey, Object, CacheKeyHash, CacheKeyEq>;

/// Read access to one partition, valid only while the partition's read lock is held.
class PartitionView {
   public:
    PartitionView(PartitionId id, const EntryMap& entries) : id_(id), entries_(&entries) {}

    [[nodiscard]] auto id() const noexcept -> PartitionId { return id_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_->size(); }

    [[nodiscard]] auto find(const CacheKey& key) const -> const Object* {
        if (auto it = entries_->find(key); it != entries_->end()) {
            return &it->second;
        }
        return nullptr;
    }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& [key, object] : *entries_) {
            fn(key, object);
        }
    }

   private:
    PartitionId id_;
    const EntryMap* entries_;
};

/// Observer of cache mutations. Callbacks run inside the partition's exclusive
/// lock, so observers see every mutation atomically with the cache itself.
class MutationListener {
   public:
    virtual ~MutationListener() = default;

    virtual void on_put(const std::string& cache_name, PartitionId partition, const CacheKey& key,
                        const Object* previous, const Object& current) = 0;
    virtual void on_remove(const std::string& cache_name, PartitionId partition,
                           const CacheKey& key, const Object& previous) = 0;
};

/// The key-value collaborator the query engine runs on.
class Cache {
   public:
    virtual ~Cache() = default;

    [[nodiscard]] virtual auto name() const noexcept -> const std::string& = 0;
    [[nodiscard]] virtual auto mode() const noexcept -> CacheMode = 0;
    [[nodiscard]] virtual auto partition_count() const noexcept -> std::size_t = 0;

    /// Partition an entry with this key lives in.
    [[nodiscard]] virtual auto affinity_partition(const CacheKey& key) const -> PartitionId = 0;
    /// Partition a given placement value maps to.
    [[nodiscard]] virtual auto partition_of(const Value& placement) const -> PartitionId = 0;

    virtual void put(CacheKey key, Object value) = 0;
    [[nodiscard]] virtual auto get(const CacheKey& key) const -> std::optional<Object> = 0;
    virtual auto remove(const CacheKey& key) -> bool = 0;
    [[nodiscard]] virtual auto scan(PartitionId partition) const -> std::vector<CacheEntry> = 0;

    /// Run `reader` while holding the partition's read lock.
    virtual void read_partition(PartitionId partition,
                                const std::function<void(const PartitionView&)>& reader) const = 0;

    virtual void add_listener(MutationListener* listener) = 0;
};

/// In-process cache: a fixed number of hash partitions, each guarded by a
/// single-writer/multi-reader lock. A replicated cache keeps one full copy.
class MemoryCache final : public Cache {
   public:
    MemoryCache(std::string name, CacheMode mode, std::size_t partitions);

    [[nodiscard]] auto name() const noexcept -> const std::string& override { return name_; }
    [[nodiscard]] auto mode() const noexcept -> CacheMode override { return mode_; }
    [[nodiscard]] auto partition_count() const noexcept -> std::size_t override {
        return partitions_.size();
    }

    [[nodiscard]] auto affinity_partition(const CacheKey& key) const -> PartitionId override;
    [[nodiscard]] auto partition_of(const Value& placement) const -> PartitionId override;

    void put(CacheKey key, Object value) override;
    [[nodiscard]] auto get(const CacheKey& key) const -> std::optional<Object> override;
    auto remove(const CacheKey& key) -> bool override;
    [[nodiscard]] auto scan(PartitionId partition) const -> std::vector<CacheEntry> override;

    void read_partition(PartitionId partition,
                        const std::function<void(const PartitionView&)>& reader) const override;

    void add_listener(MutationListener* listener) override;

    /// Total number of entries across partitions.
    [[nodiscard]] auto size() const -> std::size_t;

   private:
    struct Partition {
        mutable std::shared_mutex mutex;
        EntryMap entries;
    };

    [[nodiscard]] auto partition_at(PartitionId id) const -> Partition&;

    std::string name_;
    CacheMode mode_;
    std::vector<std::unique_ptr<Partition>> partitions_;
    std::vector<MutationListener*> listeners_;
};

}  // namespace quarry::cache
