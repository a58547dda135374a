#pragma once

#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/core/value.hpp>

#include <robin_hood.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quarry::index {

struct Bound {
    Value value;
    bool inclusive = true;
};

/// Key interval for index scans. A missing side is unbounded; NULL keys never match.
struct KeyRange {
    std::optional<Bound> lower;
    std::optional<Bound> upper;

    [[nodiscard]] static auto equal(Value value) -> KeyRange;

    [[nodiscard]] auto is_point() const -> bool;
    [[nodiscard]] auto contains(const Value& value) const -> bool;
};

using OrderedMap = std::multimap<Value, cache::CacheKey, ValueLess>;
using HashMap = robin_hood::unordered_node_map<Value, std::vector<cache::CacheKey>, ValueHash, ValueEq>;

/// Lazy, restartable sequence of index matches. Valid while the partition read
/// lock it was obtained under is held.
class IndexCursor {
   public:
    using OrderedIt = OrderedMap::const_iterator;

    IndexCursor() = default;
    IndexCursor(OrderedIt first, OrderedIt last)
        : first_(first), last_(last), pos_(first), ordered_(true) {}
    explicit IndexCursor(const std::vector<cache::CacheKey>* bucket) : bucket_(bucket) {}

    /// Next matching key, or nullptr at the end.
    [[nodiscard]] auto next() -> const cache::CacheKey*;
    void restart() noexcept;

    [[nodiscard]] auto ordered() const noexcept -> bool { return ordered_; }

   private:
    OrderedIt first_{};
    OrderedIt last_{};
    OrderedIt pos_{};
    const std::vector<cache::CacheKey>* bucket_ = nullptr;
    std::size_t bucket_pos_ = 0;
    bool ordered_ = false;
};

/// Index over one column of one type within one partition.
class PartitionIndex {
   public:
    explicit PartitionIndex(catalog::IndexKind kind) : kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> catalog::IndexKind { return kind_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

    void insert(const Value& value, const cache::CacheKey& key);
    void remove(const Value& value, const cache::CacheKey& key);

    [[nodiscard]] auto equality_scan(const Value& value) const -> IndexCursor;
    /// nullopt when the index cannot serve ranges (hash indexes).
    [[nodiscard]] auto range_scan(const KeyRange& range) const -> std::optional<IndexCursor>;

   private:
    catalog::IndexKind kind_;
    OrderedMap ordered_;
    HashMap hashed_;
    std::size_t size_ = 0;
};

/// Keeps one index per indexed column per partition, in step with the cache.
class IndexManager final : public cache::MutationListener {
   public:
    explicit IndexManager(const catalog::Catalog& catalog) : catalog_(catalog) {}

    IndexManager(const IndexManager&) = delete;
    auto operator=(const IndexManager&) -> IndexManager& = delete;

    /// Create the indexes of `type` for every partition of `cache` and load the
    /// entries already stored there. Called at registration time.
    void add_type(const catalog::TypeDescriptor& type, const cache::Cache& cache);

    void insert(cache::PartitionId partition, const cache::CacheKey& key,
                const cache::Object& object);
    void remove(cache::PartitionId partition, const cache::CacheKey& key,
                const cache::Object& object);

    void on_put(const std::string& cache_name, cache::PartitionId partition,
                const cache::CacheKey& key, const cache::Object* previous,
                const cache::Object& current) override;
    void on_remove(const std::string& cache_name, cache::PartitionId partition,
                   const cache::CacheKey& key, const cache::Object& previous) override;

    [[nodiscard]] auto find(const catalog::TypeDescriptor& type, std::size_t field,
                            cache::PartitionId partition) const -> const PartitionIndex*;

    /// Cursor over entries of `type` whose `field` lies in `range`; nullopt when
    /// no index can serve the predicate.
    [[nodiscard]] auto lookup(const catalog::TypeDescriptor& type, std::size_t field,
                              cache::PartitionId partition, const KeyRange& range) const
        -> std::optional<IndexCursor>;

   private:
    struct ColumnIndexes {
        std::size_t field = 0;
        std::vector<std::unique_ptr<PartitionIndex>> partitions;
    };

    [[nodiscard]] auto indexes_for(const cache::Object& object) const
        -> std::pair<const catalog::TypeDescriptor*, const std::vector<ColumnIndexes>*>;

    const catalog::Catalog& catalog_;
    std::unordered_map<const catalog::TypeDescriptor*, std::vector<ColumnIndexes>> indexes_;
};

}  // namespace quarry::index
