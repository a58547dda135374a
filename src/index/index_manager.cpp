#include <quarry/index/index_manager.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace quarry::index {

auto KeyRange::equal(Value value) -> KeyRange {
    return KeyRange{
        .lower = Bound{.value = value, .inclusive = true},
        .upper = Bound{.value = std::move(value), .inclusive = true},
    };
}

auto KeyRange::is_point() const -> bool {
    return lower.has_value() && upper.has_value() && lower->inclusive && upper->inclusive &&
           values_equal(lower->value, upper->value);
}

auto KeyRange::contains(const Value& value) const -> bool {
    if (is_null(value)) {
        return false;
    }
    if (lower.has_value()) {
        if (is_null(lower->value)) {
            return false;
        }
        auto cmp = compare(value, lower->value);
        if (cmp < 0 || (cmp == 0 && !lower->inclusive)) {
            return false;
        }
    }
    if (upper.has_value()) {
        if (is_null(upper->value)) {
            return false;
        }
        auto cmp = compare(value, upper->value);
        if (cmp > 0 || (cmp == 0 && !upper->inclusive)) {
            return false;
        }
    }
    return true;
}

auto IndexCursor::next() -> const cache::CacheKey* {
    if (ordered_) {
        if (pos_ == last_) {
            return nullptr;
        }
        const auto* key = &pos_->second;
        ++pos_;
        return key;
    }
    if (bucket_ == nullptr || bucket_pos_ >= bucket_->size()) {
        return nullptr;
    }
    return &(*bucket_)[bucket_pos_++];
}

void IndexCursor::restart() noexcept {
    pos_ = first_;
    bucket_pos_ = 0;
}

void PartitionIndex::insert(const Value& value, const cache::CacheKey& key) {
    if (kind_ == catalog::IndexKind::Hash) {
        hashed_[value].push_back(key);
    } else {
        ordered_.emplace(value, key);
    }
    ++size_;
}

void PartitionIndex::remove(const Value& value, const cache::CacheKey& key) {
    const cache::CacheKeyEq key_eq;
    if (kind_ == catalog::IndexKind::Hash) {
        auto it = hashed_.find(value);
        if (it == hashed_.end()) {
            return;
        }
        auto& bucket = it->second;
        auto pos = std::find_if(bucket.begin(), bucket.end(),
                                [&](const cache::CacheKey& k) { return key_eq(k, key); });
        if (pos == bucket.end()) {
            return;
        }
        bucket.erase(pos);
        if (bucket.empty()) {
            hashed_.erase(it);
        }
        --size_;
        return;
    }
    auto [first, last] = ordered_.equal_range(value);
    for (auto it = first; it != last; ++it) {
        if (key_eq(it->second, key)) {
            ordered_.erase(it);
            --size_;
            return;
        }
    }
}

auto PartitionIndex::equality_scan(const Value& value) const -> IndexCursor {
    if (is_null(value)) {
        return IndexCursor{};
    }
    if (kind_ == catalog::IndexKind::Hash) {
        if (auto it = hashed_.find(value); it != hashed_.end()) {
            return IndexCursor(&it->second);
        }
        return IndexCursor{};
    }
    auto [first, last] = ordered_.equal_range(value);
    return IndexCursor(first, last);
}

auto PartitionIndex::range_scan(const KeyRange& range) const -> std::optional<IndexCursor> {
    if (range.is_point()) {
        return equality_scan(range.lower->value);
    }
    if (kind_ == catalog::IndexKind::Hash) {
        return std::nullopt;
    }
    if ((range.lower.has_value() && is_null(range.lower->value)) ||
        (range.upper.has_value() && is_null(range.upper->value))) {
        return IndexCursor{};
    }
    if (range.lower.has_value() && range.upper.has_value()) {
        auto cmp = compare(range.lower->value, range.upper->value);
        if (cmp > 0 || (cmp == 0 && !(range.lower->inclusive && range.upper->inclusive))) {
            return IndexCursor{};
        }
    }

    OrderedMap::const_iterator first;
    if (range.lower.has_value()) {
        first = range.lower->inclusive ? ordered_.lower_bound(range.lower->value)
                                       : ordered_.upper_bound(range.lower->value);
    } else {
        // NULL keys sort first and never satisfy a comparison.
        first = ordered_.upper_bound(Value{});
    }
    OrderedMap::const_iterator last = ordered_.end();
    if (range.upper.has_value()) {
        last = range.upper->inclusive ? ordered_.upper_bound(range.upper->value)
                                      : ordered_.lower_bound(range.upper->value);
    }
    return IndexCursor(first, last);
}

void IndexManager::add_type(const catalog::TypeDescriptor& type, const cache::Cache& cache) {
    std::vector<ColumnIndexes> columns;
    for (const auto& field : type.fields) {
        if (!field.indexed()) {
            continue;
        }
        ColumnIndexes column;
        column.field = field.position;
        column.partitions.reserve(cache.partition_count());
        for (std::size_t p = 0; p < cache.partition_count(); ++p) {
            column.partitions.push_back(std::make_unique<PartitionIndex>(field.index));
        }
        columns.push_back(std::move(column));
    }
    const auto count = columns.size();
    auto& slot = indexes_[&type];
    slot = std::move(columns);

    for (std::size_t p = 0; p < cache.partition_count(); ++p) {
        const auto partition = static_cast<cache::PartitionId>(p);
        cache.read_partition(partition, [&](const cache::PartitionView& view) {
            view.for_each([&](const cache::CacheKey& key, const cache::Object& object) {
                if (catalog::fold_name(object.type_name) == catalog::fold_name(type.name)) {
                    insert(partition, key, object);
                }
            });
        });
    }
    spdlog::debug("index: type '{}' has {} indexed column(s) over {} partition(s)", type.name,
                  count, cache.partition_count());
}

auto IndexManager::indexes_for(const cache::Object& object) const
    -> std::pair<const catalog::TypeDescriptor*, const std::vector<ColumnIndexes>*> {
    const auto* type = catalog_.find_type(object.type_name);
    if (type == nullptr) {
        return {nullptr, nullptr};
    }
    auto it = indexes_.find(type);
    if (it == indexes_.end()) {
        return {type, nullptr};
    }
    return {type, &it->second};
}

void IndexManager::insert(cache::PartitionId partition, const cache::CacheKey& key,
                          const cache::Object& object) {
    auto [type, columns] = indexes_for(object);
    if (columns == nullptr || object.data == nullptr) {
        return;
    }
    for (const auto& column : *columns) {
        if (partition >= column.partitions.size()) {
            continue;
        }
        column.partitions[partition]->insert(type->fields[column.field].get(*object.data), key);
    }
}

void IndexManager::remove(cache::PartitionId partition, const cache::CacheKey& key,
                          const cache::Object& object) {
    auto [type, columns] = indexes_for(object);
    if (columns == nullptr || object.data == nullptr) {
        return;
    }
    for (const auto& column : *columns) {
        if (partition >= column.partitions.size()) {
            continue;
        }
        column.partitions[partition]->remove(type->fields[column.field].get(*object.data), key);
    }
}

void IndexManager::on_put(const std::string& /*cache_name*/, cache::PartitionId partition,
                          const cache::CacheKey& key, const cache::Object* previous,
                          const cache::Object& current) {
    if (previous != nullptr) {
        remove(partition, key, *previous);
    }
    insert(partition, key, current);
}

void IndexManager::on_remove(const std::string& /*cache_name*/, cache::PartitionId partition,
                             const cache::CacheKey& key, const cache::Object& previous) {
    remove(partition, key, previous);
}

auto IndexManager::find(const catalog::TypeDescriptor& type, std::size_t field,
                        cache::PartitionId partition) const -> const PartitionIndex* {
    auto it = indexes_.find(&type);
    if (it == indexes_.end()) {
        return nullptr;
    }
    for (const auto& column : it->second) {
        if (column.field == field && partition < column.partitions.size()) {
            return column.partitions[partition].get();
        }
    }
    return nullptr;
}

auto IndexManager::lookup(const catalog::TypeDescriptor& type, std::size_t field,
                          cache::PartitionId partition, const KeyRange& range) const
    -> std::optional<IndexCursor> {
    const auto* index = find(type, field, partition);
    if (index == nullptr) {
        return std::nullopt;
    }
    return index->range_scan(range);
}

}  // namespace quarry::index
