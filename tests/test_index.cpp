#include <quarry/cache/cache.hpp>
#include <quarry/catalog/catalog.hpp>
#include <quarry/index/index_manager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace {

using namespace quarry;
using catalog::field;
using catalog::IndexKind;

struct Reading {
    std::int32_t id = 0;
    std::int32_t sensor = 0;
    double level = 0.0;
    std::int32_t zone = 0;
};

struct Fixture {
    catalog::Catalog cat;
    cache::MemoryCache store{"readings", cache::CacheMode::Partitioned, 1};
    index::IndexManager indexes{cat};
    const catalog::TypeDescriptor* type = nullptr;

    Fixture() {
        auto registered = cat.register_type(
            "Reading", "readings",
            {field("id", &Reading::id), field("sensor", &Reading::sensor, IndexKind::Hash),
             field("level", &Reading::level, IndexKind::Ordered), field("zone", &Reading::zone)});
        REQUIRE(registered.has_value());
        type = *registered;
        store.add_listener(&indexes);
        indexes.add_type(*type, store);
    }

    void put(std::int32_t id, std::int32_t sensor, double level) {
        store.put(cache::CacheKey{.id = Value{id}, .affinity = {}},
                  cache::make_object("Reading", Reading{.id = id, .sensor = sensor, .level = level,
                                                        .zone = 0}));
    }

    auto ids(std::size_t column, const index::KeyRange& range) const
        -> std::optional<std::vector<std::int32_t>> {
        auto cursor = indexes.lookup(*type, column, 0, range);
        if (!cursor.has_value()) {
            return std::nullopt;
        }
        std::vector<std::int32_t> out;
        while (const auto* key = cursor->next()) {
            out.push_back(std::get<std::int32_t>(key->id));
        }
        std::ranges::sort(out);
        return out;
    }
};

constexpr std::size_t kSensor = 1;
constexpr std::size_t kLevel = 2;
constexpr std::size_t kZone = 3;

auto bound(double value, bool inclusive) -> index::Bound {
    return index::Bound{.value = Value{value}, .inclusive = inclusive};
}

}  // namespace

TEST_CASE("Equality lookups return every matching key") {
    Fixture fx;
    fx.put(1, 10, 1.0);
    fx.put(2, 20, 2.0);
    fx.put(3, 10, 3.0);

    REQUIRE(fx.ids(kSensor, index::KeyRange::equal(Value{std::int32_t{10}})) ==
            std::vector<std::int32_t>{1, 3});
    REQUIRE(fx.ids(kSensor, index::KeyRange::equal(Value{std::int64_t{20}})) ==
            std::vector<std::int32_t>{2});
    REQUIRE(fx.ids(kSensor, index::KeyRange::equal(Value{std::int32_t{99}}))->empty());
    REQUIRE(fx.ids(kLevel, index::KeyRange::equal(Value{std::int32_t{2}})) ==
            std::vector<std::int32_t>{2});
}

TEST_CASE("Range bounds honour inclusivity") {
    Fixture fx;
    for (std::int32_t i = 1; i <= 5; ++i) {
        fx.put(i, i, static_cast<double>(i));
    }

    index::KeyRange closed{.lower = bound(2.0, true), .upper = bound(4.0, true)};
    REQUIRE(fx.ids(kLevel, closed) == std::vector<std::int32_t>{2, 3, 4});

    index::KeyRange open{.lower = bound(2.0, false), .upper = bound(4.0, false)};
    REQUIRE(fx.ids(kLevel, open) == std::vector<std::int32_t>{3});

    index::KeyRange lower_only{.lower = bound(4.0, true), .upper = std::nullopt};
    REQUIRE(fx.ids(kLevel, lower_only) == std::vector<std::int32_t>{4, 5});

    index::KeyRange upper_only{.lower = std::nullopt, .upper = bound(2.0, false)};
    REQUIRE(fx.ids(kLevel, upper_only) == std::vector<std::int32_t>{1});

    index::KeyRange inverted{.lower = bound(4.0, true), .upper = bound(2.0, true)};
    REQUIRE(fx.ids(kLevel, inverted)->empty());
}

TEST_CASE("Hash indexes serve equality only and unindexed columns nothing") {
    Fixture fx;
    fx.put(1, 10, 1.0);

    index::KeyRange range{.lower = index::Bound{.value = Value{std::int32_t{5}}, .inclusive = true},
                          .upper = std::nullopt};
    REQUIRE_FALSE(fx.ids(kSensor, range).has_value());
    REQUIRE_FALSE(fx.ids(kZone, index::KeyRange::equal(Value{std::int32_t{0}})).has_value());
}

TEST_CASE("Indexes follow replacements and removals") {
    Fixture fx;
    fx.put(1, 10, 1.0);
    fx.put(2, 10, 2.0);

    fx.put(1, 30, 1.0);
    REQUIRE(fx.ids(kSensor, index::KeyRange::equal(Value{std::int32_t{10}})) ==
            std::vector<std::int32_t>{2});
    REQUIRE(fx.ids(kSensor, index::KeyRange::equal(Value{std::int32_t{30}})) ==
            std::vector<std::int32_t>{1});

    REQUIRE(fx.store.remove(cache::CacheKey{.id = Value{std::int32_t{2}}, .affinity = {}}));
    REQUIRE(fx.ids(kSensor, index::KeyRange::equal(Value{std::int32_t{10}}))->empty());
    REQUIRE(fx.indexes.find(*fx.type, kLevel, 0)->size() == 1);
}

TEST_CASE("Registering a type indexes entries already in the cache") {
    catalog::Catalog cat;
    cache::MemoryCache store{"readings", cache::CacheMode::Partitioned, 2};
    for (std::int32_t i = 0; i < 6; ++i) {
        store.put(cache::CacheKey{.id = Value{i}, .affinity = {}},
                  cache::make_object("Reading", Reading{.id = i, .sensor = i % 2, .level = 0.0,
                                                        .zone = 0}));
    }

    auto type = cat.register_type("Reading", "readings",
                                  {field("id", &Reading::id),
                                   field("sensor", &Reading::sensor, IndexKind::Hash)});
    REQUIRE(type.has_value());
    index::IndexManager indexes{cat};
    indexes.add_type(**type, store);

    std::size_t matches = 0;
    for (cache::PartitionId p = 0; p < 2; ++p) {
        auto cursor = indexes.lookup(**type, 1, p, index::KeyRange::equal(Value{std::int32_t{1}}));
        REQUIRE(cursor.has_value());
        while (cursor->next() != nullptr) {
            ++matches;
        }
    }
    REQUIRE(matches == 3);
}

TEST_CASE("KeyRange never contains NULL") {
    index::KeyRange everything;
    REQUIRE(everything.contains(Value{std::int32_t{1}}));
    REQUIRE_FALSE(everything.contains(Value{}));

    auto point = index::KeyRange::equal(Value{std::int32_t{3}});
    REQUIRE(point.is_point());
    REQUIRE(point.contains(Value{3.0}));
    REQUIRE_FALSE(point.contains(Value{std::int32_t{4}}));
}
