#include "sample_data.hpp"

#include <quarry/catalog/catalog.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace quarry::sample {

namespace {

using catalog::field;
using catalog::IndexKind;

constexpr auto kPartitioned = "partitioned";
constexpr auto kReplicated = "replicated";

// Ids are unique across all four types.
constexpr std::int32_t kFirstPerson = kOrganizations;
constexpr std::int32_t kFirstProduct = kFirstPerson + kPersons;
constexpr std::int32_t kFirstPurchase = kFirstProduct + kProducts;

}  // namespace

auto register_sample_types(Engine& engine) -> Status {
    if (auto cache = engine.create_cache(kPartitioned, cache::CacheMode::Partitioned); !cache) {
        return std::unexpected(cache.error());
    }
    if (auto cache = engine.create_cache(kReplicated, cache::CacheMode::Replicated); !cache) {
        return std::unexpected(cache.error());
    }

    auto org = engine.register_type(
        "Organization", kPartitioned,
        {field("id", &Organization::id, IndexKind::Hash), field("name", &Organization::name)},
        {.affinity_column = std::nullopt, .key_column = "id"});
    if (!org) {
        return std::unexpected(org.error());
    }

    auto person = engine.register_type(
        "Person", kPartitioned,
        {field("id", &Person::id, IndexKind::Hash), field("orgId", &Person::orgId, IndexKind::Hash),
         field("firstName", &Person::firstName), field("lastName", &Person::lastName),
         field("salary", &Person::salary, IndexKind::Ordered)},
        {.affinity_column = "orgId", .key_column = "id"});
    if (!person) {
        return std::unexpected(person.error());
    }

    auto product = engine.register_type(
        "Product", kReplicated,
        {field("id", &Product::id, IndexKind::Hash), field("name", &Product::name),
         field("price", &Product::price)},
        {.affinity_column = std::nullopt, .key_column = "id"});
    if (!product) {
        return std::unexpected(product.error());
    }

    auto purchase = engine.register_type(
        "Purchase", kPartitioned,
        {field("id", &Purchase::id), field("productId", &Purchase::productId),
         field("personId", &Purchase::personId, IndexKind::Hash)},
        {.affinity_column = "personId", .key_column = "id"});
    if (!purchase) {
        return std::unexpected(purchase.error());
    }
    return {};
}

auto load_sample_data(Engine& engine) -> Status {
    if (auto status = register_sample_types(engine); !status) {
        return status;
    }

    for (std::int32_t i = 0; i < kOrganizations; ++i) {
        Organization org{.id = i, .name = fmt::format("Org{}", i)};
        auto status = engine.put(kPartitioned, cache::CacheKey{.id = Value{org.id}, .affinity = {}},
                                 cache::make_object("Organization", org));
        if (!status) {
            return status;
        }
    }

    std::vector<Person> persons;
    for (std::int32_t i = 0; i < kPersons; ++i) {
        const auto id = kFirstPerson + i;
        persons.push_back(Person{
            .id = id,
            .orgId = i % kOrganizations,
            .firstName = fmt::format("name{}", id),
            .lastName = fmt::format("lastName{}", id),
            .salary = id * 100.0,
        });
        const auto& person = persons.back();
        auto status = engine.put(kPartitioned,
                                 cache::CacheKey{.id = Value{person.id}, .affinity = Value{person.orgId}},
                                 cache::make_object("Person", person));
        if (!status) {
            return status;
        }
    }

    std::vector<Product> products;
    for (std::int32_t i = 0; i < kProducts; ++i) {
        const auto id = kFirstProduct + i;
        products.push_back(Product{.id = id, .name = fmt::format("Product{}", id), .price = id * 10});
        auto status = engine.put(kReplicated, cache::CacheKey{.id = Value{id}, .affinity = {}},
                                 cache::make_object("Product", products.back()));
        if (!status) {
            return status;
        }
    }

    for (std::int32_t i = 0; i < kPurchases; ++i) {
        Purchase purchase{
            .id = kFirstPurchase + i,
            .productId = products[static_cast<std::size_t>(i % kProducts)].id,
            .personId = persons[static_cast<std::size_t>(i % kPersons)].id,
        };
        auto status = engine.put(kPartitioned,
                                 cache::CacheKey{.id = Value{purchase.id},
                                                 .affinity = Value{purchase.personId}},
                                 cache::make_object("Purchase", purchase));
        if (!status) {
            return status;
        }
    }

    spdlog::debug("loaded sample data: {} organizations, {} persons, {} products, {} purchases",
                  kOrganizations, kPersons, kProducts, kPurchases);
    return {};
}

}  // namespace quarry::sample
