#pragma once
// Sample dataset shared by the shell and the tests.
//
//   partitioned: Organization (key id), Person (affinity orgId),
//                Purchase (affinity personId)
//   replicated:  Product (key id)

#include <quarry/core/error.hpp>
#include <quarry/engine.hpp>

#include <cstdint>
#include <string>

namespace quarry::sample {

struct Organization {
    std::int32_t id = 0;
    std::string name;
};

struct Person {
    std::int32_t id = 0;
    std::int32_t orgId = 0;
    std::string firstName;
    std::string lastName;
    double salary = 0.0;
};

struct Product {
    std::int32_t id = 0;
    std::string name;
    std::int32_t price = 0;
};

struct Purchase {
    std::int32_t id = 0;
    std::int32_t productId = 0;
    std::int32_t personId = 0;
};

inline constexpr std::int32_t kOrganizations = 3;
inline constexpr std::int32_t kPersons = 5;
inline constexpr std::int32_t kProducts = 10;
inline constexpr std::int32_t kPurchases = 20;

/// Create the "partitioned" and "replicated" caches and register the four types.
auto register_sample_types(Engine& engine) -> Status;

/// Register the types and load the sample rows.
auto load_sample_data(Engine& engine) -> Status;

}  // namespace quarry::sample
