#include <quarry/engine.hpp>

#include "sample_data.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <any>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace quarry;
using sample::Person;

struct Fixture {
    Engine engine;

    explicit Fixture(EngineConfig config = {}) : engine(std::move(config)) {
        auto status = sample::load_sample_data(engine);
        REQUIRE(status.has_value());
    }

    auto query(const char* sql, const Row& args = {}) -> runtime::QueryResult {
        auto result = engine.execute(sql, args);
        if (!result.has_value()) {
            FAIL(result.error().format());
        }
        return std::move(result.value());
    }

    auto query_error(const char* sql, const Row& args = {}) -> Error {
        auto result = engine.execute(sql, args);
        REQUIRE_FALSE(result.has_value());
        return result.error();
    }

    auto count(const char* sql) -> std::int64_t {
        auto result = query(sql);
        REQUIRE(result.rows.size() == 1);
        auto value = value_as<std::int64_t>(result.rows[0][0]);
        REQUIRE(value.has_value());
        return *value;
    }
};

auto column(const runtime::QueryResult& result, std::size_t index) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& row : result.rows) {
        out.push_back(format_value(row[index]));
    }
    return out;
}

auto person(std::int32_t id, std::int32_t org, double salary) -> Person {
    return Person{
        .id = id,
        .orgId = org,
        .firstName = "First" + std::to_string(id),
        .lastName = "Last" + std::to_string(id),
        .salary = salary,
    };
}

auto put_person(Engine& engine, const Person& p) -> Status {
    return engine.put("partitioned", cache::CacheKey{.id = Value{p.id}, .affinity = Value{p.orgId}},
                      cache::make_object("Person", p));
}

}  // namespace

TEST_CASE("Sample data is queryable") {
    Fixture fx;
    REQUIRE(fx.count("select count(*) from Organization") == sample::kOrganizations);
    REQUIRE(fx.count("select count(*) from Person") == sample::kPersons);
    REQUIRE(fx.count("select count(*) from Product") == sample::kProducts);
    REQUIRE(fx.count("select count(*) from Purchase") == sample::kPurchases);
}

TEST_CASE("Registering a type twice fails") {
    Fixture fx;
    auto again = fx.engine.register_type(
        "person", "partitioned",
        {catalog::field("id", &Person::id)},
        {.affinity_column = std::nullopt, .key_column = "id"});
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ErrorCode::DuplicateType);
}

TEST_CASE("Parameterized co-located join averages one organization") {
    Fixture fx;
    auto result = fx.query(
        "select avg(Person.salary) from Person, Organization "
        "where Person.orgId = Organization.id and lower(Organization.name) = lower(?)",
        Row{Value{std::string("ORG1")}});
    REQUIRE(result.rows.size() == 1);
    REQUIRE(kind_of(result.rows[0][0]) == ValueKind::Double);
    REQUIRE(values_equal(result.rows[0][0], Value{550.0}));
}

TEST_CASE("Group by returns one row per group") {
    Fixture fx;
    auto result = fx.query(
        "select orgId, count(*) as people, max(salary) from Person group by orgId order by orgId");
    REQUIRE(result.columns == std::vector<std::string>{"orgId", "people", "max(salary)"});
    REQUIRE(column(result, 0) == std::vector<std::string>{"0", "1", "2"});
    REQUIRE(column(result, 1) == std::vector<std::string>{"2", "2", "1"});
    REQUIRE(column(result, 2) == std::vector<std::string>{"600.0", "700.0", "500.0"});
}

TEST_CASE("Order by sorts across partitions") {
    Fixture fx;
    const char* sql = "select firstName, lastName from Person order by lastName, firstName";
    auto result = fx.query(sql);
    REQUIRE(column(result, 1) == std::vector<std::string>{"lastName3", "lastName4", "lastName5",
                                                          "lastName6", "lastName7"});

    SECTION("repeated execution returns the same rows") {
        auto again = fx.query(sql);
        REQUIRE(column(again, 0) == column(result, 0));
        REQUIRE(column(again, 1) == column(result, 1));
    }

    SECTION("descending") {
        auto desc = fx.query("select id from Person order by salary desc");
        REQUIRE(column(desc, 0) == std::vector<std::string>{"7", "6", "5", "4", "3"});
    }
}

TEST_CASE("Limit and offset apply after the merge") {
    Fixture fx;
    REQUIRE(column(fx.query("select id from Person order by id limit 2 offset 1"), 0) ==
            std::vector<std::string>{"4", "5"});
    REQUIRE(column(fx.query("select id from Person order by id limit 10 offset 3"), 0) ==
            std::vector<std::string>{"6", "7"});
    REQUIRE(fx.query("select id from Person order by id offset 9").rows.empty());
    REQUIRE(fx.query("select id from Person limit 0").rows.empty());
}

TEST_CASE("Limit near the BIGINT maximum keeps every row past the offset") {
    Fixture fx;
    REQUIRE(column(fx.query("select id from Person order by id "
                            "limit 9223372036854775807 offset 1"),
                   0) == std::vector<std::string>{"4", "5", "6", "7"});
    REQUIRE(fx.query("select id from Person limit 9223372036854775807 offset 9223372036854775807")
                .rows.empty());
}

TEST_CASE("Projections pair columns from the same entry") {
    Fixture fx;
    auto result = fx.query("select id, name from Organization");
    REQUIRE(result.columns == std::vector<std::string>{"id", "name"});
    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& row : result.rows) {
        pairs.emplace_back(format_value(row[0]), format_value(row[1]));
    }
    std::ranges::sort(pairs);
    REQUIRE(pairs == std::vector<std::pair<std::string, std::string>>{
                         {"0", "Org0"}, {"1", "Org1"}, {"2", "Org2"}});
}

TEST_CASE("Always-false filters return no rows") {
    Fixture fx;
    auto result = fx.query("select id, name from Organization where 0 = 1");
    REQUIRE(result.rows.empty());
    REQUIRE(result.columns == std::vector<std::string>{"id", "name"});
    REQUIRE(fx.count("select count(*) from Organization where 0 = 1") == 0);
}

TEST_CASE("Index access returns the same rows as a scan") {
    Fixture fx;
    const auto ranged =
        fx.query("select id from Person where salary >= 400 and salary <= 600 order by id");
    const auto scanned =
        fx.query("select id from Person where salary * 1 >= 400 and salary * 1 <= 600 order by id");
    REQUIRE(column(ranged, 0) == std::vector<std::string>{"4", "5", "6"});
    REQUIRE(column(ranged, 0) == column(scanned, 0));

    const auto hashed = fx.query("select id from Person where orgId = 1 order by id");
    const auto filtered = fx.query("select id from Person where orgId + 0 = 1 order by id");
    REQUIRE(column(hashed, 0) == std::vector<std::string>{"4", "7"});
    REQUIRE(column(hashed, 0) == column(filtered, 0));
}

TEST_CASE("Index access and scans agree on a NaN salary") {
    Fixture fx;
    REQUIRE(put_person(fx.engine, person(100, 1, std::numeric_limits<double>::quiet_NaN()))
                .has_value());

    const auto indexed = fx.query("select id from Person where salary = 500 order by id");
    const auto scanned = fx.query("select id from Person where salary * 1 = 500 order by id");
    REQUIRE(column(indexed, 0) == std::vector<std::string>{"5"});
    REQUIRE(column(indexed, 0) == column(scanned, 0));

    const auto ranged = fx.query("select id from Person where salary >= 400 order by id");
    const auto filtered = fx.query("select id from Person where salary * 1 >= 400 order by id");
    REQUIRE(column(ranged, 0) == column(filtered, 0));

    const auto bounded =
        fx.query("select id from Person where salary >= 400 and salary <= 600 order by id");
    REQUIRE(column(bounded, 0) == std::vector<std::string>{"4", "5", "6"});
}

TEST_CASE("Queries see inserts and removals") {
    Fixture fx;
    for (std::int32_t id = 100; id < 110; ++id) {
        REQUIRE(put_person(fx.engine, person(id, 1, 1000.0)).has_value());
    }
    REQUIRE(fx.count("select count(*) from Person") == sample::kPersons + 10);
    REQUIRE(fx.count("select count(*) from Person where orgId = 1") == 12);

    for (std::int32_t id = 100; id < 103; ++id) {
        auto removed = fx.engine.remove(
            "partitioned", cache::CacheKey{.id = Value{id}, .affinity = Value{std::int32_t{1}}});
        REQUIRE(removed.has_value());
        REQUIRE(*removed);
    }
    REQUIRE(fx.count("select count(*) from Person") == sample::kPersons + 7);
    REQUIRE(fx.count("select count(*) from Person where salary >= 1000") == 7);

    SECTION("replacing an entry keeps the row count") {
        REQUIRE(put_person(fx.engine, person(105, 1, 1.0)).has_value());
        REQUIRE(fx.count("select count(*) from Person where salary >= 1000") == 6);
        REQUIRE(fx.count("select count(*) from Person") == sample::kPersons + 7);
    }

    SECTION("removing a missing key reports false") {
        auto removed = fx.engine.remove(
            "partitioned", cache::CacheKey{.id = Value{std::int32_t{100}},
                                           .affinity = Value{std::int32_t{1}}});
        REQUIRE(removed.has_value());
        REQUIRE_FALSE(*removed);
    }
}

TEST_CASE("Joins across placement strategies") {
    Fixture fx;

    SECTION("co-located") {
        auto result = fx.query(
            "select Person.id, Organization.name from Person, Organization "
            "where Person.orgId = Organization.id order by Person.id");
        REQUIRE(column(result, 1) ==
                std::vector<std::string>{"Org0", "Org1", "Org2", "Org0", "Org1"});
    }

    SECTION("broadcast") {
        auto result = fx.query(
            "select Person.id, Purchase.id from Person, Purchase "
            "where Person.id = Purchase.personId");
        REQUIRE(result.rows.size() == sample::kPurchases);
    }

    SECTION("replicated") {
        auto result = fx.query(
            "select Purchase.id, Product.price from Purchase, \"replicated\".Product "
            "where Purchase.productId = Product.id");
        REQUIRE(result.rows.size() == sample::kPurchases);
    }

    SECTION("broadcast without join keys is a cross product") {
        auto result = fx.query(
            "select Person.id, Purchase.id from Person, Purchase where Person.id = ?",
            Row{Value{std::int64_t{4}}});
        REQUIRE(result.rows.size() == sample::kPurchases);
        for (const auto& row : result.rows) {
            REQUIRE(values_equal(row[0], Value{std::int32_t{4}}));
        }
        auto purchases = column(result, 1);
        std::ranges::sort(purchases);
        REQUIRE(std::ranges::adjacent_find(purchases) == purchases.end());
    }

    SECTION("aggregate over a broadcast join") {
        auto result = fx.query(
            "select Person.id, count(*) from Person, Purchase "
            "where Person.id = Purchase.personId group by Person.id order by Person.id");
        REQUIRE(column(result, 0) == std::vector<std::string>{"3", "4", "5", "6", "7"});
        REQUIRE(column(result, 1) == std::vector<std::string>{"4", "4", "4", "4", "4"});
    }
}

TEST_CASE("Star selects expand per table") {
    Fixture fx;
    auto all = fx.query("select * from Person order by id");
    REQUIRE(all.columns ==
            std::vector<std::string>{"id", "orgId", "firstName", "lastName", "salary"});
    REQUIRE(all.rows.size() == sample::kPersons);

    auto qualified = fx.query(
        "select Organization.* from Person, Organization "
        "where Person.orgId = Organization.id and Person.id = 4");
    REQUIRE(qualified.columns == std::vector<std::string>{"id", "name"});
    REQUIRE(column(qualified, 1) == std::vector<std::string>{"Org1"});
}

TEST_CASE("Query errors carry their code") {
    Fixture fx;
    REQUIRE(fx.query_error("select from Person").code == ErrorCode::Parse);
    REQUIRE(fx.query_error("select id from Nowhere").code == ErrorCode::UnresolvedTable);
    REQUIRE(fx.query_error("select height from Person").code == ErrorCode::UnresolvedColumn);
    REQUIRE(fx.query_error("select id from Person where id = ?").code ==
            ErrorCode::InvalidArgument);
    REQUIRE(fx.query_error("select 1 / 0 from Organization").code == ErrorCode::Execution);
}

TEST_CASE("BIGINT overflow is a query error") {
    Fixture fx;
    for (const auto* sql : {"select (-9223372036854775807 - 1) / -1 from Organization",
                            "select 9223372036854775807 + id from Organization",
                            "select -(-9223372036854775807 - 1) from Organization",
                            "select 4611686018427387904 * 2 from Organization"}) {
        INFO(sql);
        auto error = fx.query_error(sql);
        REQUIRE(error.code == ErrorCode::Execution);
        REQUIRE(error.message == "BIGINT overflow");
    }
    REQUIRE(column(fx.query("select (-9223372036854775807 - 1) % -1 from Organization where id = 0"),
                   0) == std::vector<std::string>{"0"});
}

TEST_CASE("Put validates keys against the registered type") {
    Fixture fx;

    SECTION("placement column must match the key") {
        auto p = person(50, 1, 10.0);
        auto status = fx.engine.put(
            "partitioned", cache::CacheKey{.id = Value{p.id}, .affinity = Value{std::int32_t{2}}},
            cache::make_object("Person", p));
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().code == ErrorCode::InvalidArgument);
        REQUIRE(status.error().context == "orgId");
    }

    SECTION("affinity types need an affinity value") {
        auto p = person(50, 1, 10.0);
        auto status = fx.engine.put("partitioned",
                                    cache::CacheKey{.id = Value{p.id}, .affinity = {}},
                                    cache::make_object("Person", p));
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("unknown cache") {
        auto status = put_person(fx.engine, person(50, 1, 10.0));
        REQUIRE(status.has_value());
        auto missing = fx.engine.put("elsewhere",
                                     cache::CacheKey{.id = Value{std::int32_t{1}}, .affinity = {}},
                                     cache::make_object("Person", person(1, 0, 0.0)));
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("type registered in another cache") {
        sample::Product product{.id = 99, .name = "Stray", .price = 1};
        auto status = fx.engine.put("partitioned",
                                    cache::CacheKey{.id = Value{product.id}, .affinity = {}},
                                    cache::make_object("Product", product));
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("unregistered type") {
        auto status = fx.engine.put("partitioned",
                                    cache::CacheKey{.id = Value{std::int32_t{1}}, .affinity = {}},
                                    cache::make_object("Invoice", std::string("x")));
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().context == "Invoice");
    }
}

TEST_CASE("Stored objects can be read back by key") {
    Fixture fx;
    auto found = fx.engine.get("partitioned",
                               cache::CacheKey{.id = Value{std::int32_t{4}},
                                               .affinity = Value{std::int32_t{1}}});
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    REQUIRE(found->value().type_name == "Person");
    const auto* stored = std::any_cast<Person>(found->value().data.get());
    REQUIRE(stored != nullptr);
    REQUIRE(stored->salary == 400.0);

    REQUIRE_FALSE(fx.engine.get("nowhere", cache::CacheKey{}).has_value());
}

TEST_CASE("Wire transport returns the same results as in-process delivery") {
    Fixture local;
    Fixture wired(EngineConfig{.loopback_wire = true});
    const std::vector<const char*> queries = {
        "select firstName, salary from Person order by salary desc",
        "select orgId, count(*), avg(salary) from Person group by orgId order by orgId",
        "select Person.id, Purchase.productId from Person, Purchase "
        "where Person.id = Purchase.personId order by Purchase.id",
        "select name from Organization where id = 2",
    };
    for (const auto* sql : queries) {
        INFO(sql);
        auto expected = local.query(sql);
        auto actual = wired.query(sql);
        REQUIRE(actual.columns == expected.columns);
        REQUIRE(actual.rows.size() == expected.rows.size());
        for (std::size_t c = 0; c < expected.columns.size(); ++c) {
            REQUIRE(column(actual, c) == column(expected, c));
        }
    }
}
