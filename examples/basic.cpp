#include <quarry/quarry.hpp>
#include <quarry/repl/repl.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>

namespace {

struct Sensor {
    std::int32_t id = 0;
    std::int32_t site = 0;
    std::string label;
    double reading = 0.0;
};

}  // namespace

auto main() -> int {
    quarry::Engine engine;

    // A partitioned cache with sensors placed by site
    if (auto cache = engine.create_cache("sensors", quarry::cache::CacheMode::Partitioned, 4);
        !cache) {
        fmt::print("error: {}\n", cache.error().format());
        return 1;
    }
    auto type = engine.register_type(
        "Sensor", "sensors",
        {quarry::catalog::field("id", &Sensor::id),
         quarry::catalog::field("site", &Sensor::site, quarry::catalog::IndexKind::Hash),
         quarry::catalog::field("label", &Sensor::label),
         quarry::catalog::field("reading", &Sensor::reading, quarry::catalog::IndexKind::Ordered)},
        {.affinity_column = "site", .key_column = "id"});
    if (!type) {
        fmt::print("error: {}\n", type.error().format());
        return 1;
    }

    fmt::print("=== Loading ===\n");
    for (std::int32_t i = 0; i < 12; ++i) {
        Sensor sensor{.id = i, .site = i % 3, .label = fmt::format("s{}", i), .reading = i * 1.5};
        auto status = engine.put(
            "sensors",
            quarry::cache::CacheKey{.id = quarry::Value{sensor.id},
                                    .affinity = quarry::Value{sensor.site}},
            quarry::cache::make_object("Sensor", sensor));
        if (!status) {
            fmt::print("error: {}\n", status.error().format());
            return 1;
        }
    }
    fmt::print("stored 12 sensors over {} partitions\n",
               engine.find_cache("sensors")->partition_count());

    // Routed to the single partition that owns site 1
    const char* by_site = "select label, reading from Sensor where site = ? order by reading desc";
    fmt::print("\n=== Plan ===\n");
    if (auto text = engine.explain(by_site)) {
        fmt::print("{}", *text);
    }

    fmt::print("\n=== Query ===\n");
    auto rows = engine.execute(by_site, {quarry::Value{std::int64_t{1}}});
    if (!rows) {
        fmt::print("error: {}\n", rows.error().format());
        return 1;
    }
    fmt::print("{}", quarry::repl::format_table(*rows));

    auto totals = engine.execute(
        "select site, count(*), avg(reading) from Sensor group by site order by site");
    if (!totals) {
        fmt::print("error: {}\n", totals.error().format());
        return 1;
    }
    fmt::print("{}", quarry::repl::format_table(*totals));
    return 0;
}
