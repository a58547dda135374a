#include <quarry/repl/repl.hpp>

#include "sample_data.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using quarry::repl::execute_script;
using quarry::repl::format_table;
using quarry::repl::split_statements;

namespace {

auto sample_engine() -> std::unique_ptr<quarry::Engine> {
    auto engine = std::make_unique<quarry::Engine>();
    auto status = quarry::sample::load_sample_data(*engine);
    REQUIRE(status.has_value());
    return engine;
}

auto read_script(const char* name) -> std::string {
    std::filesystem::path script_path =
        std::filesystem::path(QUARRY_SOURCE_DIR) / "tests" / "data" / name;
    std::ifstream input(script_path);
    REQUIRE(input.good());
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_CASE("Scripts split on top-level semicolons") {
    REQUIRE(split_statements("select 1 from A; select 2 from B") ==
            std::vector<std::string>{"select 1 from A", "select 2 from B"});
    REQUIRE(split_statements("select 1 from A") == std::vector<std::string>{"select 1 from A"});
    REQUIRE(split_statements("").empty());
    REQUIRE(split_statements(" ;; \n ; ").empty());
}

TEST_CASE("Separators inside quotes and comments are ignored") {
    REQUIRE(split_statements("select 'a;b' from A; select \"x;y\".id from B") ==
            std::vector<std::string>{"select 'a;b' from A", "select \"x;y\".id from B"});
    REQUIRE(split_statements("-- one; two\nselect 1 from A;") ==
            std::vector<std::string>{"select 1 from A"});
    REQUIRE(split_statements("select /* ; */ 1 from A") ==
            std::vector<std::string>{"select   1 from A"});
}

TEST_CASE("Results render as a bordered table") {
    quarry::runtime::QueryResult result;
    result.columns = {"id", "name"};
    result.rows.push_back({quarry::Value{std::int32_t{1}}, quarry::Value{std::string("Org1")}});
    result.rows.push_back({quarry::Value{std::int32_t{22}}, quarry::Value{}});

    REQUIRE(format_table(result) ==
            "rows: 2\n"
            "+----+------+\n"
            "| id | name |\n"
            "+----+------+\n"
            "| 1  | Org1 |\n"
            "| 22 | NULL |\n"
            "+----+------+\n");

    SECTION("long results are truncated") {
        auto text = format_table(result, 1);
        REQUIRE(text.starts_with("rows: 2\n"));
        REQUIRE(text.find("| 22 ") == std::string::npos);
        REQUIRE(text.ends_with("... (1 more rows)\n"));
    }

    SECTION("no columns") {
        REQUIRE(format_table(quarry::runtime::QueryResult{}) == "<empty>\n");
    }
}

TEST_CASE("REPL executes a multi-statement script") {
    auto engine = sample_engine();
    REQUIRE(execute_script(read_script("sample_queries.sql"), *engine));
}

TEST_CASE("REPL script stops at the first failing statement") {
    auto engine = sample_engine();
    REQUIRE(execute_script("select id from Person; select id from Nowhere;", *engine) == false);
    REQUIRE(execute_script("select count(*) from Person where id = ?", *engine) == false);
    REQUIRE(execute_script("-- nothing to run\n", *engine));
}
