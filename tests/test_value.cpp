#include <quarry/core/error.hpp>
#include <quarry/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <compare>
#include <cstdint>
#include <limits>
#include <set>
#include <string>

using namespace quarry;

TEST_CASE("Value kinds follow the variant alternative") {
    REQUIRE(kind_of(Value{}) == ValueKind::Null);
    REQUIRE(kind_of(Value{true}) == ValueKind::Bool);
    REQUIRE(kind_of(Value{std::int32_t{1}}) == ValueKind::Int);
    REQUIRE(kind_of(Value{std::int64_t{1}}) == ValueKind::BigInt);
    REQUIRE(kind_of(Value{1.5}) == ValueKind::Double);
    REQUIRE(kind_of(Value{std::string{"x"}}) == ValueKind::String);
}

TEST_CASE("Numeric values compare across widths") {
    REQUIRE(values_equal(Value{std::int32_t{7}}, Value{std::int64_t{7}}));
    REQUIRE(values_equal(Value{std::int32_t{7}}, Value{7.0}));
    REQUIRE(std::is_lt(compare(Value{std::int32_t{2}}, Value{2.5})));
    REQUIRE(std::is_gt(compare(Value{std::int64_t{-3}}, Value{std::int32_t{-4}})));
}

TEST_CASE("Equal numerics hash equal") {
    REQUIRE(hash_value(Value{std::int32_t{42}}) == hash_value(Value{std::int64_t{42}}));
    REQUIRE(hash_value(Value{std::int32_t{42}}) == hash_value(Value{42.0}));

    const RowHash row_hash;
    const RowEq row_eq;
    const Row lhs{Value{std::int32_t{1}}, Value{std::string{"a"}}};
    const Row rhs{Value{std::int64_t{1}}, Value{std::string{"a"}}};
    REQUIRE(row_eq(lhs, rhs));
    REQUIRE(row_hash(lhs) == row_hash(rhs));
}

TEST_CASE("NaN equals only itself and sorts after every number") {
    const Value nan{std::numeric_limits<double>::quiet_NaN()};
    const Value other_nan{-std::numeric_limits<double>::quiet_NaN()};
    REQUIRE(std::is_eq(compare(nan, other_nan)));
    REQUIRE(hash_value(nan) == hash_value(other_nan));

    REQUIRE(std::is_gt(compare(nan, Value{std::numeric_limits<double>::infinity()})));
    REQUIRE(std::is_gt(compare(nan, Value{std::numeric_limits<std::int64_t>::max()})));
    REQUIRE(std::is_lt(compare(Value{500.0}, nan)));
    REQUIRE(std::is_lt(compare(Value{std::int32_t{500}}, nan)));
    REQUIRE_FALSE(values_equal(nan, Value{500.0}));
    REQUIRE(std::is_lt(compare(nan, Value{std::string{""}})));

    std::multiset<Value, ValueLess> ordered{Value{2.0}, nan, Value{std::int32_t{1}}, Value{3.5}};
    REQUIRE(values_equal(*ordered.rbegin(), nan));
    REQUIRE(ordered.count(Value{std::int64_t{2}}) == 1);
    REQUIRE(ordered.count(nan) == 1);
}

TEST_CASE("BIGINT and DOUBLE compare exactly above 2^53") {
    constexpr std::int64_t kTwo53 = std::int64_t{1} << 53;
    const Value big_double{static_cast<double>(kTwo53)};
    const Value above{kTwo53 + 1};
    const Value at{kTwo53};

    REQUIRE(std::is_gt(compare(above, big_double)));
    REQUIRE(std::is_lt(compare(big_double, above)));
    REQUIRE(std::is_eq(compare(at, big_double)));
    REQUIRE(hash_value(at) == hash_value(big_double));

    // Transitive: at == big_double and above > big_double, so above > at.
    REQUIRE(std::is_gt(compare(above, at)));

    REQUIRE(std::is_lt(compare(Value{std::numeric_limits<std::int64_t>::max()}, Value{0x1p63})));
    REQUIRE(std::is_eq(compare(Value{std::numeric_limits<std::int64_t>::min()}, Value{-0x1p63})));
    REQUIRE(std::is_gt(compare(Value{std::numeric_limits<std::int64_t>::min()}, Value{-0x1p64})));
    REQUIRE(std::is_lt(compare(Value{std::int64_t{-3}}, Value{-2.5})));
    REQUIRE(std::is_gt(compare(Value{std::int64_t{-2}}, Value{-2.5})));
    REQUIRE(std::is_eq(compare(Value{std::int32_t{0}}, Value{-0.0})));
    REQUIRE(hash_value(Value{std::int32_t{0}}) == hash_value(Value{-0.0}));
}

TEST_CASE("Values order NULL, BOOLEAN, numeric, VARCHAR") {
    REQUIRE(std::is_lt(compare(Value{}, Value{false})));
    REQUIRE(std::is_lt(compare(Value{true}, Value{std::int32_t{-100}})));
    REQUIRE(std::is_lt(compare(Value{1e9}, Value{std::string{""}})));
    REQUIRE(std::is_lt(compare(Value{std::string{"abc"}}, Value{std::string{"abd"}})));
    REQUIRE(std::is_eq(compare(Value{}, Value{})));
}

TEST_CASE("format_value renders SQL-style text") {
    REQUIRE(format_value(Value{}) == "NULL");
    REQUIRE(format_value(Value{true}) == "TRUE");
    REQUIRE(format_value(Value{std::int32_t{12}}) == "12");
    REQUIRE(format_value(Value{550.0}) == "550.0");
    REQUIRE(format_value(Value{2.25}) == "2.25");
    REQUIRE(format_value(Value{std::string{"Org1"}}) == "Org1");
}

TEST_CASE("coerce converts only losslessly") {
    auto narrowed = coerce(Value{std::int64_t{5}}, ValueKind::Int);
    REQUIRE(narrowed.has_value());
    REQUIRE(kind_of(*narrowed) == ValueKind::Int);

    REQUIRE_FALSE(coerce(Value{std::int64_t{5'000'000'000}}, ValueKind::Int).has_value());
    REQUIRE_FALSE(coerce(Value{std::string{"5"}}, ValueKind::Int).has_value());

    auto widened = value_as<double>(Value{std::int32_t{3}});
    REQUIRE(widened.has_value());
    REQUIRE(*widened == 3.0);

    REQUIRE(is_null(*coerce(Value{}, ValueKind::String)));
}

TEST_CASE("Errors format with code name and context") {
    auto error = make_error(ErrorCode::UnresolvedTable, "table 'Nope' not found", "Nope");
    REQUIRE(error.format() == "UnresolvedTableError: table 'Nope' not found [Nope]");

    auto bare = make_error(ErrorCode::Execution, "division by zero");
    REQUIRE(bare.format() == "ExecutionError: division by zero");
}

TEST_CASE("Only an unavailable partition is transient") {
    REQUIRE(is_transient(ErrorCode::PartitionUnavailable));
    REQUIRE_FALSE(is_transient(ErrorCode::Execution));
    REQUIRE_FALSE(is_transient(ErrorCode::QueryTimeout));
    REQUIRE_FALSE(is_transient(ErrorCode::PartialResult));
}
