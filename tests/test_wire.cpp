#include <quarry/runtime/wire.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace {

using namespace quarry;
using namespace quarry::runtime;

void require_same_row(const Row& actual, const Row& expected) {
    REQUIRE(actual.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(kind_of(actual[i]) == kind_of(expected[i]));
        REQUIRE(values_equal(actual[i], expected[i]));
    }
}

auto sample_request() -> SubRequest {
    return SubRequest{
        .sql = "select name from Organization where id = ?",
        .args = {Value{std::int64_t{2}}},
        .partition = 3,
        .fragment = FragmentKind::Main,
        .fragment_table = 0,
        .broadcast = {{},
                      {Row{Value{std::int32_t{7}}, Value{std::string("x'y")}, Value{}},
                       Row{Value{true}, Value{2.5}, Value{std::int64_t{-9}}}}},
    };
}

auto require_codec_error(const Result<SubRequest>& decoded) -> Error {
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code == ErrorCode::Codec);
    return decoded.error();
}

}  // namespace

TEST_CASE("Request survives the wire codec") {
    const auto request = sample_request();
    const auto bytes = encode_request(request);
    REQUIRE(bytes.has_value());
    auto decoded = decode_request(*bytes);
    REQUIRE(decoded.has_value());

    REQUIRE(decoded->sql == request.sql);
    require_same_row(decoded->args, request.args);
    REQUIRE(decoded->partition == 3);
    REQUIRE(decoded->fragment == FragmentKind::Main);
    REQUIRE(decoded->broadcast.size() == 2);
    REQUIRE(decoded->broadcast[0].empty());
    REQUIRE(decoded->broadcast[1].size() == 2);
    require_same_row(decoded->broadcast[1][0], request.broadcast[1][0]);
    require_same_row(decoded->broadcast[1][1], request.broadcast[1][1]);
}

TEST_CASE("Broadcast fragment keeps its table") {
    SubRequest request{
        .sql = "select * from Person",
        .args = {},
        .partition = 1,
        .fragment = FragmentKind::Broadcast,
        .fragment_table = 2,
        .broadcast = {},
    };
    auto decoded = decode_request(encode_request(request).value());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->fragment == FragmentKind::Broadcast);
    REQUIRE(decoded->fragment_table == 2);
    REQUIRE(decoded->args.empty());
}

TEST_CASE("Response rows and partial groups survive the wire codec") {
    SubResponse response;
    response.rows.push_back(Row{Value{std::string("Org1")}, Value{550.0}});
    response.groups.push_back(GroupPartial{
        .key = Row{Value{std::int32_t{1}}},
        .states = {AggState{.count = 2,
                            .sum = Value{1100.0},
                            .min = Value{400.0},
                            .max = Value{700.0}},
                   AggState{}},
    });

    auto decoded = decode_response(encode_response(response).value());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->rows.size() == 1);
    require_same_row(decoded->rows[0], response.rows[0]);
    REQUIRE(decoded->groups.size() == 1);

    const auto& group = decoded->groups[0];
    require_same_row(group.key, response.groups[0].key);
    REQUIRE(group.states.size() == 2);
    REQUIRE(group.states[0].count == 2);
    REQUIRE(values_equal(group.states[0].sum, Value{1100.0}));
    REQUIRE(values_equal(group.states[0].min, Value{400.0}));
    REQUIRE(values_equal(group.states[0].max, Value{700.0}));
    REQUIRE(group.states[1].count == 0);
    REQUIRE(is_null(group.states[1].sum));
}

TEST_CASE("Failed sub-request decodes into the same error") {
    const Result<SubResponse> failed = std::unexpected(
        make_error(ErrorCode::PartitionUnavailable, "node went away", "partition 2"));
    auto decoded = decode_response(encode_response(failed).value());
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code == ErrorCode::PartitionUnavailable);
    REQUIRE(decoded.error().message == "node went away");
    REQUIRE(decoded.error().context == "partition 2");
}

TEST_CASE("Malformed messages are rejected") {
    auto bytes = encode_request(sample_request()).value();

    SECTION("bad magic") {
        bytes[0] ^= 0xff;
        require_codec_error(decode_request(bytes));
    }

    SECTION("unsupported version") {
        bytes[4] = 0x7f;
        auto error = require_codec_error(decode_request(bytes));
        REQUIRE(error.message.find("version") != std::string::npos);
    }

    SECTION("wrong message kind") {
        auto decoded = decode_response(bytes);
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error().code == ErrorCode::Codec);
    }

    SECTION("truncated") {
        bytes.resize(bytes.size() - 3);
        require_codec_error(decode_request(bytes));
    }

    SECTION("trailing bytes") {
        bytes.push_back(0);
        auto error = require_codec_error(decode_request(bytes));
        REQUIRE(error.message.find("trailing") != std::string::npos);
    }

    SECTION("empty buffer") {
        require_codec_error(decode_request({}));
    }
}

TEST_CASE("Lengths beyond a u32 prefix are rejected") {
    constexpr std::size_t kMaxPrefix = std::numeric_limits<std::uint32_t>::max();
    REQUIRE(wire_length(0).value() == 0);
    REQUIRE(wire_length(kMaxPrefix).value() == std::numeric_limits<std::uint32_t>::max());

    auto oversized = wire_length(kMaxPrefix + 1);
    REQUIRE_FALSE(oversized.has_value());
    REQUIRE(oversized.error().code == ErrorCode::Codec);
    REQUIRE(oversized.error().message.find("u32") != std::string::npos);
}
