#pragma once

#include <quarry/core/error.hpp>
#include <quarry/runtime/partition_executor.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace quarry::runtime {

/// "QRY1" in little-endian byte order.
inline constexpr std::uint32_t kWireMagic = 0x31595251;
inline constexpr std::uint16_t kWireVersion = 1;

using Bytes = std::vector<std::uint8_t>;

/// Checks that a string or list size fits its u32 length prefix.
[[nodiscard]] auto wire_length(std::size_t size) -> Result<std::uint32_t>;

/// Encode a sub-request: header {u32 magic, u16 version, u8 message kind},
/// then the request body. Integers are little-endian, strings and lists are
/// u32-length-prefixed, values are a tag byte followed by their payload.
/// Fails with a Codec error when a string or list is too long for its prefix.
[[nodiscard]] auto encode_request(const SubRequest& request) -> Result<Bytes>;
[[nodiscard]] auto decode_request(std::span<const std::uint8_t> bytes) -> Result<SubRequest>;

/// Encode a response. A failed sub-request travels as {code, message, context}
/// and decodes back into the same error.
[[nodiscard]] auto encode_response(const Result<SubResponse>& response) -> Result<Bytes>;
[[nodiscard]] auto decode_response(std::span<const std::uint8_t> bytes) -> Result<SubResponse>;

}  // namespace quarry::runtime
