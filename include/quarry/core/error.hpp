#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace quarry {

/// Error taxonomy shared by every layer of the engine.
enum class ErrorCode : std::uint8_t {
    Parse,
    UnresolvedTable,
    UnresolvedColumn,
    UnknownColumn,
    DuplicateType,
    InvalidField,
    InvalidQuery,
    InvalidArgument,
    Execution,
    PartitionUnavailable,
    PartialResult,
    QueryTimeout,
    Codec,
};

/// An error surfaced to the caller. `context` names the offending SQL fragment,
/// table or column when there is one.
struct Error {
    ErrorCode code = ErrorCode::Execution;
    std::string message;
    std::string context;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

using Status = std::expected<void, Error>;

[[nodiscard]] auto error_code_name(ErrorCode code) noexcept -> std::string_view;

[[nodiscard]] auto make_error(ErrorCode code, std::string message, std::string context = {})
    -> Error;

/// Transient errors are worth one retry against the same partition.
[[nodiscard]] inline auto is_transient(ErrorCode code) noexcept -> bool {
    return code == ErrorCode::PartitionUnavailable;
}

}  // namespace quarry
