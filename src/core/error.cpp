#include <quarry/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace quarry {

auto error_code_name(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::Parse:
            return "ParseError";
        case ErrorCode::UnresolvedTable:
            return "UnresolvedTableError";
        case ErrorCode::UnresolvedColumn:
            return "UnresolvedColumnError";
        case ErrorCode::UnknownColumn:
            return "UnknownColumnError";
        case ErrorCode::DuplicateType:
            return "DuplicateTypeError";
        case ErrorCode::InvalidField:
            return "InvalidFieldError";
        case ErrorCode::InvalidQuery:
            return "InvalidQueryError";
        case ErrorCode::InvalidArgument:
            return "InvalidArgumentError";
        case ErrorCode::Execution:
            return "ExecutionError";
        case ErrorCode::PartitionUnavailable:
            return "PartitionUnavailableError";
        case ErrorCode::PartialResult:
            return "PartialResultError";
        case ErrorCode::QueryTimeout:
            return "QueryTimeoutError";
        case ErrorCode::Codec:
            return "CodecError";
    }
    return "Error";
}

auto Error::format() const -> std::string {
    if (context.empty()) {
        return fmt::format("{}: {}", error_code_name(code), message);
    }
    return fmt::format("{}: {} [{}]", error_code_name(code), message, context);
}

auto make_error(ErrorCode code, std::string message, std::string context) -> Error {
    return Error{
        .code = code,
        .message = std::move(message),
        .context = std::move(context),
    };
}

}  // namespace quarry
