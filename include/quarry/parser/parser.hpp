#pragma once

#include <quarry/parser/ast.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace quarry::parser {

/// Parse error with location information.
struct ParseError {
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;
    /// Source text near the error.
    std::string fragment;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for parse operations.
using ParseResult = std::expected<SelectStmt, ParseError>;

/// Parse a single SELECT statement (an optional trailing ';' is accepted).
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

}  // namespace quarry::parser
