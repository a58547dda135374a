#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace quarry::parser {

/// Token types for the SQL lexer. Keywords are case-insensitive.
enum class TokenKind : std::uint8_t {
    // Literals
    IntLiteral,
    FloatLiteral,
    StringLiteral,

    // Identifiers
    Identifier,
    QuotedIdentifier,

    // Keywords
    KeywordSelect,
    KeywordFrom,
    KeywordWhere,
    KeywordGroup,
    KeywordOrder,
    KeywordBy,
    KeywordAsc,
    KeywordDesc,
    KeywordLimit,
    KeywordOffset,
    KeywordAs,
    KeywordAnd,
    KeywordOr,
    KeywordNot,
    KeywordIs,
    KeywordNull,
    KeywordTrue,
    KeywordFalse,

    // Comparison operators
    Eq,     // =
    NotEq,  // <> or !=
    Lt,     // <
    Le,     // <=
    Gt,     // >
    Ge,     // >=

    // Arithmetic operators
    Plus,     // +
    Minus,    // -
    Star,     // *
    Slash,    // /
    Percent,  // %
    Concat,   // ||

    // Delimiters
    LParen,     // (
    RParen,     // )
    Comma,      // ,
    Dot,        // .
    Semicolon,  // ;
    Question,   // ?

    // Special
    Eof,
    Error,
};

/// A single token with source location.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t line = 0;
    std::size_t column = 0;
    std::size_t offset = 0;
};

/// Tokenize a SQL string.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace quarry::parser
