#include <quarry/parser/lexer.hpp>

#include <cctype>
#include <string>
#include <unordered_map>

namespace quarry::parser {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length,
                               std::size_t line, std::size_t column) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .line = line,
            .column = column,
            .offset = start,
        });
    };

    const std::unordered_map<std::string, TokenKind> keywords = {
        {"select", TokenKind::KeywordSelect}, {"from", TokenKind::KeywordFrom},
        {"where", TokenKind::KeywordWhere},   {"group", TokenKind::KeywordGroup},
        {"order", TokenKind::KeywordOrder},   {"by", TokenKind::KeywordBy},
        {"asc", TokenKind::KeywordAsc},       {"desc", TokenKind::KeywordDesc},
        {"limit", TokenKind::KeywordLimit},   {"offset", TokenKind::KeywordOffset},
        {"as", TokenKind::KeywordAs},         {"and", TokenKind::KeywordAnd},
        {"or", TokenKind::KeywordOr},         {"not", TokenKind::KeywordNot},
        {"is", TokenKind::KeywordIs},         {"null", TokenKind::KeywordNull},
        {"true", TokenKind::KeywordTrue},     {"false", TokenKind::KeywordFalse},
    };

    const auto is_ident_start = [](unsigned char ch) -> bool {
        return std::isalpha(ch) != 0 || ch == '_';
    };

    const auto is_ident_cont = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_' || ch == '$';
    };

    std::size_t i = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };
    const auto peek = [&](std::size_t offset = 0) -> char {
        if (i + offset >= source.size()) {
            return '\0';
        }
        return source[i + offset];
    };
    const auto advance = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        char ch = source[i++];
        if (ch == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        return ch;
    };

    const auto match = [&](char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        advance();
        return true;
    };

    const auto skip_whitespace_and_comments = [&]() {
        while (!at_end()) {
            char ch = peek();
            if (ch == ' ' || ch == '\r' || ch == '\t' || ch == '\n') {
                advance();
                continue;
            }
            if (ch == '-' && peek(1) == '-') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                continue;
            }
            if (ch == '/' && peek(1) == '*') {
                advance();
                advance();
                while (!at_end()) {
                    if (peek() == '*' && peek(1) == '/') {
                        advance();
                        advance();
                        break;
                    }
                    advance();
                }
                continue;
            }
            break;
        }
    };

    while (!at_end()) {
        skip_whitespace_and_comments();
        if (at_end()) {
            break;
        }

        std::size_t token_start = i;
        std::size_t token_line = line;
        std::size_t token_column = column;
        char ch = advance();

        if (is_ident_start(static_cast<unsigned char>(ch))) {
            while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                advance();
            }
            std::string_view text = source.substr(token_start, i - token_start);
            std::string folded;
            folded.reserve(text.size());
            for (char c : text) {
                folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            if (auto it = keywords.find(folded); it != keywords.end()) {
                add_token(it->second, token_start, i - token_start, token_line, token_column);
                continue;
            }
            add_token(TokenKind::Identifier, token_start, i - token_start, token_line,
                      token_column);
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                advance();
            }
            bool is_float = false;
            if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
                is_float = true;
                advance();
                while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                    advance();
                }
            }
            if (peek() == 'e' || peek() == 'E') {
                is_float = true;
                advance();
                if (peek() == '+' || peek() == '-') {
                    advance();
                }
                while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                    advance();
                }
            }
            if (is_ident_start(static_cast<unsigned char>(peek()))) {
                while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                    advance();
                }
                add_token(TokenKind::Error, token_start, i - token_start, token_line, token_column);
                continue;
            }
            add_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, token_start,
                      i - token_start, token_line, token_column);
            continue;
        }

        switch (ch) {
            case '\'': {
                // '' inside a literal is an escaped quote.
                bool closed = false;
                while (!at_end()) {
                    if (peek() == '\'') {
                        if (peek(1) == '\'') {
                            advance();
                            advance();
                            continue;
                        }
                        advance();
                        closed = true;
                        break;
                    }
                    advance();
                }
                add_token(closed ? TokenKind::StringLiteral : TokenKind::Error, token_start,
                          i - token_start, token_line, token_column);
                continue;
            }
            case '"': {
                while (!at_end() && peek() != '"') {
                    advance();
                }
                if (at_end()) {
                    add_token(TokenKind::Error, token_start, i - token_start, token_line,
                              token_column);
                    continue;
                }
                advance();
                add_token(TokenKind::QuotedIdentifier, token_start, i - token_start, token_line,
                          token_column);
                continue;
            }
            case '+':
                add_token(TokenKind::Plus, token_start, 1, token_line, token_column);
                continue;
            case '-':
                add_token(TokenKind::Minus, token_start, 1, token_line, token_column);
                continue;
            case '*':
                add_token(TokenKind::Star, token_start, 1, token_line, token_column);
                continue;
            case '/':
                add_token(TokenKind::Slash, token_start, 1, token_line, token_column);
                continue;
            case '%':
                add_token(TokenKind::Percent, token_start, 1, token_line, token_column);
                continue;
            case '|':
                if (match('|')) {
                    add_token(TokenKind::Concat, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '!':
                if (match('=')) {
                    add_token(TokenKind::NotEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '=':
                add_token(TokenKind::Eq, token_start, 1, token_line, token_column);
                continue;
            case '<':
                if (match('=')) {
                    add_token(TokenKind::Le, token_start, 2, token_line, token_column);
                } else if (match('>')) {
                    add_token(TokenKind::NotEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Lt, token_start, 1, token_line, token_column);
                }
                continue;
            case '>':
                if (match('=')) {
                    add_token(TokenKind::Ge, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Gt, token_start, 1, token_line, token_column);
                }
                continue;
            case '(':
                add_token(TokenKind::LParen, token_start, 1, token_line, token_column);
                continue;
            case ')':
                add_token(TokenKind::RParen, token_start, 1, token_line, token_column);
                continue;
            case ',':
                add_token(TokenKind::Comma, token_start, 1, token_line, token_column);
                continue;
            case '.':
                add_token(TokenKind::Dot, token_start, 1, token_line, token_column);
                continue;
            case ';':
                add_token(TokenKind::Semicolon, token_start, 1, token_line, token_column);
                continue;
            case '?':
                add_token(TokenKind::Question, token_start, 1, token_line, token_column);
                continue;
            default:
                add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                continue;
        }
    }

    tokens.push_back(Token{
        .kind = TokenKind::Eof,
        .lexeme = source.substr(source.size(), 0),
        .line = line,
        .column = column,
        .offset = source.size(),
    });
    return tokens;
}

}  // namespace quarry::parser
