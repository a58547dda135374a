#include <quarry/parser/lexer.hpp>
#include <quarry/parser/parser.hpp>

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace quarry::parser {

namespace {

class Parser {
   public:
    Parser(std::string_view source, std::vector<Token> tokens)
        : source_(source), tokens_(std::move(tokens)) {}

    auto parse_statement() -> std::expected<SelectStmt, ParseError> {
        if (auto bad = find_error_token(); bad != nullptr) {
            return std::unexpected(
                make_error(*bad, fmt::format("invalid token {}", format_token(*bad))));
        }
        if (!consume(TokenKind::KeywordSelect, "expected 'select'")) {
            return std::unexpected(error_);
        }
        auto stmt = parse_select();
        if (!stmt.has_value()) {
            return std::unexpected(error_);
        }
        match(TokenKind::Semicolon);
        if (!is_at_end()) {
            return std::unexpected(make_error(
                peek(), fmt::format("unexpected {} after statement", format_token(peek()))));
        }
        stmt->param_count = param_count_;
        return std::move(*stmt);
    }

   private:
    auto parse_select() -> std::optional<SelectStmt> {
        SelectStmt stmt;
        do {
            auto item = parse_select_item();
            if (!item.has_value()) {
                return std::nullopt;
            }
            stmt.items.push_back(std::move(*item));
        } while (match(TokenKind::Comma));

        if (!consume(TokenKind::KeywordFrom, "expected 'from' after select list")) {
            return std::nullopt;
        }
        do {
            auto table = parse_table_ref();
            if (!table.has_value()) {
                return std::nullopt;
            }
            stmt.from.push_back(std::move(*table));
        } while (match(TokenKind::Comma));

        if (match(TokenKind::KeywordWhere)) {
            stmt.where = parse_expression();
            if (!stmt.where) {
                return std::nullopt;
            }
        }

        if (match(TokenKind::KeywordGroup)) {
            if (!consume(TokenKind::KeywordBy, "expected 'by' after 'group'")) {
                return std::nullopt;
            }
            do {
                auto key = parse_expression();
                if (!key) {
                    return std::nullopt;
                }
                stmt.group_by.push_back(std::move(key));
            } while (match(TokenKind::Comma));
        }

        if (match(TokenKind::KeywordOrder)) {
            if (!consume(TokenKind::KeywordBy, "expected 'by' after 'order'")) {
                return std::nullopt;
            }
            do {
                auto key = parse_expression();
                if (!key) {
                    return std::nullopt;
                }
                bool ascending = true;
                if (match(TokenKind::KeywordDesc)) {
                    ascending = false;
                } else {
                    match(TokenKind::KeywordAsc);
                }
                stmt.order_by.push_back(OrderItem{.expr = std::move(key), .ascending = ascending});
            } while (match(TokenKind::Comma));
        }

        if (match(TokenKind::KeywordLimit)) {
            auto limit = parse_count("expected row count after 'limit'");
            if (!limit.has_value()) {
                return std::nullopt;
            }
            stmt.limit = *limit;
        }
        if (match(TokenKind::KeywordOffset)) {
            auto offset = parse_count("expected row count after 'offset'");
            if (!offset.has_value()) {
                return std::nullopt;
            }
            stmt.offset = *offset;
        }
        return stmt;
    }

    auto parse_count(std::string_view message) -> std::optional<std::int64_t> {
        if (!consume(TokenKind::IntLiteral, message)) {
            return std::nullopt;
        }
        auto value = parse_int(previous().lexeme);
        if (!value.has_value()) {
            error_ = make_error(previous(), "invalid row count");
            return std::nullopt;
        }
        return value;
    }

    auto parse_select_item() -> std::optional<SelectItem> {
        if (match(TokenKind::Star)) {
            return StarItem{};
        }
        // T.* needs two tokens of lookahead past the identifier.
        if ((check(TokenKind::Identifier) || check(TokenKind::QuotedIdentifier)) &&
            peek_kind(1) == TokenKind::Dot && peek_kind(2) == TokenKind::Star) {
            auto table = consume_name("expected table name");
            advance();
            advance();
            return StarItem{.table = std::move(table)};
        }
        auto expr = parse_expression();
        if (!expr) {
            return std::nullopt;
        }
        std::optional<std::string> alias;
        if (match(TokenKind::KeywordAs)) {
            alias = consume_name("expected alias after 'as'");
            if (!alias.has_value()) {
                return std::nullopt;
            }
        } else if (check(TokenKind::Identifier) || check(TokenKind::QuotedIdentifier)) {
            alias = consume_name("expected alias");
        }
        return ExprItem{.expr = std::move(expr), .alias = std::move(alias)};
    }

    auto parse_table_ref() -> std::optional<TableRef> {
        auto first = consume_name("expected table name");
        if (!first.has_value()) {
            return std::nullopt;
        }
        TableRef ref;
        if (match(TokenKind::Dot)) {
            auto name = consume_name("expected table name after schema");
            if (!name.has_value()) {
                return std::nullopt;
            }
            ref.schema = std::move(first);
            ref.name = std::move(*name);
        } else {
            ref.name = std::move(*first);
        }
        if (match(TokenKind::KeywordAs)) {
            ref.alias = consume_name("expected alias after 'as'");
            if (!ref.alias.has_value()) {
                return std::nullopt;
            }
        } else if (check(TokenKind::Identifier) || check(TokenKind::QuotedIdentifier)) {
            ref.alias = consume_name("expected alias");
        }
        return ref;
    }

    auto parse_expression() -> ExprPtr { return parse_or(); }

    auto parse_or() -> ExprPtr {
        const std::size_t start = current_;
        auto expr = parse_and();
        while (expr && match(TokenKind::KeywordOr)) {
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(BinaryOp::Or, std::move(expr), std::move(right), start);
        }
        return expr;
    }

    auto parse_and() -> ExprPtr {
        const std::size_t start = current_;
        auto expr = parse_not();
        while (expr && match(TokenKind::KeywordAnd)) {
            auto right = parse_not();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(BinaryOp::And, std::move(expr), std::move(right), start);
        }
        return expr;
    }

    auto parse_not() -> ExprPtr {
        const std::size_t start = current_;
        if (match(TokenKind::KeywordNot)) {
            auto expr = parse_not();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Not, std::move(expr), start);
        }
        return parse_comparison();
    }

    auto parse_comparison() -> ExprPtr {
        const std::size_t start = current_;
        auto expr = parse_term();
        if (!expr) {
            return nullptr;
        }
        while (true) {
            std::optional<BinaryOp> op;
            if (match(TokenKind::Eq)) {
                op = BinaryOp::Eq;
            } else if (match(TokenKind::NotEq)) {
                op = BinaryOp::Ne;
            } else if (match(TokenKind::Lt)) {
                op = BinaryOp::Lt;
            } else if (match(TokenKind::Le)) {
                op = BinaryOp::Le;
            } else if (match(TokenKind::Gt)) {
                op = BinaryOp::Gt;
            } else if (match(TokenKind::Ge)) {
                op = BinaryOp::Ge;
            }
            if (!op.has_value()) {
                break;
            }
            auto right = parse_term();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(*op, std::move(expr), std::move(right), start);
        }
        // Postfix: expr is null / expr is not null
        if (match(TokenKind::KeywordIs)) {
            if (match(TokenKind::KeywordNot)) {
                if (!consume(TokenKind::KeywordNull, "expected 'null' after 'is not'")) {
                    return nullptr;
                }
                return make_unary(UnaryOp::IsNotNull, std::move(expr), start);
            }
            if (!consume(TokenKind::KeywordNull, "expected 'null' after 'is'")) {
                return nullptr;
            }
            return make_unary(UnaryOp::IsNull, std::move(expr), start);
        }
        return expr;
    }

    auto parse_term() -> ExprPtr {
        const std::size_t start = current_;
        auto expr = parse_factor();
        while (expr) {
            std::optional<BinaryOp> op;
            if (match(TokenKind::Plus)) {
                op = BinaryOp::Add;
            } else if (match(TokenKind::Minus)) {
                op = BinaryOp::Sub;
            } else if (match(TokenKind::Concat)) {
                op = BinaryOp::Concat;
            }
            if (!op.has_value()) {
                break;
            }
            auto right = parse_factor();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(*op, std::move(expr), std::move(right), start);
        }
        return expr;
    }

    auto parse_factor() -> ExprPtr {
        const std::size_t start = current_;
        auto expr = parse_unary();
        while (expr) {
            std::optional<BinaryOp> op;
            if (match(TokenKind::Star)) {
                op = BinaryOp::Mul;
            } else if (match(TokenKind::Slash)) {
                op = BinaryOp::Div;
            } else if (match(TokenKind::Percent)) {
                op = BinaryOp::Mod;
            }
            if (!op.has_value()) {
                break;
            }
            auto right = parse_unary();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(*op, std::move(expr), std::move(right), start);
        }
        return expr;
    }

    auto parse_unary() -> ExprPtr {
        const std::size_t start = current_;
        if (match(TokenKind::Minus)) {
            // Fold negative numeric literals so they stay usable as index bounds.
            if (check(TokenKind::IntLiteral) || check(TokenKind::FloatLiteral)) {
                auto literal = parse_primary();
                if (!literal) {
                    return nullptr;
                }
                auto& node = std::get<LiteralExpr>(literal->node);
                if (auto* i = std::get_if<std::int64_t>(&node.value)) {
                    *i = -*i;
                } else if (auto* d = std::get_if<double>(&node.value)) {
                    *d = -*d;
                }
                literal->text = text_from(start);
                return literal;
            }
            auto expr = parse_unary();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Negate, std::move(expr), start);
        }
        return parse_primary();
    }

    auto parse_primary() -> ExprPtr {
        const std::size_t start = current_;
        if (check(TokenKind::Identifier) || check(TokenKind::QuotedIdentifier)) {
            const bool quoted = check(TokenKind::QuotedIdentifier);
            auto name = consume_name("expected identifier");
            if (!quoted && match(TokenKind::LParen)) {
                return parse_call(std::move(*name), start);
            }
            if (match(TokenKind::Dot)) {
                auto column = consume_name("expected column name after '.'");
                if (!column.has_value()) {
                    return nullptr;
                }
                return finish(ColumnRefExpr{.table = std::move(name), .column = std::move(*column)},
                              start);
            }
            return finish(ColumnRefExpr{.table = std::nullopt, .column = std::move(*name)}, start);
        }
        if (match(TokenKind::IntLiteral)) {
            auto value = parse_int(previous().lexeme);
            if (!value.has_value()) {
                return fail_expr(previous(), "invalid integer literal");
            }
            return finish(LiteralExpr{.value = *value}, start);
        }
        if (match(TokenKind::FloatLiteral)) {
            auto value = parse_double(previous().lexeme);
            if (!value.has_value()) {
                return fail_expr(previous(), "invalid decimal literal");
            }
            return finish(LiteralExpr{.value = *value}, start);
        }
        if (match(TokenKind::StringLiteral)) {
            return finish(LiteralExpr{.value = unescape_string(previous().lexeme)}, start);
        }
        if (match(TokenKind::KeywordTrue)) {
            return finish(LiteralExpr{.value = true}, start);
        }
        if (match(TokenKind::KeywordFalse)) {
            return finish(LiteralExpr{.value = false}, start);
        }
        if (match(TokenKind::KeywordNull)) {
            return finish(LiteralExpr{.value = NullLiteral{}}, start);
        }
        if (match(TokenKind::Question)) {
            return finish(ParamExpr{.index = param_count_++}, start);
        }
        if (match(TokenKind::LParen)) {
            auto expr = parse_expression();
            if (!expr) {
                return nullptr;
            }
            if (!consume(TokenKind::RParen, "expected ')' after expression")) {
                return nullptr;
            }
            expr->text = text_from(start);
            return expr;
        }
        return fail_expr(peek(), fmt::format("expected expression, found {}", format_token(peek())));
    }

    auto parse_call(std::string callee, std::size_t start) -> ExprPtr {
        CallExpr call{.callee = std::move(callee), .args = {}, .star = false};
        if (match(TokenKind::Star)) {
            call.star = true;
        } else if (!check(TokenKind::RParen)) {
            do {
                auto arg = parse_expression();
                if (!arg) {
                    return nullptr;
                }
                call.args.push_back(std::move(arg));
            } while (match(TokenKind::Comma));
        }
        if (!consume(TokenKind::RParen, "expected ')' after argument list")) {
            return nullptr;
        }
        return finish(std::move(call), start);
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), message);
        return false;
    }

    auto consume_name(std::string_view message) -> std::optional<std::string> {
        if (match(TokenKind::Identifier)) {
            return std::string(previous().lexeme);
        }
        if (match(TokenKind::QuotedIdentifier)) {
            auto text = previous().lexeme;
            return std::string(text.substr(1, text.size() - 2));
        }
        error_ = make_error(peek(), message);
        return std::nullopt;
    }

    auto find_error_token() const -> const Token* {
        for (const auto& token : tokens_) {
            if (token.kind == TokenKind::Error) {
                return &token;
            }
        }
        return nullptr;
    }

    auto check(TokenKind kind) const -> bool {
        if (is_at_end()) {
            return kind == TokenKind::Eof;
        }
        return peek().kind == kind;
    }

    auto peek_kind(std::size_t offset) const -> TokenKind {
        if (current_ + offset >= tokens_.size()) {
            return TokenKind::Eof;
        }
        return tokens_[current_ + offset].kind;
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    /// Source text from token `start` through the last consumed token.
    auto text_from(std::size_t start) const -> std::string {
        if (current_ == 0 || start >= current_) {
            return {};
        }
        const auto& first = tokens_[start];
        const auto& last = previous();
        const auto end = last.offset + last.lexeme.size();
        return std::string(source_.substr(first.offset, end - first.offset));
    }

    template <typename Node>
    auto finish(Node node, std::size_t start) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = std::move(node);
        expr->text = text_from(start);
        return expr;
    }

    auto make_unary(UnaryOp op, ExprPtr expr, std::size_t start) -> ExprPtr {
        return finish(UnaryExpr{.op = op, .expr = std::move(expr)}, start);
    }

    auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right, std::size_t start) -> ExprPtr {
        return finish(
            BinaryExpr{
                .op = op,
                .left = std::move(left),
                .right = std::move(right),
            },
            start);
    }

    auto make_error(const Token& token, std::string_view message) const -> ParseError {
        return ParseError{
            .message = std::string(message),
            .line = token.line,
            .column = token.column,
            .fragment = std::string(source_.substr(token.offset, 24)),
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof || token.lexeme.empty()) {
            return "'<eof>'";
        }
        return fmt::format("'{}'", std::string(token.lexeme));
    }

    auto fail_expr(const Token& token, std::string_view message) -> ExprPtr {
        error_ = make_error(token, message);
        return nullptr;
    }

    static auto parse_int(std::string_view text) -> std::optional<std::int64_t> {
        std::int64_t value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static auto parse_double(std::string_view text) -> std::optional<double> {
        std::string tmp(text);
        char* end = nullptr;
        double value = std::strtod(tmp.c_str(), &end);
        if (end == tmp.c_str()) {
            return std::nullopt;
        }
        return value;
    }

    static auto unescape_string(std::string_view text) -> std::string {
        if (text.size() < 2) {
            return std::string(text);
        }
        std::string result;
        result.reserve(text.size() - 2);
        for (std::size_t idx = 1; idx + 1 < text.size(); ++idx) {
            char ch = text[idx];
            result.push_back(ch);
            if (ch == '\'' && text[idx + 1] == '\'') {
                idx += 1;
            }
        }
        return result;
    }

    std::string_view source_;
    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    std::size_t param_count_ = 0;
    ParseError error_{};
};

}  // namespace

auto ParseError::format() const -> std::string {
    if (fragment.empty()) {
        return fmt::format("{}:{}: {}", line, column, message);
    }
    return fmt::format("{}:{}: {} near \"{}\"", line, column, message, fragment);
}

auto parse(std::string_view source) -> ParseResult {
    Parser parser(source, tokenize(source));
    return parser.parse_statement();
}

}  // namespace quarry::parser
