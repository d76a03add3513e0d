#include <tally/expr/lexer.hpp>

#include <fmt/format.h>

#include <cctype>

namespace tally::expr {

auto tokenize(std::string_view source) -> std::expected<std::vector<Token>, ExprError> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .position = start,
        });
    };

    const auto is_digit = [](char ch) -> bool {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    };
    const auto is_ident_start = [](char ch) -> bool {
        return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    };
    const auto is_ident_cont = [](char ch) -> bool {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    };

    std::size_t i = 0;
    const auto peek = [&](std::size_t offset = 0) -> char {
        if (i + offset >= source.size()) {
            return '\0';
        }
        return source[i + offset];
    };

    while (i < source.size()) {
        const std::size_t start = i;
        const char ch = source[i];

        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            ++i;
            continue;
        }

        if (is_digit(ch)) {
            while (is_digit(peek())) {
                ++i;
            }
            // A fraction needs at least one digit after the dot; "1." leaves the
            // dot to be reported as an unexpected character.
            if (peek() == '.' && is_digit(peek(1))) {
                ++i;
                while (is_digit(peek())) {
                    ++i;
                }
            }
            add_token(TokenKind::Number, start, i - start);
            continue;
        }

        if (ch == '@') {
            ++i;
            while (is_digit(peek())) {
                ++i;
            }
            if (i - start == 1) {
                return std::unexpected(ExprError{
                    .kind = ExprErrorKind::Syntax,
                    .message = fmt::format("invalid order reference at position {}", start),
                    .position = start,
                });
            }
            add_token(TokenKind::OrderRef, start, i - start);
            continue;
        }

        if (is_ident_start(ch)) {
            while (is_ident_cont(peek())) {
                ++i;
            }
            add_token(TokenKind::Identifier, start, i - start);
            continue;
        }

        switch (ch) {
            case '+':
                add_token(TokenKind::Plus, start, 1);
                break;
            case '-':
                add_token(TokenKind::Minus, start, 1);
                break;
            case '*':
                add_token(TokenKind::Star, start, 1);
                break;
            case '/':
                add_token(TokenKind::Slash, start, 1);
                break;
            case '(':
                add_token(TokenKind::LParen, start, 1);
                break;
            case ')':
                add_token(TokenKind::RParen, start, 1);
                break;
            default:
                return std::unexpected(ExprError{
                    .kind = ExprErrorKind::Syntax,
                    .message = fmt::format("unexpected character '{}' at position {}", ch, start),
                    .position = start,
                });
        }
        ++i;
    }

    return tokens;
}

}  // namespace tally::expr
