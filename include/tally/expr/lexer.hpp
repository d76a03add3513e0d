#pragma once

#include <tally/expr/error.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

namespace tally::expr {

/// Token types of the report expression language.
enum class TokenKind : std::uint8_t {
    Number,      // 12, 3.5
    Identifier,  // revenue, cost_of_sales
    OrderRef,    // @10

    Plus,    // +
    Minus,   // -
    Star,    // *
    Slash,   // /
    LParen,  // (
    RParen,  // )
};

/// A single token. `lexeme` points into the tokenized source.
struct Token {
    TokenKind kind = TokenKind::Number;
    std::string_view lexeme;
    std::size_t position = 0;
};

/// Tokenize an expression. Fails on the first character that starts no token.
[[nodiscard]] auto tokenize(std::string_view source) -> std::expected<std::vector<Token>, ExprError>;

}  // namespace tally::expr
