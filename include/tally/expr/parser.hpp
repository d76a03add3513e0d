#pragma once

#include <tally/expr/ast.hpp>
#include <tally/expr/error.hpp>
#include <tally/expr/lexer.hpp>

#include <expected>
#include <memory>
#include <span>
#include <string_view>

namespace tally::expr {

/// Result type for parse operations.
using ParseResult = std::expected<ExprPtr, ExprError>;

/// Shared, immutable parse result as held by the parse cache.
using SharedAst = std::shared_ptr<const Expr>;
using CachedParseResult = std::expected<SharedAst, ExprError>;

/// Parse a token stream into an expression tree.
[[nodiscard]] auto parse(std::span<const Token> tokens) -> ParseResult;

/// Tokenize and parse an expression source string.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

/// Parse through the process-wide cache keyed by source text.
///
/// Parsing is a pure function of the text, so entries (failures included)
/// are kept for the lifetime of the process. Safe to call concurrently.
[[nodiscard]] auto parse_cached(std::string_view source) -> CachedParseResult;

/// Number of distinct source strings held by the parse cache.
[[nodiscard]] auto parse_cache_size() -> std::size_t;

}  // namespace tally::expr
