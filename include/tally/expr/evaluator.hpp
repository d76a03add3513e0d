#pragma once

#include <tally/core/validation.hpp>
#include <tally/expr/ast.hpp>
#include <tally/expr/error.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tally::expr {

/// Values visible to an expression. Ordered references are keyed with their
/// `@` (e.g. "@10").
using EvalContext = std::unordered_map<std::string, double>;

using EvalResult = std::expected<double, ExprError>;

/// Evaluate a parsed expression against `context`.
[[nodiscard]] auto evaluate(const Expr& expr, const EvalContext& context) -> EvalResult;

/// Parse (through the parse cache) and evaluate `source`.
[[nodiscard]] auto evaluate_expression(std::string_view source, const EvalContext& context)
    -> EvalResult;

/// Names referenced by `source` (variables and `@N` references), without
/// duplicates, in order of first appearance.
[[nodiscard]] auto get_dependencies(std::string_view source)
    -> std::expected<std::vector<std::string>, ExprError>;

/// Check that `source` is a non-empty, well-formed expression.
[[nodiscard]] auto validate_expression(std::string_view source) -> ValidationResult;

}  // namespace tally::expr
