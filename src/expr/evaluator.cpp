#include <tally/expr/evaluator.hpp>
#include <tally/expr/parser.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace tally::expr {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

auto evaluation_error(ExprErrorKind kind, std::string message) -> ExprError {
    return ExprError{.kind = kind, .message = std::move(message), .position = 0};
}

auto lookup(const EvalContext& context, const std::string& name, ExprErrorKind missing_kind,
            std::string_view what) -> EvalResult {
    auto it = context.find(name);
    if (it == context.end()) {
        return std::unexpected(evaluation_error(missing_kind, fmt::format("{}: {}", what, name)));
    }
    return it->second;
}

auto apply_binary(BinaryOp op, double left, double right) -> EvalResult {
    switch (op) {
        case BinaryOp::Add:
            return left + right;
        case BinaryOp::Sub:
            return left - right;
        case BinaryOp::Mul:
            return left * right;
        case BinaryOp::Div:
            if (right == 0.0) {
                return std::unexpected(
                    evaluation_error(ExprErrorKind::DivisionByZero, "division by zero"));
            }
            return left / right;
    }
    return std::unexpected(evaluation_error(ExprErrorKind::Syntax, "unknown binary operator"));
}

void collect_names(const Expr& expr, std::vector<std::string>& names,
                   std::unordered_set<std::string>& seen) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberExpr>) {
                return;
            } else if constexpr (std::is_same_v<T, VariableExpr> ||
                                 std::is_same_v<T, OrderRefExpr>) {
                if (seen.insert(node.name).second) {
                    names.push_back(node.name);
                }
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                collect_names(*node.operand, names, seen);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                collect_names(*node.left, names, seen);
                collect_names(*node.right, names, seen);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled expression node");
            }
        },
        expr.node);
}

}  // namespace

auto evaluate(const Expr& expr, const EvalContext& context) -> EvalResult {
    return std::visit(
        [&](const auto& node) -> EvalResult {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberExpr>) {
                return node.value;
            } else if constexpr (std::is_same_v<T, VariableExpr>) {
                return lookup(context, node.name, ExprErrorKind::UndefinedVariable,
                              "undefined variable");
            } else if constexpr (std::is_same_v<T, OrderRefExpr>) {
                return lookup(context, node.name, ExprErrorKind::UndefinedOrderRef,
                              "undefined order reference");
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                auto operand = evaluate(*node.operand, context);
                if (!operand) {
                    return operand;
                }
                return node.op == UnaryOp::Negate ? -*operand : *operand;
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                auto left = evaluate(*node.left, context);
                if (!left) {
                    return left;
                }
                auto right = evaluate(*node.right, context);
                if (!right) {
                    return right;
                }
                return apply_binary(node.op, *left, *right);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled expression node");
            }
        },
        expr.node);
}

auto evaluate_expression(std::string_view source, const EvalContext& context) -> EvalResult {
    auto ast = parse_cached(source);
    if (!ast) {
        return std::unexpected(ast.error());
    }
    return evaluate(**ast, context);
}

auto get_dependencies(std::string_view source)
    -> std::expected<std::vector<std::string>, ExprError> {
    auto ast = parse_cached(source);
    if (!ast) {
        return std::unexpected(ast.error());
    }
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    collect_names(**ast, names, seen);
    return names;
}

auto validate_expression(std::string_view source) -> ValidationResult {
    ValidationResult result;
    const bool blank = std::ranges::all_of(source, [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    });
    if (blank) {
        result.add_error("expression must be a non-empty string");
        return result;
    }
    auto ast = parse_cached(source);
    if (!ast) {
        result.add_error(ast.error().format());
    }
    return result;
}

}  // namespace tally::expr
