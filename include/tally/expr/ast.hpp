#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace tally::expr {

enum class UnaryOp : std::uint8_t {
    Plus,
    Negate,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct NumberExpr {
    double value = 0.0;
};

/// Bare identifier naming a report variable.
struct VariableExpr {
    std::string name;
};

/// `@N` reference to a line item by its order number. `name` keeps the `@`.
struct OrderRefExpr {
    std::string name;
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Negate;
    ExprPtr operand;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct Expr {
    std::variant<NumberExpr, VariableExpr, OrderRefExpr, UnaryExpr, BinaryExpr> node;
};

}  // namespace tally::expr
