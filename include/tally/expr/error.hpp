#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tally::expr {

enum class ExprErrorKind : std::uint8_t {
    Syntax,
    UndefinedVariable,
    UndefinedOrderRef,
    DivisionByZero,
};

/// Error from tokenizing, parsing or evaluating an expression.
///
/// `position` is the 0-based source offset for syntax errors; evaluation
/// errors carry no position.
struct ExprError {
    ExprErrorKind kind = ExprErrorKind::Syntax;
    std::string message;
    std::size_t position = 0;

    [[nodiscard]] auto format() const -> std::string;
};

}  // namespace tally::expr
