#include <tally/expr/parser.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace tally::expr {

namespace {

// Unary operators and parentheses nest by recursion.
constexpr std::size_t kMaxNesting = 256;

class Parser {
   public:
    explicit Parser(std::span<const Token> tokens) : tokens_(tokens) {
        if (!tokens_.empty()) {
            end_position_ = tokens_.back().position + tokens_.back().lexeme.size();
        }
    }

    auto parse_root() -> ParseResult {
        auto expr = parse_expression();
        if (!expr) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(make_error(
                peek().position, fmt::format("unexpected token {} at position {}",
                                             format_token(peek()), peek().position)));
        }
        return expr;
    }

   private:
    auto parse_expression() -> ExprPtr { return parse_term(); }

    // term := factor (('+' | '-') factor)*
    auto parse_term() -> ExprPtr {
        auto expr = parse_factor();
        if (!expr) {
            return nullptr;
        }
        while (true) {
            BinaryOp op;
            if (match(TokenKind::Plus)) {
                op = BinaryOp::Add;
            } else if (match(TokenKind::Minus)) {
                op = BinaryOp::Sub;
            } else {
                break;
            }
            auto right = parse_factor();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    // factor := unary (('*' | '/') unary)*
    auto parse_factor() -> ExprPtr {
        auto expr = parse_unary();
        if (!expr) {
            return nullptr;
        }
        while (true) {
            BinaryOp op;
            if (match(TokenKind::Star)) {
                op = BinaryOp::Mul;
            } else if (match(TokenKind::Slash)) {
                op = BinaryOp::Div;
            } else {
                break;
            }
            auto right = parse_unary();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_unary() -> ExprPtr {
        if (depth_ >= kMaxNesting) {
            std::size_t position = is_at_end() ? end_position_ : peek().position;
            return fail_expr(position, fmt::format("expression nested too deeply at position {} "
                                                   "(limit {})",
                                                   position, kMaxNesting));
        }
        depth_ += 1;
        auto expr = parse_unary_operand();
        depth_ -= 1;
        return expr;
    }

    auto parse_unary_operand() -> ExprPtr {
        if (match(TokenKind::Minus)) {
            auto operand = parse_unary();
            if (!operand) {
                return nullptr;
            }
            return make_unary(UnaryOp::Negate, std::move(operand));
        }
        if (match(TokenKind::Plus)) {
            auto operand = parse_unary();
            if (!operand) {
                return nullptr;
            }
            return make_unary(UnaryOp::Plus, std::move(operand));
        }
        return parse_primary();
    }

    auto parse_primary() -> ExprPtr {
        if (is_at_end()) {
            return fail_expr(end_position_, fmt::format("unexpected end of expression at position {}",
                                                        end_position_));
        }
        if (match(TokenKind::Number)) {
            auto value = parse_number(previous().lexeme);
            if (!value.has_value()) {
                return fail_expr(previous().position,
                                 fmt::format("invalid number {} at position {}",
                                             format_token(previous()), previous().position));
            }
            auto node = std::make_unique<Expr>();
            node->node = NumberExpr{.value = *value};
            return node;
        }
        if (match(TokenKind::Identifier)) {
            auto node = std::make_unique<Expr>();
            node->node = VariableExpr{.name = std::string(previous().lexeme)};
            return node;
        }
        if (match(TokenKind::OrderRef)) {
            auto node = std::make_unique<Expr>();
            node->node = OrderRefExpr{.name = std::string(previous().lexeme)};
            return node;
        }
        if (match(TokenKind::LParen)) {
            auto inner = parse_expression();
            if (!inner) {
                return nullptr;
            }
            if (is_at_end()) {
                return fail_expr(end_position_,
                                 fmt::format("expected ')' at position {} (missing closing "
                                             "parenthesis)",
                                             end_position_));
            }
            if (!match(TokenKind::RParen)) {
                return fail_expr(peek().position,
                                 fmt::format("expected ')' but found {} at position {}",
                                             format_token(peek()), peek().position));
            }
            return inner;
        }
        return fail_expr(peek().position, fmt::format("unexpected token {} at position {}",
                                                      format_token(peek()), peek().position));
    }

    auto match(TokenKind kind) -> bool {
        if (is_at_end() || peek().kind != kind) {
            return false;
        }
        current_ += 1;
        return true;
    }

    auto is_at_end() const -> bool { return current_ >= tokens_.size(); }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(std::size_t position, std::string message) -> ExprError {
        return ExprError{
            .kind = ExprErrorKind::Syntax,
            .message = std::move(message),
            .position = position,
        };
    }

    static auto format_token(const Token& token) -> std::string {
        return fmt::format("'{}'", token.lexeme);
    }

    auto fail_expr(std::size_t position, std::string message) -> ExprPtr {
        error_ = make_error(position, std::move(message));
        return nullptr;
    }

    static auto parse_number(std::string_view text) -> std::optional<double> {
        double value = 0.0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc()) {
            return std::nullopt;
        }
        return value;
    }

    static auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->node = UnaryExpr{.op = op, .operand = std::move(operand)};
        return node;
    }

    static auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->node = BinaryExpr{
            .op = op,
            .left = std::move(left),
            .right = std::move(right),
        };
        return node;
    }

    std::span<const Token> tokens_;
    std::size_t current_ = 0;
    std::size_t end_position_ = 0;
    std::size_t depth_ = 0;
    ExprError error_{};
};

struct ParseCache {
    std::mutex mutex;
    std::unordered_map<std::string, CachedParseResult> entries;
};

auto parse_cache() -> ParseCache& {
    static ParseCache cache;
    return cache;
}

}  // namespace

auto ExprError::format() const -> std::string {
    if (kind == ExprErrorKind::Syntax) {
        return fmt::format("position {}: {}", position, message);
    }
    return message;
}

auto parse(std::span<const Token> tokens) -> ParseResult {
    Parser parser(tokens);
    return parser.parse_root();
}

auto parse(std::string_view source) -> ParseResult {
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    return parse(std::span<const Token>(*tokens));
}

auto parse_cached(std::string_view source) -> CachedParseResult {
    auto& cache = parse_cache();
    std::string key(source);
    {
        std::lock_guard<std::mutex> lock(cache.mutex);
        if (auto it = cache.entries.find(key); it != cache.entries.end()) {
            return it->second;
        }
    }

    // Parse outside the lock; a concurrent miss on the same text computes an
    // equal tree and the first insert wins.
    CachedParseResult entry;
    auto parsed = parse(source);
    if (parsed) {
        entry = SharedAst(std::move(*parsed));
    } else {
        entry = std::unexpected(parsed.error());
    }

    std::lock_guard<std::mutex> lock(cache.mutex);
    auto [it, inserted] = cache.entries.emplace(std::move(key), std::move(entry));
    if (inserted) {
        spdlog::debug("expression cache: added '{}' ({} entries)", it->first,
                      cache.entries.size());
    }
    return it->second;
}

auto parse_cache_size() -> std::size_t {
    auto& cache = parse_cache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    return cache.entries.size();
}

}  // namespace tally::expr
