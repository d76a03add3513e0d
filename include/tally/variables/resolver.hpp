#pragma once

#include <tally/core/validation.hpp>
#include <tally/filter/filter.hpp>
#include <tally/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tally::variables {

enum class AggregateFunction : std::uint8_t {
    Sum,
    Average,
    Count,
    Min,
    Max,
    First,
    Last,
};

/// Parse an aggregate name (case-insensitive; `avg` is accepted for `average`).
[[nodiscard]] auto parse_aggregate(std::string_view name) -> std::optional<AggregateFunction>;

[[nodiscard]] auto to_string(AggregateFunction fn) -> std::string_view;

/// Aggregate `values` (dataset order). An empty input yields 0 for every function.
[[nodiscard]] auto aggregate_values(AggregateFunction fn, std::span<const double> values)
    -> double;

/// A named report variable: a filter plus an aggregate, or, when `expression`
/// is set, a calculated value over other variables of the same registry.
struct VariableDefinition {
    filter::FilterSpec filter;
    AggregateFunction aggregate = AggregateFunction::Sum;
    std::string description;
    std::optional<std::string> expression;

    [[nodiscard]] auto is_calculated() const noexcept -> bool { return expression.has_value(); }
};

using VariableRegistry = std::map<std::string, VariableDefinition>;

/// Year -> value. Holds an entry for every year of the dataset.
using ResolvedValue = std::map<std::int64_t, double>;
using ResolvedValues = std::map<std::string, ResolvedValue>;

enum class ResolveErrorKind : std::uint8_t {
    InvalidDefinition,
    UnknownVariable,
    FilterFailed,
    AggregationFailed,
    EvaluationFailed,
    CircularDependency,
};

struct ResolveError {
    ResolveErrorKind kind = ResolveErrorKind::InvalidDefinition;
    std::string message;
    // Variable being resolved when the error occurred.
    std::string variable;
    // For CircularDependency: the cycle itself, first name repeated at the end.
    // Names resolved on the way into the cycle are not part of it.
    std::vector<std::string> cycle;
};

[[nodiscard]] auto validate_variable(const VariableDefinition& definition) -> ValidationResult;

/// Resolve a filter/aggregate variable over `table`. Calculated variables are
/// rejected since their dependencies live in a registry.
[[nodiscard]] auto resolve_variable(const VariableDefinition& definition,
                                    const runtime::Table& table)
    -> std::expected<ResolvedValue, ResolveError>;

struct ResolutionStats {
    std::size_t filter_applications = 0;
    std::size_t cache_hits = 0;
};

/// State of one resolution pass over a registry.
///
/// Holds the per-pass value cache and the in-progress stack used to detect
/// cycles between calculated variables. Create one per top-level call; the
/// registry and table must outlive it.
class ResolutionContext {
   public:
    ResolutionContext(const VariableRegistry& registry, const runtime::Table& table);

    [[nodiscard]] auto resolve(const std::string& name)
        -> std::expected<ResolvedValue, ResolveError>;

    [[nodiscard]] auto resolved() const noexcept -> const ResolvedValues& { return cache_; }
    [[nodiscard]] auto stats() const noexcept -> const ResolutionStats& { return stats_; }

   private:
    auto resolve_definition(const std::string& name, const VariableDefinition& definition)
        -> std::expected<ResolvedValue, ResolveError>;
    auto resolve_calculated(const std::string& name, const std::string& expression)
        -> std::expected<ResolvedValue, ResolveError>;
    auto cycle_error(const std::string& name) const -> ResolveError;

    const VariableRegistry& registry_;
    const runtime::Table& table_;
    std::vector<std::int64_t> years_;
    ResolvedValues cache_;
    std::vector<std::string> stack_;
    std::unordered_set<std::string> in_progress_;
    ResolutionStats stats_;
};

/// Resolve every variable of `registry` in a fresh context.
[[nodiscard]] auto resolve_variables(const VariableRegistry& registry,
                                     const runtime::Table& table)
    -> std::expected<ResolvedValues, ResolveError>;

}  // namespace tally::variables
