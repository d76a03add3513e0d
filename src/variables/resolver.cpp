#include <tally/expr/evaluator.hpp>
#include <tally/runtime/movements.hpp>
#include <tally/variables/resolver.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace tally::variables {

namespace {

auto make_error(ResolveErrorKind kind, std::string variable, std::string message)
    -> ResolveError {
    return ResolveError{
        .kind = kind,
        .message = std::move(message),
        .variable = std::move(variable),
        .cycle = {},
    };
}

// Per-year aggregation of the amount column of `filtered`. Every year in
// `years` gets an entry; years without rows aggregate an empty set.
auto aggregate_by_year(const runtime::Table& filtered, const std::vector<std::int64_t>& years,
                       AggregateFunction fn) -> std::expected<ResolvedValue, std::string> {
    std::map<std::int64_t, std::vector<double>> groups;
    for (auto year : years) {
        groups[year];
    }
    if (filtered.rows() > 0) {
        auto year_col = runtime::integer_column(filtered, runtime::kYearColumn);
        if (!year_col) {
            return std::unexpected(year_col.error());
        }
        auto amount_col = runtime::amount_column(filtered);
        if (!amount_col) {
            return std::unexpected(amount_col.error());
        }
        const auto& year_values = **year_col;
        for (std::size_t row = 0; row < filtered.rows(); ++row) {
            // Missing amounts count as zero.
            double amount = runtime::cell_number(**amount_col, row).value_or(0.0);
            if (std::isnan(amount)) {
                amount = 0.0;
            }
            groups[year_values[row]].push_back(amount);
        }
    }
    ResolvedValue out;
    for (const auto& [year, values] : groups) {
        out.emplace(year, aggregate_values(fn, values));
    }
    return out;
}

auto definition_error(const std::string& name, const ValidationResult& validation)
    -> ResolveError {
    return make_error(ResolveErrorKind::InvalidDefinition, name,
                      fmt::format("invalid definition for variable '{}': {}", name,
                                  fmt::join(validation.errors, "; ")));
}

auto filter_and_aggregate(const std::string& name, const VariableDefinition& definition,
                          const runtime::Table& table, const std::vector<std::int64_t>& years)
    -> std::expected<ResolvedValue, ResolveError> {
    auto filtered = filter::apply_filter_safe(definition.filter, table);
    if (!filtered) {
        auto kind = filtered.error().kind == filter::FilterErrorKind::Validation
                        ? ResolveErrorKind::InvalidDefinition
                        : ResolveErrorKind::FilterFailed;
        return std::unexpected(make_error(
            kind, name, fmt::format("variable '{}': {}", name, filtered.error().message)));
    }
    auto values = aggregate_by_year(*filtered, years, definition.aggregate);
    if (!values) {
        return std::unexpected(make_error(ResolveErrorKind::AggregationFailed, name,
                                          fmt::format("variable '{}': {}", name, values.error())));
    }
    spdlog::debug("resolved '{}' ({} over {} rows)", name, to_string(definition.aggregate),
                  filtered->rows());
    return std::move(*values);
}

}  // namespace

auto parse_aggregate(std::string_view name) -> std::optional<AggregateFunction> {
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "sum") {
        return AggregateFunction::Sum;
    }
    if (lower == "average" || lower == "avg") {
        return AggregateFunction::Average;
    }
    if (lower == "count") {
        return AggregateFunction::Count;
    }
    if (lower == "min") {
        return AggregateFunction::Min;
    }
    if (lower == "max") {
        return AggregateFunction::Max;
    }
    if (lower == "first") {
        return AggregateFunction::First;
    }
    if (lower == "last") {
        return AggregateFunction::Last;
    }
    return std::nullopt;
}

auto to_string(AggregateFunction fn) -> std::string_view {
    switch (fn) {
        case AggregateFunction::Sum:
            return "sum";
        case AggregateFunction::Average:
            return "average";
        case AggregateFunction::Count:
            return "count";
        case AggregateFunction::Min:
            return "min";
        case AggregateFunction::Max:
            return "max";
        case AggregateFunction::First:
            return "first";
        case AggregateFunction::Last:
            return "last";
    }
    return "unknown";
}

auto aggregate_values(AggregateFunction fn, std::span<const double> values) -> double {
    if (values.empty()) {
        return 0.0;
    }
    switch (fn) {
        case AggregateFunction::Sum: {
            double sum = 0.0;
            for (double v : values) {
                sum += v;
            }
            return sum;
        }
        case AggregateFunction::Average: {
            double sum = 0.0;
            for (double v : values) {
                sum += v;
            }
            return sum / static_cast<double>(values.size());
        }
        case AggregateFunction::Count:
            return static_cast<double>(values.size());
        case AggregateFunction::Min:
            return std::ranges::min(values);
        case AggregateFunction::Max:
            return std::ranges::max(values);
        case AggregateFunction::First:
            return values.front();
        case AggregateFunction::Last:
            return values.back();
    }
    return 0.0;
}

auto validate_variable(const VariableDefinition& definition) -> ValidationResult {
    if (definition.is_calculated()) {
        return expr::validate_expression(*definition.expression);
    }
    return filter::validate_filter(definition.filter);
}

auto resolve_variable(const VariableDefinition& definition, const runtime::Table& table)
    -> std::expected<ResolvedValue, ResolveError> {
    if (definition.is_calculated()) {
        return std::unexpected(make_error(
            ResolveErrorKind::InvalidDefinition, "",
            fmt::format("calculated variable '{}' must be resolved within a registry",
                        *definition.expression)));
    }
    auto validation = validate_variable(definition);
    if (!validation.is_valid) {
        return std::unexpected(definition_error("<anonymous>", validation));
    }
    return filter_and_aggregate("<anonymous>", definition, table,
                                runtime::available_years(table));
}

ResolutionContext::ResolutionContext(const VariableRegistry& registry,
                                     const runtime::Table& table)
    : registry_(registry), table_(table), years_(runtime::available_years(table)) {}

auto ResolutionContext::resolve(const std::string& name)
    -> std::expected<ResolvedValue, ResolveError> {
    if (auto it = cache_.find(name); it != cache_.end()) {
        stats_.cache_hits += 1;
        spdlog::debug("cache hit for '{}'", name);
        return it->second;
    }
    if (in_progress_.contains(name)) {
        return std::unexpected(cycle_error(name));
    }
    auto def = registry_.find(name);
    if (def == registry_.end()) {
        return std::unexpected(make_error(ResolveErrorKind::UnknownVariable, name,
                                          fmt::format("unknown variable '{}'", name)));
    }

    stack_.push_back(name);
    in_progress_.insert(name);
    auto result = resolve_definition(name, def->second);
    in_progress_.erase(name);
    stack_.pop_back();

    if (!result) {
        return result;
    }
    cache_.emplace(name, *result);
    return result;
}

auto ResolutionContext::resolve_definition(const std::string& name,
                                           const VariableDefinition& definition)
    -> std::expected<ResolvedValue, ResolveError> {
    auto validation = validate_variable(definition);
    if (!validation.is_valid) {
        return std::unexpected(definition_error(name, validation));
    }
    if (definition.is_calculated()) {
        return resolve_calculated(name, *definition.expression);
    }
    stats_.filter_applications += 1;
    return filter_and_aggregate(name, definition, table_, years_);
}

auto ResolutionContext::resolve_calculated(const std::string& name, const std::string& expression)
    -> std::expected<ResolvedValue, ResolveError> {
    auto deps = expr::get_dependencies(expression);
    if (!deps) {
        return std::unexpected(make_error(
            ResolveErrorKind::EvaluationFailed, name,
            fmt::format("variable '{}': {}", name, deps.error().format())));
    }

    std::vector<std::pair<std::string, ResolvedValue>> inputs;
    inputs.reserve(deps->size());
    for (const auto& dep : *deps) {
        if (dep.starts_with('@')) {
            return std::unexpected(make_error(
                ResolveErrorKind::UnknownVariable, name,
                fmt::format("variable '{}': order reference {} cannot be resolved from a "
                            "variable registry",
                            name, dep)));
        }
        auto value = resolve(dep);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        inputs.emplace_back(dep, std::move(*value));
    }

    ResolvedValue out;
    expr::EvalContext context;
    for (auto year : years_) {
        for (const auto& [dep, values] : inputs) {
            auto it = values.find(year);
            context[dep] = it == values.end() ? 0.0 : it->second;
        }
        auto value = expr::evaluate_expression(expression, context);
        if (!value) {
            return std::unexpected(make_error(ResolveErrorKind::EvaluationFailed, name,
                                              fmt::format("variable '{}' in {}: {}", name, year,
                                                          value.error().format())));
        }
        out.emplace(year, *value);
    }
    spdlog::debug("resolved '{}' from {} input(s)", name, inputs.size());
    return out;
}

auto ResolutionContext::cycle_error(const std::string& name) const -> ResolveError {
    auto start = std::ranges::find(stack_, name);
    std::vector<std::string> cycle(start, stack_.end());
    cycle.push_back(name);
    ResolveError error = make_error(
        ResolveErrorKind::CircularDependency, name,
        fmt::format("circular dependency detected: {}", fmt::join(cycle, " -> ")));
    error.cycle = std::move(cycle);
    return error;
}

auto resolve_variables(const VariableRegistry& registry, const runtime::Table& table)
    -> std::expected<ResolvedValues, ResolveError> {
    ResolutionContext context(registry, table);
    for (const auto& [name, definition] : registry) {
        auto value = context.resolve(name);
        if (!value) {
            spdlog::debug("resolution failed: {}", value.error().message);
            return std::unexpected(std::move(value.error()));
        }
    }
    const auto& stats = context.stats();
    spdlog::debug("resolved {} variable(s): {} filter application(s), {} cache hit(s)",
                  registry.size(), stats.filter_applications, stats.cache_hits);
    return context.resolved();
}

}  // namespace tally::variables
