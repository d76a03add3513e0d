#include <tally/filter/filter.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace tally::filter {

namespace {

auto is_valid_field(const std::string& field) -> bool {
    return std::ranges::find(kValidFields, field) != kValidFields.end();
}

auto parse_range_op(const std::string& name) -> std::optional<RowPredicate::RangeOp> {
    using RangeOp = RowPredicate::RangeOp;
    if (name == "gte") {
        return RangeOp::Gte;
    }
    if (name == "lte") {
        return RangeOp::Lte;
    }
    if (name == "gt") {
        return RangeOp::Gt;
    }
    if (name == "lt") {
        return RangeOp::Lt;
    }
    return std::nullopt;
}

void validate_range(const std::string& field, const RangeFilter& range, ValidationResult& result) {
    if (range.empty()) {
        result.add_error(fmt::format("range filter for '{}' cannot be empty", field));
        return;
    }
    std::vector<std::string> invalid;
    bool has_string = false;
    bool has_number = false;
    for (const auto& [op, bound] : range) {
        if (!parse_range_op(op).has_value()) {
            invalid.push_back(op);
            continue;
        }
        if (std::holds_alternative<std::monostate>(bound)) {
            result.add_error(fmt::format("range bound for '{}' ({}) cannot be null", field, op));
        } else if (std::holds_alternative<std::string>(bound)) {
            has_string = true;
        } else {
            has_number = true;
        }
    }
    if (!invalid.empty()) {
        result.add_error(fmt::format("invalid range operator(s) for '{}': {} (valid: {})", field,
                                     fmt::join(invalid, ", "), fmt::join(kRangeOperators, ", ")));
    }
    if (has_string && has_number) {
        result.add_error(
            fmt::format("range filter for '{}' mixes string and number bounds", field));
    }
}

// Three-way comparison of a cell against a filter scalar. A cell is either
// text or a number, never both: strings compare only with text cells and
// numbers only with numeric cells. nullopt when the two are not comparable.
auto compare_cell(const FilterScalar& want, std::optional<std::string_view> text,
                  std::optional<double> number) -> std::optional<int> {
    return std::visit(
        [&](const auto& value) -> std::optional<int> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, std::string>) {
                if (!text.has_value()) {
                    return std::nullopt;
                }
                int cmp = text->compare(value);
                return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
            } else {
                if (!number.has_value() || std::isnan(*number)) {
                    return std::nullopt;
                }
                if (*number < value) {
                    return -1;
                }
                if (*number > value) {
                    return 1;
                }
                return 0;
            }
        },
        want);
}

auto criterion_matches(const RowPredicate::Criterion& criterion,
                       std::optional<std::string_view> text, std::optional<double> number)
    -> bool {
    using RangeOp = RowPredicate::RangeOp;
    if (!criterion.is_range) {
        return std::ranges::any_of(criterion.candidates, [&](const FilterScalar& want) {
            auto cmp = compare_cell(want, text, number);
            return cmp.has_value() && *cmp == 0;
        });
    }
    return std::ranges::all_of(criterion.bounds, [&](const RowPredicate::Bound& bound) {
        auto cmp = compare_cell(bound.value, text, number);
        if (!cmp.has_value()) {
            return false;
        }
        switch (bound.op) {
            case RangeOp::Gte:
                return *cmp >= 0;
            case RangeOp::Lte:
                return *cmp <= 0;
            case RangeOp::Gt:
                return *cmp > 0;
            case RangeOp::Lt:
                return *cmp < 0;
        }
        return false;
    });
}

// Narrow `mask` to rows whose cell in `column` satisfies `criterion`.
void apply_criterion(const RowPredicate::Criterion& criterion, const runtime::ColumnValue& column,
                     std::vector<std::uint8_t>& mask) {
    std::visit(
        [&](const auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::string_view>) {
                // Categorical: decide once per dictionary entry, then look rows up by code.
                const auto& dict = col.dictionary();
                std::vector<std::uint8_t> code_matches(dict.size(), 0);
                for (std::size_t code = 0; code < dict.size(); ++code) {
                    code_matches[code] =
                        criterion_matches(criterion, dict[code], std::nullopt) ? 1 : 0;
                }
                for (std::size_t row = 0; row < mask.size(); ++row) {
                    if (mask[row] != 0) {
                        mask[row] = code_matches[static_cast<std::size_t>(col.code_at(row))];
                    }
                }
            } else {
                for (std::size_t row = 0; row < mask.size(); ++row) {
                    if (mask[row] == 0) {
                        continue;
                    }
                    bool keep = false;
                    if constexpr (std::is_same_v<T, std::string>) {
                        keep = criterion_matches(criterion, col[row], std::nullopt);
                    } else {
                        keep = criterion_matches(criterion, std::nullopt,
                                                 static_cast<double>(col[row]));
                    }
                    mask[row] = keep ? 1 : 0;
                }
            }
        },
        column);
}

}  // namespace

auto validate_filter(const FilterSpec& spec) -> ValidationResult {
    ValidationResult result;
    for (const auto& [field, value] : spec) {
        if (!is_valid_field(field)) {
            result.add_error(fmt::format("invalid filter field '{}' (valid fields: {})", field,
                                         fmt::join(kValidFields, ", ")));
            continue;
        }
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, FilterScalar>) {
                    if (std::holds_alternative<std::monostate>(v)) {
                        result.add_error(
                            fmt::format("filter value for '{}' cannot be null", field));
                    }
                } else if constexpr (std::is_same_v<T, std::vector<FilterScalar>>) {
                    if (v.empty()) {
                        result.add_error(
                            fmt::format("filter list for '{}' cannot be empty", field));
                    } else if (std::ranges::any_of(v, [](const FilterScalar& s) {
                                   return std::holds_alternative<std::monostate>(s);
                               })) {
                        result.add_error(
                            fmt::format("filter list for '{}' contains null values", field));
                    }
                } else {
                    validate_range(field, v, result);
                }
            },
            value);
    }
    return result;
}

auto compile_filter(const FilterSpec& spec) -> RowPredicate {
    std::vector<RowPredicate::Criterion> criteria;
    criteria.reserve(spec.size());
    for (const auto& [field, value] : spec) {
        RowPredicate::Criterion criterion{.field = field};
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, FilterScalar>) {
                    criterion.candidates.push_back(v);
                } else if constexpr (std::is_same_v<T, std::vector<FilterScalar>>) {
                    criterion.candidates = v;
                } else {
                    criterion.is_range = true;
                    for (const auto& [op_name, bound] : v) {
                        if (auto op = parse_range_op(op_name)) {
                            criterion.bounds.push_back(
                                RowPredicate::Bound{.op = *op, .value = bound});
                        }
                    }
                }
            },
            value);
        criteria.push_back(std::move(criterion));
    }
    return RowPredicate(std::move(criteria));
}

auto RowPredicate::mask(const runtime::Table& table) const
    -> std::expected<std::vector<std::uint8_t>, std::string> {
    std::vector<std::uint8_t> out(table.rows(), 1);
    for (const auto& criterion : criteria_) {
        const auto* column = table.find(criterion.field);
        if (column == nullptr) {
            return std::unexpected(fmt::format("filter field '{}' not found (available: {})",
                                               criterion.field,
                                               fmt::join(table.column_names(), ", ")));
        }
        apply_criterion(criterion, *column, out);
    }
    return out;
}

auto apply_filter(const FilterSpec& spec, const runtime::Table& table) -> runtime::Table {
    if (spec.empty()) {
        return table;
    }
    auto predicate = compile_filter(spec);
    auto mask = predicate.mask(table);
    if (!mask) {
        throw std::runtime_error(mask.error());
    }
    auto result = runtime::select_rows(table, *mask);
    spdlog::debug("filter on {} field(s): {} of {} rows kept", spec.size(), result.rows(),
                  table.rows());
    return result;
}

auto apply_filter_safe(const FilterSpec& spec, const runtime::Table& table)
    -> std::expected<runtime::Table, FilterError> {
    auto validation = validate_filter(spec);
    if (!validation.is_valid) {
        return std::unexpected(FilterError{
            .kind = FilterErrorKind::Validation,
            .message = fmt::format("invalid filter: {}", fmt::join(validation.errors, "; ")),
            .details = std::move(validation.errors),
        });
    }
    if (spec.empty()) {
        return table;
    }
    auto mask = compile_filter(spec).mask(table);
    if (!mask) {
        return std::unexpected(FilterError{
            .kind = FilterErrorKind::Application,
            .message = std::move(mask.error()),
            .details = {},
        });
    }
    return runtime::select_rows(table, *mask);
}

auto combine_filters(const std::vector<FilterSpec>& specs, const runtime::Table& table)
    -> std::expected<runtime::Table, FilterError> {
    runtime::Table current = table;
    for (const auto& spec : specs) {
        auto next = apply_filter_safe(spec, current);
        if (!next) {
            return std::unexpected(std::move(next.error()));
        }
        current = std::move(*next);
    }
    return current;
}

}  // namespace tally::filter
