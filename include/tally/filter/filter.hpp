#pragma once

#include <tally/core/validation.hpp>
#include <tally/runtime/table.hpp>

#include <array>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tally::filter {

/// A single filter value. `std::monostate` stands for a null loaded from a
/// definition file; it is rejected by validation and never matches a row.
using FilterScalar = std::variant<std::monostate, std::string, double>;

/// Range criterion keyed by operator name (`gte`, `lte`, `gt`, `lt`).
using RangeFilter = std::map<std::string, FilterScalar>;

/// Exact match, OR-list, or range.
using FilterValue = std::variant<FilterScalar, std::vector<FilterScalar>, RangeFilter>;

/// Field name -> criterion. Fields are ANDed; an empty spec matches every row.
using FilterSpec = std::map<std::string, FilterValue>;

/// Fields a filter may reference.
inline constexpr std::array<std::string_view, 8> kValidFields = {
    "code1", "code2", "code3", "name1", "name2", "name3", "statement_type", "account_code",
};

inline constexpr std::array<std::string_view, 4> kRangeOperators = {"gte", "lte", "gt", "lt"};

enum class FilterErrorKind : std::uint8_t {
    Validation,
    Application,
};

struct FilterError {
    FilterErrorKind kind = FilterErrorKind::Validation;
    std::string message;
    // Individual validation problems; empty for application failures.
    std::vector<std::string> details;
};

/// Check a spec without applying it. Every problem is reported.
[[nodiscard]] auto validate_filter(const FilterSpec& spec) -> ValidationResult;

/// Compiled form of a FilterSpec.
class RowPredicate {
   public:
    enum class RangeOp : std::uint8_t { Gte, Lte, Gt, Lt };

    struct Bound {
        RangeOp op = RangeOp::Gte;
        FilterScalar value;
    };

    struct Criterion {
        std::string field;
        // Equality and OR-lists both compile to a candidate list.
        std::vector<FilterScalar> candidates;
        std::vector<Bound> bounds;
        bool is_range = false;
    };

    RowPredicate() = default;
    explicit RowPredicate(std::vector<Criterion> criteria) : criteria_(std::move(criteria)) {}

    [[nodiscard]] auto matches_all() const noexcept -> bool { return criteria_.empty(); }

    /// One byte per row of `table`, non-zero where the row matches.
    /// Fails when a referenced column is missing.
    [[nodiscard]] auto mask(const runtime::Table& table) const
        -> std::expected<std::vector<std::uint8_t>, std::string>;

   private:
    std::vector<Criterion> criteria_;
};

/// Compile without validating. Unknown range operators are ignored.
[[nodiscard]] auto compile_filter(const FilterSpec& spec) -> RowPredicate;

/// Apply an unvalidated spec. An empty spec returns `table` itself (shared
/// columns). Throws std::runtime_error when a referenced column is missing;
/// tables from io::read_movements_csv carry every filterable field.
[[nodiscard]] auto apply_filter(const FilterSpec& spec, const runtime::Table& table)
    -> runtime::Table;

/// Validate, then apply.
[[nodiscard]] auto apply_filter_safe(const FilterSpec& spec, const runtime::Table& table)
    -> std::expected<runtime::Table, FilterError>;

/// Apply each spec in turn, narrowing the table.
[[nodiscard]] auto combine_filters(const std::vector<FilterSpec>& specs,
                                   const runtime::Table& table)
    -> std::expected<runtime::Table, FilterError>;

}  // namespace tally::filter
