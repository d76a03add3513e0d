#pragma once

#include <tally/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace tally::runtime {

// Column layout of a long-format movements table (one row per account,
// year and period).
inline constexpr std::string_view kYearColumn = "year";
inline constexpr std::string_view kPeriodColumn = "period";
inline constexpr std::string_view kAmountColumn = "movement_amount";
// Older exports name the amount column plainly.
inline constexpr std::string_view kLegacyAmountColumn = "amount";

/// Look up an int64 column, failing with a message naming the available columns.
[[nodiscard]] auto integer_column(const Table& table, std::string_view name)
    -> std::expected<const Column<std::int64_t>*, std::string>;

/// The amount column (`movement_amount`, falling back to `amount`) as any numeric column.
[[nodiscard]] auto amount_column(const Table& table)
    -> std::expected<const ColumnValue*, std::string>;

/// Distinct values of the `year` column, ascending. Empty for an empty table
/// or a table without a year column.
[[nodiscard]] auto available_years(const Table& table) -> std::vector<std::int64_t>;

/// Comma-separated column names, for diagnostics.
[[nodiscard]] auto format_columns(const Table& table) -> std::string;

}  // namespace tally::runtime
