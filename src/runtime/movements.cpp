#include <tally/runtime/movements.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace tally::runtime {

auto format_columns(const Table& table) -> std::string {
    if (table.columns.empty()) {
        return "<none>";
    }
    return fmt::format("{}", fmt::join(table.column_names(), ", "));
}

auto integer_column(const Table& table, std::string_view name)
    -> std::expected<const Column<std::int64_t>*, std::string> {
    const auto* column = table.find(std::string(name));
    if (column == nullptr) {
        return std::unexpected(
            fmt::format("column '{}' not found (available: {})", name, format_columns(table)));
    }
    const auto* ints = std::get_if<Column<std::int64_t>>(column);
    if (ints == nullptr) {
        return std::unexpected(fmt::format("column '{}' must hold integers", name));
    }
    return ints;
}

auto amount_column(const Table& table) -> std::expected<const ColumnValue*, std::string> {
    const ColumnValue* column = table.find(std::string(kAmountColumn));
    if (column == nullptr) {
        column = table.find(std::string(kLegacyAmountColumn));
    }
    if (column == nullptr) {
        return std::unexpected(fmt::format("neither '{}' nor '{}' column found (available: {})",
                                           kAmountColumn, kLegacyAmountColumn,
                                           format_columns(table)));
    }
    if (!std::holds_alternative<Column<double>>(*column) &&
        !std::holds_alternative<Column<std::int64_t>>(*column)) {
        return std::unexpected("amount column must be numeric");
    }
    return column;
}

auto available_years(const Table& table) -> std::vector<std::int64_t> {
    auto years = integer_column(table, kYearColumn);
    if (!years) {
        return {};
    }
    std::vector<std::int64_t> out((*years)->begin(), (*years)->end());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

}  // namespace tally::runtime
