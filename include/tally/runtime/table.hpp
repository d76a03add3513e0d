#pragma once

#include <tally/core/column.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tally::runtime {

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<double>, Column<std::string>, Column<Categorical>>;

struct ColumnEntry {
    std::string name;
    // Shared and never mutated once added: copying a Table copies handles, not data.
    std::shared_ptr<const ColumnValue> column;
};

/// An immutable-by-convention columnar table.
///
/// Every engine operation takes a `const Table&` and returns a new Table;
/// returned tables may share column storage with their input.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
};

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// Build a table holding only `rows` of `input`, in the given order.
[[nodiscard]] auto gather_rows(const Table& input, std::span<const std::size_t> rows) -> Table;

/// Build a table holding the rows whose mask byte is non-zero.
[[nodiscard]] auto select_rows(const Table& input, std::span<const std::uint8_t> mask) -> Table;

/// Parse a whole (whitespace-trimmed) string as a number.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

/// Numeric form of a cell; nullopt for text cells.
[[nodiscard]] auto cell_number(const ColumnValue& column, std::size_t row)
    -> std::optional<double>;

}  // namespace tally::runtime
