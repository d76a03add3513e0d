#pragma once

#include <tally/runtime/table.hpp>

#include <expected>
#include <istream>
#include <string>
#include <string_view>

namespace tally::io {

/// Read a long-format movements CSV (header row required).
///
/// `year` and `period` become int64 columns and the amount column
/// (`movement_amount` or `amount`) a double column; empty amounts load as
/// NaN. Every other column is text, dictionary-encoded when it repeats a
/// small set of values.
[[nodiscard]] auto read_movements_csv(std::string_view path)
    -> std::expected<runtime::Table, std::string>;

/// As read_movements_csv, from an already opened stream.
[[nodiscard]] auto parse_movements_csv(std::istream& input)
    -> std::expected<runtime::Table, std::string>;

}  // namespace tally::io
