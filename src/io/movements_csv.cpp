#include <tally/filter/filter.hpp>
#include <tally/io/movements_csv.hpp>
#include <tally/runtime/movements.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace tally::io {

namespace {

constexpr std::size_t kMaxCategoricalUniques = 4096;
constexpr double kMaxCategoricalRatio = 0.05;

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto to_integer_column(const std::string& name, const std::vector<std::string>& values)
    -> std::expected<Column<std::int64_t>, std::string> {
    Column<std::int64_t> column;
    column.reserve(values.size());
    for (std::size_t row = 0; row < values.size(); ++row) {
        auto text = trim(values[row]);
        std::int64_t value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            return std::unexpected(fmt::format("row {}: column '{}' expects an integer, got '{}'",
                                               row + 1, name, values[row]));
        }
        column.push_back(value);
    }
    return column;
}

auto to_amount_column(const std::string& name, const std::vector<std::string>& values)
    -> std::expected<Column<double>, std::string> {
    Column<double> column;
    column.reserve(values.size());
    for (std::size_t row = 0; row < values.size(); ++row) {
        if (trim(values[row]).empty()) {
            column.push_back(std::numeric_limits<double>::quiet_NaN());
            continue;
        }
        auto value = runtime::parse_number(values[row]);
        if (!value.has_value()) {
            return std::unexpected(fmt::format("row {}: column '{}' expects a number, got '{}'",
                                               row + 1, name, values[row]));
        }
        column.push_back(*value);
    }
    return column;
}

auto to_text_column(std::vector<std::string> values) -> runtime::ColumnValue {
    const std::size_t n = values.size();
    if (n == 0) {
        return Column<std::string>(std::move(values));
    }
    const std::size_t ratio_limit = std::max<std::size_t>(
        1, static_cast<std::size_t>(static_cast<double>(n) * kMaxCategoricalRatio));
    const std::size_t max_uniques = std::min(kMaxCategoricalUniques, ratio_limit);

    using code_type = Column<Categorical>::code_type;
    std::vector<code_type> codes;
    codes.reserve(n);
    std::vector<std::string> dict;
    std::unordered_map<std::string_view, code_type> index;
    for (const auto& v : values) {
        auto it = index.find(v);
        if (it != index.end()) {
            codes.push_back(it->second);
            continue;
        }
        if (index.size() + 1 > max_uniques) {
            return Column<std::string>(std::move(values));
        }
        auto code = static_cast<code_type>(dict.size());
        dict.push_back(v);
        // Key on the source string: `dict` may reallocate.
        index.emplace(v, code);
        codes.push_back(code);
    }
    return Column<Categorical>(std::move(dict), std::move(codes));
}

auto build_table(rapidcsv::Document& doc) -> std::expected<runtime::Table, std::string> {
    auto names = doc.GetColumnNames();
    const auto has = [&](std::string_view column) {
        return std::ranges::find(names, column) != names.end();
    };
    for (auto required : {runtime::kYearColumn, runtime::kPeriodColumn}) {
        if (!has(required)) {
            return std::unexpected(fmt::format("movements csv is missing column '{}'", required));
        }
    }
    std::string_view amount_name = runtime::kAmountColumn;
    if (!has(amount_name)) {
        amount_name = runtime::kLegacyAmountColumn;
        if (!has(amount_name)) {
            return std::unexpected(fmt::format("movements csv is missing column '{}'",
                                               runtime::kAmountColumn));
        }
    }

    runtime::Table table;
    for (const auto& name : names) {
        auto values = doc.GetColumn<std::string>(name);
        if (name == runtime::kYearColumn || name == runtime::kPeriodColumn) {
            auto column = to_integer_column(name, values);
            if (!column) {
                return std::unexpected(column.error());
            }
            table.add_column(name, std::move(*column));
        } else if (name == amount_name) {
            auto column = to_amount_column(name, values);
            if (!column) {
                return std::unexpected(column.error());
            }
            table.add_column(name, std::move(*column));
        } else {
            table.add_column(name, to_text_column(std::move(values)));
        }
    }
    // Every filterable field exists on a loaded table; absent ones read as empty text.
    for (auto field : filter::kValidFields) {
        if (!has(field)) {
            table.add_column(std::string(field),
                             to_text_column(std::vector<std::string>(table.rows())));
        }
    }
    return table;
}

}  // namespace

auto parse_movements_csv(std::istream& input) -> std::expected<runtime::Table, std::string> {
    try {
        rapidcsv::Document doc(input,
                               rapidcsv::LabelParams(0, -1),   // row 0 = header
                               rapidcsv::SeparatorParams(',')  // RFC 4180 quoting
        );
        return build_table(doc);
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read movements csv: {}", e.what()));
    }
}

auto read_movements_csv(std::string_view path) -> std::expected<runtime::Table, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected(fmt::format("failed to open csv: {}", path));
    }
    auto table = parse_movements_csv(input);
    if (table) {
        spdlog::debug("loaded {} movement row(s) with {} column(s) from {}", table->rows(),
                      table->columns.size(), path);
    }
    return table;
}

}  // namespace tally::io
