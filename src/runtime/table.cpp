#include <tally/runtime/table.hpp>

#include <charconv>
#include <string_view>
#include <type_traits>

namespace tally::runtime {

void Table::add_column(std::string name, ColumnValue column) {
    auto shared = std::make_shared<const ColumnValue>(std::move(column));
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the handle rather than touching data other tables may share.
        columns[it->second].column = std::move(shared);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name), .column = std::move(shared)});
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::contains(const std::string& name) const -> bool {
    return index.contains(name);
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto gather_rows(const Table& input, std::span<const std::size_t> rows) -> Table {
    Table output;
    output.columns.reserve(input.columns.size());
    for (const auto& entry : input.columns) {
        output.add_column(entry.name, std::visit(
                                          [rows](const auto& col) -> ColumnValue {
                                              return col.gather(rows);
                                          },
                                          *entry.column));
    }
    return output;
}

auto select_rows(const Table& input, std::span<const std::uint8_t> mask) -> Table {
    std::vector<std::size_t> selected;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i] != 0) {
            selected.push_back(i);
        }
    }
    return gather_rows(input, selected);
}

auto parse_number(std::string_view text) -> std::optional<double> {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    auto end = text.find_last_not_of(" \t");
    text = text.substr(begin, end - begin + 1);
    double value = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto cell_number(const ColumnValue& column, std::size_t row) -> std::optional<double> {
    return std::visit(
        [row](const auto& col) -> std::optional<double> {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
                return std::nullopt;
            } else {
                return static_cast<double>(col[row]);
            }
        },
        column);
}

}  // namespace tally::runtime
