#pragma once

#include <tally/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tally::period {

/// Months `start_period..end_period` (inclusive) of one calendar year.
struct LtmRange {
    std::int64_t year = 0;
    int start_period = 1;
    int end_period = 12;

    auto operator==(const LtmRange&) const -> bool = default;
};

struct LatestPeriod {
    std::int64_t year = 0;
    int period = 0;

    auto operator==(const LatestPeriod&) const -> bool = default;
};

struct DataAvailability {
    bool complete = false;
    int actual_months = 0;
    int expected_months = 12;
    std::string message;
};

/// Everything a report needs to show a trailing window.
struct LtmInfo {
    std::vector<LtmRange> ranges;
    std::string label;
    std::string short_label;
    // Rows of the input that fall inside `ranges`.
    runtime::Table table;
    bool has_complete_data = false;
    LatestPeriod latest;
    DataAvailability availability;
};

/// Highest year in the table, then the highest period within it. nullopt
/// for an empty table or one lacking `year`/`period` columns.
[[nodiscard]] auto latest_available_period(const runtime::Table& table)
    -> std::optional<LatestPeriod>;

/// Ranges covering `months_back` months ending at (`year`, `period`), oldest
/// first. Invalid parameters yield an empty list.
[[nodiscard]] auto calculate_ltm_range(std::int64_t year, int period, int months_back = 12)
    -> std::vector<LtmRange>;

[[nodiscard]] auto total_months(std::span<const LtmRange> ranges) -> int;

/// Distinct years of `ranges`, ascending.
[[nodiscard]] auto required_years(std::span<const LtmRange> ranges) -> std::vector<std::int64_t>;

[[nodiscard]] auto is_valid_range(const LtmRange& range) -> bool;

[[nodiscard]] auto is_valid_ltm_params(std::int64_t year, int period, int months_back) -> bool;

[[nodiscard]] auto check_data_availability(std::span<const LtmRange> ranges,
                                           std::span<const std::int64_t> available_years,
                                           int expected_months = 12) -> DataAvailability;

/// Rows whose (year, period) falls in any of `ranges`, in table order.
[[nodiscard]] auto filter_movements_for_ltm(const runtime::Table& table,
                                            std::span<const LtmRange> ranges)
    -> std::expected<runtime::Table, std::string>;

/// "LTM (2023 P7 - 2024 P6)", or "LTM (No Data)" for no ranges.
[[nodiscard]] auto ltm_label(std::span<const LtmRange> ranges) -> std::string;

/// "LTM 2024 P6", or "LTM" for no ranges.
[[nodiscard]] auto ltm_short_label(std::span<const LtmRange> ranges) -> std::string;

[[nodiscard]] auto calculate_ltm_info(const runtime::Table& table,
                                      std::span<const std::int64_t> available_years,
                                      int months_back = 12)
    -> std::expected<LtmInfo, std::string>;

}  // namespace tally::period
