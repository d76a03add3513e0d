#include <tally/period/ltm.hpp>
#include <tally/runtime/movements.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tally::period {

auto latest_available_period(const runtime::Table& table) -> std::optional<LatestPeriod> {
    if (table.rows() == 0) {
        return std::nullopt;
    }
    auto years = runtime::integer_column(table, runtime::kYearColumn);
    auto periods = runtime::integer_column(table, runtime::kPeriodColumn);
    if (!years || !periods) {
        return std::nullopt;
    }
    const auto& year_values = **years;
    const auto& period_values = **periods;

    std::int64_t max_year = *std::ranges::max_element(year_values);
    std::int64_t max_period = 0;
    for (std::size_t row = 0; row < year_values.size(); ++row) {
        if (year_values[row] == max_year) {
            max_period = std::max(max_period, period_values[row]);
        }
    }
    return LatestPeriod{.year = max_year, .period = static_cast<int>(max_period)};
}

auto is_valid_ltm_params(std::int64_t year, int period, int months_back) -> bool {
    return year > 0 && period >= 1 && period <= 12 && months_back > 0;
}

auto is_valid_range(const LtmRange& range) -> bool {
    return range.year > 0 && range.start_period >= 1 && range.end_period <= 12 &&
           range.start_period <= range.end_period;
}

auto calculate_ltm_range(std::int64_t year, int period, int months_back)
    -> std::vector<LtmRange> {
    if (!is_valid_ltm_params(year, period, months_back)) {
        return {};
    }
    std::vector<LtmRange> ranges;
    std::int64_t current_year = year;
    int current_period = period;
    int remaining = months_back;
    while (remaining > 0) {
        int start = std::max(1, current_period - remaining + 1);
        ranges.push_back(LtmRange{
            .year = current_year,
            .start_period = start,
            .end_period = current_period,
        });
        remaining -= current_period - start + 1;
        current_year -= 1;
        current_period = 12;
    }
    std::ranges::reverse(ranges);
    return ranges;
}

auto total_months(std::span<const LtmRange> ranges) -> int {
    int total = 0;
    for (const auto& range : ranges) {
        total += range.end_period - range.start_period + 1;
    }
    return total;
}

auto required_years(std::span<const LtmRange> ranges) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> years;
    years.reserve(ranges.size());
    for (const auto& range : ranges) {
        years.push_back(range.year);
    }
    std::ranges::sort(years);
    auto dup = std::ranges::unique(years);
    years.erase(dup.begin(), dup.end());
    return years;
}

auto check_data_availability(std::span<const LtmRange> ranges,
                             std::span<const std::int64_t> available_years, int expected_months)
    -> DataAvailability {
    if (ranges.empty()) {
        return DataAvailability{
            .complete = false,
            .actual_months = 0,
            .expected_months = expected_months,
            .message = "No LTM data available",
        };
    }
    int months = total_months(ranges);
    std::vector<std::int64_t> missing;
    for (auto year : required_years(ranges)) {
        if (std::ranges::find(available_years, year) == available_years.end()) {
            missing.push_back(year);
        }
    }
    if (!missing.empty()) {
        return DataAvailability{
            .complete = false,
            .actual_months = months,
            .expected_months = expected_months,
            .message = fmt::format("Missing data for year(s): {}", fmt::join(missing, ", ")),
        };
    }
    bool complete = months >= expected_months;
    return DataAvailability{
        .complete = complete,
        .actual_months = months,
        .expected_months = expected_months,
        .message = complete ? std::string("Complete LTM data available")
                            : fmt::format("Only {} month{} available (need {})", months,
                                          months == 1 ? "" : "s", expected_months),
    };
}

auto filter_movements_for_ltm(const runtime::Table& table, std::span<const LtmRange> ranges)
    -> std::expected<runtime::Table, std::string> {
    if (ranges.empty()) {
        return runtime::Table{};
    }
    auto years = runtime::integer_column(table, runtime::kYearColumn);
    if (!years) {
        return std::unexpected(years.error());
    }
    auto periods = runtime::integer_column(table, runtime::kPeriodColumn);
    if (!periods) {
        return std::unexpected(periods.error());
    }
    const auto& year_values = **years;
    const auto& period_values = **periods;

    std::vector<std::uint8_t> mask(table.rows(), 0);
    for (std::size_t row = 0; row < mask.size(); ++row) {
        for (const auto& range : ranges) {
            if (year_values[row] == range.year && period_values[row] >= range.start_period &&
                period_values[row] <= range.end_period) {
                mask[row] = 1;
                break;
            }
        }
    }
    return runtime::select_rows(table, mask);
}

auto ltm_label(std::span<const LtmRange> ranges) -> std::string {
    if (ranges.empty()) {
        return "LTM (No Data)";
    }
    return fmt::format("LTM ({} P{} - {} P{})", ranges.front().year, ranges.front().start_period,
                       ranges.back().year, ranges.back().end_period);
}

auto ltm_short_label(std::span<const LtmRange> ranges) -> std::string {
    if (ranges.empty()) {
        return "LTM";
    }
    return fmt::format("LTM {} P{}", ranges.back().year, ranges.back().end_period);
}

auto calculate_ltm_info(const runtime::Table& table,
                        std::span<const std::int64_t> available_years, int months_back)
    -> std::expected<LtmInfo, std::string> {
    auto latest = latest_available_period(table);
    if (!latest.has_value()) {
        return LtmInfo{
            .ranges = {},
            .label = ltm_label({}),
            .short_label = ltm_short_label({}),
            .table = runtime::Table{},
            .has_complete_data = false,
            .latest = LatestPeriod{},
            .availability =
                DataAvailability{
                    .complete = false,
                    .actual_months = 0,
                    .expected_months = months_back,
                    .message = "No data available",
                },
        };
    }

    auto ranges = calculate_ltm_range(latest->year, latest->period, months_back);
    auto filtered = filter_movements_for_ltm(table, ranges);
    if (!filtered) {
        return std::unexpected(filtered.error());
    }
    auto availability = check_data_availability(ranges, available_years, months_back);
    spdlog::debug("LTM window ending {} P{}: {} range(s), {} row(s); {}", latest->year,
                  latest->period, ranges.size(), filtered->rows(), availability.message);

    LtmInfo info{
        .ranges = ranges,
        .label = ltm_label(ranges),
        .short_label = ltm_short_label(ranges),
        .table = std::move(*filtered),
        .has_complete_data = availability.complete,
        .latest = *latest,
        .availability = std::move(availability),
    };
    return info;
}

}  // namespace tally::period
