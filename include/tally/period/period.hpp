#pragma once

#include <tally/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tally::period {

/// A reporting period: year-to-date up to `max_period`, or the trailing window.
struct PeriodSelection {
    enum class Kind : std::uint8_t { YearToDate, Ltm };

    Kind kind = Kind::YearToDate;
    int max_period = 12;

    [[nodiscard]] auto is_ltm() const noexcept -> bool { return kind == Kind::Ltm; }
    auto operator==(const PeriodSelection&) const -> bool = default;
};

/// "All" or "" -> 12, "LTM", "Q1".."Q4" -> 3..12, "P1".."P12", or a bare
/// integer. Anything else selects the full year.
[[nodiscard]] auto parse_period(std::string_view text) -> PeriodSelection;

/// "P6" for 6; out-of-range values render as "P12".
[[nodiscard]] auto to_period_string(int period) -> std::string;

/// Quarter (1-4) containing `period`.
[[nodiscard]] auto period_to_quarter(int period) -> int;

/// Rows with `period <= selection.max_period`. LTM selections are rejected;
/// use calculate_ltm_info for those.
[[nodiscard]] auto restrict_to_period(const runtime::Table& table, const PeriodSelection& selection)
    -> std::expected<runtime::Table, std::string>;

struct Variance {
    double amount = 0.0;
    // Relative to |prior|, in percent. 0 when prior is 0.
    double percent = 0.0;
};

[[nodiscard]] auto calculate_variance(double current, double prior) -> Variance;

}  // namespace tally::period
