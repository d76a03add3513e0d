#include <tally/period/period.hpp>
#include <tally/runtime/movements.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <optional>
#include <vector>

namespace tally::period {

namespace {

// Leading integer of `text` (an optional sign then digits); trailing text is ignored.
auto leading_integer(std::string_view text) -> std::optional<int> {
    int value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr == text.data()) {
        return std::nullopt;
    }
    return value;
}

auto year_to_date(int max_period) -> PeriodSelection {
    return PeriodSelection{.kind = PeriodSelection::Kind::YearToDate, .max_period = max_period};
}

}  // namespace

auto parse_period(std::string_view text) -> PeriodSelection {
    if (text.empty() || text == "All") {
        return year_to_date(12);
    }
    if (text == "LTM") {
        return PeriodSelection{.kind = PeriodSelection::Kind::Ltm, .max_period = 12};
    }
    if (text.front() == 'Q') {
        if (auto quarter = leading_integer(text.substr(1)); quarter && *quarter >= 1 &&
                                                            *quarter <= 4) {
            return year_to_date(*quarter * 3);
        }
    }
    if (text.front() == 'P') {
        if (auto period = leading_integer(text.substr(1)); period && *period >= 1 &&
                                                           *period <= 12) {
            return year_to_date(*period);
        }
    }
    if (auto number = leading_integer(text)) {
        return year_to_date(*number);
    }
    return year_to_date(12);
}

auto to_period_string(int period) -> std::string {
    if (period < 1 || period > 12) {
        return "P12";
    }
    return fmt::format("P{}", period);
}

auto period_to_quarter(int period) -> int {
    return (period + 2) / 3;
}

auto restrict_to_period(const runtime::Table& table, const PeriodSelection& selection)
    -> std::expected<runtime::Table, std::string> {
    if (selection.is_ltm()) {
        return std::unexpected("an LTM selection cannot be applied as a year-to-date cut-off");
    }
    auto periods = runtime::integer_column(table, runtime::kPeriodColumn);
    if (!periods) {
        return std::unexpected(periods.error());
    }
    const auto& values = **periods;
    std::vector<std::uint8_t> mask(values.size(), 0);
    for (std::size_t row = 0; row < values.size(); ++row) {
        mask[row] = values[row] <= selection.max_period ? 1 : 0;
    }
    return runtime::select_rows(table, mask);
}

auto calculate_variance(double current, double prior) -> Variance {
    return Variance{
        .amount = current - prior,
        .percent = prior != 0.0 ? (current - prior) / std::abs(prior) * 100.0 : 0.0,
    };
}

}  // namespace tally::period
