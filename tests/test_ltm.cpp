#include <tally/period/ltm.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

namespace {

using tally::period::LtmRange;

auto movements() -> tally::runtime::Table {
    tally::runtime::Table table;
    table.add_column("year", tally::Column<std::int64_t>{2023, 2023, 2023, 2024, 2024, 2024});
    table.add_column("period", tally::Column<std::int64_t>{5, 7, 12, 1, 6, 3});
    table.add_column("movement_amount", tally::Column<double>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
    return table;
}

auto amounts_of(const tally::runtime::Table& table) -> std::vector<double> {
    const auto& column = std::get<tally::Column<double>>(*table.find("movement_amount"));
    return {column.begin(), column.end()};
}

}  // namespace

TEST_CASE("calculate_ltm_range spans the year boundary", "[period][ltm]") {
    auto ranges = tally::period::calculate_ltm_range(2024, 6, 12);

    REQUIRE(ranges == std::vector<LtmRange>{
                          LtmRange{.year = 2023, .start_period = 7, .end_period = 12},
                          LtmRange{.year = 2024, .start_period = 1, .end_period = 6},
                      });
    REQUIRE(tally::period::total_months(ranges) == 12);
    REQUIRE(tally::period::required_years(ranges) == std::vector<std::int64_t>{2023, 2024});
}

TEST_CASE("calculate_ltm_range edge cases", "[period][ltm]") {
    SECTION("window ending in December stays in one year") {
        auto ranges = tally::period::calculate_ltm_range(2024, 12);
        REQUIRE(ranges.size() == 1);
        REQUIRE(ranges[0] == LtmRange{.year = 2024, .start_period = 1, .end_period = 12});
    }

    SECTION("long windows cover several years") {
        auto ranges = tally::period::calculate_ltm_range(2024, 3, 27);
        REQUIRE(ranges.size() == 3);
        REQUIRE(ranges.front() == LtmRange{.year = 2022, .start_period = 1, .end_period = 12});
        REQUIRE(tally::period::total_months(ranges) == 27);
    }

    SECTION("short windows") {
        auto ranges = tally::period::calculate_ltm_range(2024, 6, 3);
        REQUIRE(ranges == std::vector<LtmRange>{
                              LtmRange{.year = 2024, .start_period = 4, .end_period = 6},
                          });
    }

    SECTION("invalid parameters give no ranges") {
        REQUIRE(tally::period::calculate_ltm_range(0, 6).empty());
        REQUIRE(tally::period::calculate_ltm_range(2024, 0).empty());
        REQUIRE(tally::period::calculate_ltm_range(2024, 13).empty());
        REQUIRE(tally::period::calculate_ltm_range(2024, 6, 0).empty());
        REQUIRE_FALSE(tally::period::is_valid_ltm_params(2024, 6, -1));
    }

    SECTION("range validity") {
        REQUIRE(tally::period::is_valid_range({.year = 2024, .start_period = 1, .end_period = 6}));
        REQUIRE_FALSE(
            tally::period::is_valid_range({.year = 2024, .start_period = 7, .end_period = 6}));
    }
}

TEST_CASE("latest_available_period", "[period][ltm]") {
    auto latest = tally::period::latest_available_period(movements());
    REQUIRE(latest.has_value());
    REQUIRE(*latest == tally::period::LatestPeriod{.year = 2024, .period = 6});

    REQUIRE_FALSE(tally::period::latest_available_period(tally::runtime::Table{}).has_value());
}

TEST_CASE("check_data_availability", "[period][ltm]") {
    auto ranges = tally::period::calculate_ltm_range(2024, 6);

    SECTION("missing year is named") {
        std::vector<std::int64_t> years{2024};
        auto report = tally::period::check_data_availability(ranges, years);
        REQUIRE_FALSE(report.complete);
        REQUIRE(report.actual_months == 12);
        REQUIRE(report.message == "Missing data for year(s): 2023");
    }

    SECTION("complete coverage") {
        std::vector<std::int64_t> years{2023, 2024};
        auto report = tally::period::check_data_availability(ranges, years);
        REQUIRE(report.complete);
        REQUIRE(report.message == "Complete LTM data available");
    }

    SECTION("partial coverage") {
        std::vector<std::int64_t> years{2024};
        auto short_ranges = tally::period::calculate_ltm_range(2024, 1, 1);
        auto report = tally::period::check_data_availability(short_ranges, years, 12);
        REQUIRE_FALSE(report.complete);
        REQUIRE(report.message == "Only 1 month available (need 12)");
    }

    SECTION("no ranges") {
        auto report = tally::period::check_data_availability({}, std::vector<std::int64_t>{2024});
        REQUIRE_FALSE(report.complete);
        REQUIRE(report.actual_months == 0);
        REQUIRE(report.message == "No LTM data available");
    }
}

TEST_CASE("LTM labels", "[period][ltm]") {
    auto ranges = tally::period::calculate_ltm_range(2024, 6);

    REQUIRE(tally::period::ltm_label(ranges) == "LTM (2023 P7 - 2024 P6)");
    REQUIRE(tally::period::ltm_short_label(ranges) == "LTM 2024 P6");
    REQUIRE(tally::period::ltm_label({}) == "LTM (No Data)");
    REQUIRE(tally::period::ltm_short_label({}) == "LTM");
}

TEST_CASE("filter_movements_for_ltm keeps rows inside the window", "[period][ltm]") {
    auto table = movements();
    auto ranges = tally::period::calculate_ltm_range(2024, 6);

    auto filtered = tally::period::filter_movements_for_ltm(table, ranges);

    REQUIRE(filtered.has_value());
    REQUIRE(amounts_of(*filtered) == std::vector<double>{2.0, 3.0, 4.0, 5.0, 6.0});

    auto none = tally::period::filter_movements_for_ltm(table, {});
    REQUIRE(none.has_value());
    REQUIRE(none->rows() == 0);
}

TEST_CASE("calculate_ltm_info composes the window", "[period][ltm]") {
    auto table = movements();

    SECTION("complete data") {
        std::vector<std::int64_t> years{2023, 2024};
        auto info = tally::period::calculate_ltm_info(table, years);
        REQUIRE(info.has_value());
        REQUIRE(info->latest == tally::period::LatestPeriod{.year = 2024, .period = 6});
        REQUIRE(info->ranges.size() == 2);
        REQUIRE(info->label == "LTM (2023 P7 - 2024 P6)");
        REQUIRE(info->has_complete_data);
        REQUIRE(info->table.rows() == 5);
    }

    SECTION("incomplete data") {
        std::vector<std::int64_t> years{2024};
        auto info = tally::period::calculate_ltm_info(table, years);
        REQUIRE(info.has_value());
        REQUIRE_FALSE(info->has_complete_data);
        REQUIRE(info->availability.message == "Missing data for year(s): 2023");
    }

    SECTION("empty dataset") {
        auto info = tally::period::calculate_ltm_info(tally::runtime::Table{}, {});
        REQUIRE(info.has_value());
        REQUIRE(info->ranges.empty());
        REQUIRE(info->label == "LTM (No Data)");
        REQUIRE_FALSE(info->has_complete_data);
    }
}
