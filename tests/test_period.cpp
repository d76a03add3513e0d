#include <tally/period/period.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using tally::period::PeriodSelection;
using tally::period::parse_period;

namespace {

auto ytd(int max_period) -> PeriodSelection {
    return PeriodSelection{.kind = PeriodSelection::Kind::YearToDate, .max_period = max_period};
}

}  // namespace

TEST_CASE("parse_period", "[period]") {
    REQUIRE(parse_period("All") == ytd(12));
    REQUIRE(parse_period("") == ytd(12));
    REQUIRE(parse_period("LTM").is_ltm());
    REQUIRE(parse_period("Q1") == ytd(3));
    REQUIRE(parse_period("Q4") == ytd(12));
    REQUIRE(parse_period("P6") == ytd(6));
    REQUIRE(parse_period("P12") == ytd(12));
    REQUIRE(parse_period("7") == ytd(7));

    SECTION("anything else selects the whole year") {
        REQUIRE(parse_period("Q5") == ytd(12));
        REQUIRE(parse_period("P13") == ytd(12));
        REQUIRE(parse_period("ltm") == ytd(12));
        REQUIRE(parse_period("last year") == ytd(12));
    }
}

TEST_CASE("Period string helpers", "[period]") {
    REQUIRE(tally::period::to_period_string(6) == "P6");
    REQUIRE(tally::period::to_period_string(0) == "P12");
    REQUIRE(tally::period::period_to_quarter(1) == 1);
    REQUIRE(tally::period::period_to_quarter(6) == 2);
    REQUIRE(tally::period::period_to_quarter(12) == 4);
}

TEST_CASE("restrict_to_period keeps year-to-date rows", "[period]") {
    tally::runtime::Table table;
    table.add_column("year", tally::Column<std::int64_t>{2024, 2024, 2024, 2025});
    table.add_column("period", tally::Column<std::int64_t>{1, 6, 7, 3});

    auto restricted = tally::period::restrict_to_period(table, parse_period("Q2"));
    REQUIRE(restricted.has_value());
    const auto& periods = std::get<tally::Column<std::int64_t>>(*restricted->find("period"));
    REQUIRE(periods.size() == 3);
    REQUIRE(periods[2] == 3);

    REQUIRE_FALSE(tally::period::restrict_to_period(table, parse_period("LTM")).has_value());

    tally::runtime::Table no_period;
    no_period.add_column("year", tally::Column<std::int64_t>{2024});
    REQUIRE_FALSE(tally::period::restrict_to_period(no_period, ytd(12)).has_value());
}

TEST_CASE("calculate_variance", "[period][variance]") {
    auto growth = tally::period::calculate_variance(150.0, 100.0);
    REQUIRE(growth.amount == 50.0);
    REQUIRE(growth.percent == Catch::Approx(50.0));

    auto from_negative = tally::period::calculate_variance(-50.0, -100.0);
    REQUIRE(from_negative.amount == 50.0);
    REQUIRE(from_negative.percent == Catch::Approx(50.0));

    auto from_zero = tally::period::calculate_variance(10.0, 0.0);
    REQUIRE(from_zero.amount == 10.0);
    REQUIRE(from_zero.percent == 0.0);
}
