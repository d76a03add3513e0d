#include <tally/filter/filter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using tally::filter::FilterScalar;
using tally::filter::FilterSpec;
using tally::filter::FilterValue;
using tally::filter::RangeFilter;

auto str(const char* text) -> FilterScalar {
    return FilterScalar{std::string(text)};
}

auto movements() -> tally::runtime::Table {
    tally::runtime::Table table;
    table.add_column("year", tally::Column<std::int64_t>{2024, 2024, 2024, 2025, 2025});
    table.add_column("code1", tally::Column<std::string>{"700", "710", "800", "700", "450"});
    table.add_column("statement_type",
                     tally::Column<tally::Categorical>({"PL", "BS"}, {0, 0, 0, 0, 1}));
    table.add_column("name1", tally::Column<std::string>{"Revenue", "Revenue", "Opex", "Revenue",
                                                         "Cash"});
    table.add_column("movement_amount", tally::Column<double>{100.0, 50.0, -20.0, 500.0, 7.0});
    return table;
}

auto amounts_of(const tally::runtime::Table& table) -> std::vector<double> {
    const auto& column = std::get<tally::Column<double>>(*table.find("movement_amount"));
    return {column.begin(), column.end()};
}

auto mentions(const tally::ValidationResult& result, const std::string& needle) -> bool {
    return std::ranges::any_of(result.errors, [&](const std::string& error) {
        return error.find(needle) != std::string::npos;
    });
}

}  // namespace

TEST_CASE("Empty filter is the identity", "[filter]") {
    auto table = movements();

    auto filtered = tally::filter::apply_filter({}, table);

    REQUIRE(filtered.rows() == table.rows());
    REQUIRE(filtered.columns[0].column.get() == table.columns[0].column.get());
    REQUIRE(amounts_of(filtered) == amounts_of(table));
}

TEST_CASE("Scalar filters match exactly", "[filter]") {
    auto table = movements();

    SECTION("string value against a text column") {
        auto filtered = tally::filter::apply_filter({{"code1", str("700")}}, table);
        REQUIRE(amounts_of(filtered) == std::vector<double>{100.0, 500.0});
    }

    SECTION("numeric value against a numeric column") {
        auto filtered = tally::filter::apply_filter({{"year", FilterScalar{2025.0}}}, table);
        REQUIRE(amounts_of(filtered) == std::vector<double>{500.0, 7.0});
    }

    SECTION("numeric value never matches text that reads as a number") {
        auto filtered = tally::filter::apply_filter({{"code1", FilterScalar{710.0}}}, table);
        REQUIRE(filtered.rows() == 0);
    }

    SECTION("string value never matches a numeric column") {
        auto filtered = tally::filter::apply_filter({{"year", str("2025")}}, table);
        REQUIRE(filtered.rows() == 0);
    }

    SECTION("categorical column") {
        auto filtered = tally::filter::apply_filter({{"statement_type", str("BS")}}, table);
        REQUIRE(amounts_of(filtered) == std::vector<double>{7.0});
    }

    SECTION("no match gives an empty table with the same columns") {
        auto filtered = tally::filter::apply_filter({{"code1", str("999")}}, table);
        REQUIRE(filtered.rows() == 0);
        REQUIRE(filtered.column_names() == table.column_names());
    }
}

TEST_CASE("Account codes that differ only in spelling stay distinct", "[filter]") {
    tally::runtime::Table table;
    table.add_column("account_code", tally::Column<std::string>{"0100", "100", "1e2", "100.0"});
    table.add_column("movement_amount", tally::Column<double>{1.0, 2.0, 3.0, 4.0});

    REQUIRE(amounts_of(tally::filter::apply_filter({{"account_code", str("0100")}}, table)) ==
            std::vector<double>{1.0});
    REQUIRE(amounts_of(tally::filter::apply_filter({{"account_code", str("100")}}, table)) ==
            std::vector<double>{2.0});
    REQUIRE(tally::filter::apply_filter({{"account_code", FilterScalar{100.0}}}, table).rows() ==
            0);
}

TEST_CASE("Fields AND, list entries OR", "[filter]") {
    auto table = movements();
    FilterSpec spec{
        {"code1", FilterValue{std::vector<FilterScalar>{str("700"), str("800")}}},
        {"name1", str("Revenue")},
    };

    auto filtered = tally::filter::apply_filter(spec, table);

    REQUIRE(amounts_of(filtered) == std::vector<double>{100.0, 500.0});
}

TEST_CASE("Range filters conjoin their bounds", "[filter]") {
    auto table = movements();

    SECTION("string bounds compare lexicographically") {
        RangeFilter range{{"gte", str("700")}, {"lt", str("800")}};
        auto filtered = tally::filter::apply_filter({{"code1", range}}, table);
        REQUIRE(amounts_of(filtered) == std::vector<double>{100.0, 50.0, 500.0});
    }

    SECTION("numeric bounds compare numeric columns") {
        RangeFilter range{{"gt", FilterScalar{2024.0}}, {"lte", FilterScalar{2025.0}}};
        auto filtered = tally::filter::apply_filter({{"year", range}}, table);
        REQUIRE(amounts_of(filtered) == std::vector<double>{500.0, 7.0});
    }

    SECTION("numeric bounds skip text cells") {
        RangeFilter range{{"gte", FilterScalar{0.0}}};
        auto filtered = tally::filter::apply_filter({{"code1", range}}, table);
        REQUIRE(filtered.rows() == 0);
    }
}

TEST_CASE("apply_filter throws on a missing column", "[filter]") {
    tally::runtime::Table table;
    table.add_column("year", tally::Column<std::int64_t>{2024});

    REQUIRE_THROWS_AS(tally::filter::apply_filter({{"code1", str("700")}}, table),
                      std::runtime_error);
}

TEST_CASE("validate_filter collects every problem", "[filter][validation]") {
    SECTION("valid specs pass") {
        FilterSpec spec{
            {"code1", str("700")},
            {"code2", FilterValue{std::vector<FilterScalar>{str("a"), FilterScalar{1.0}}}},
            {"account_code", FilterValue{RangeFilter{{"gte", str("1000")}, {"lte", str("1999")}}}},
        };
        auto result = tally::filter::validate_filter(spec);
        REQUIRE(result.is_valid);
        REQUIRE(result.errors.empty());
    }

    SECTION("each offending field is named") {
        FilterSpec spec{
            {"bogus", str("x")},
            {"code1", FilterScalar{}},
            {"code2", FilterValue{std::vector<FilterScalar>{}}},
            {"code3", FilterValue{std::vector<FilterScalar>{str("a"), FilterScalar{}}}},
            {"name1", FilterValue{RangeFilter{}}},
            {"name2", FilterValue{RangeFilter{{"between", str("a")}}}},
            {"name3", FilterValue{RangeFilter{{"gte", FilterScalar{}}}}},
            {"statement_type", FilterValue{RangeFilter{{"gte", str("a")}, {"lte", FilterScalar{5.0}}}}},
        };
        auto result = tally::filter::validate_filter(spec);
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors.size() == 8);
        for (const char* field :
             {"bogus", "code1", "code2", "code3", "name1", "name2", "name3", "statement_type"}) {
            REQUIRE(mentions(result, "'" + std::string(field) + "'"));
        }
    }
}

TEST_CASE("apply_filter_safe reports typed errors", "[filter]") {
    auto table = movements();

    SECTION("validation failure") {
        auto result = tally::filter::apply_filter_safe({{"bogus", str("x")}}, table);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tally::filter::FilterErrorKind::Validation);
        REQUIRE(result.error().details.size() == 1);
    }

    SECTION("application failure") {
        tally::runtime::Table bare;
        bare.add_column("year", tally::Column<std::int64_t>{2024});
        auto result = tally::filter::apply_filter_safe({{"code2", str("x")}}, bare);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tally::filter::FilterErrorKind::Application);
    }

    SECTION("success") {
        auto result = tally::filter::apply_filter_safe({{"name1", str("Opex")}}, table);
        REQUIRE(result.has_value());
        REQUIRE(amounts_of(*result) == std::vector<double>{-20.0});
    }
}

TEST_CASE("combine_filters narrows successively", "[filter]") {
    auto table = movements();
    std::vector<FilterSpec> specs{
        {{"statement_type", str("PL")}},
        {{"name1", str("Revenue")}},
        {{"code1", str("700")}},
    };

    auto result = tally::filter::combine_filters(specs, table);

    REQUIRE(result.has_value());
    REQUIRE(amounts_of(*result) == std::vector<double>{100.0, 500.0});
}

TEST_CASE("RowPredicate masks rows without copying", "[filter]") {
    auto table = movements();
    auto predicate = tally::filter::compile_filter({{"name1", str("Revenue")}});

    REQUIRE_FALSE(predicate.matches_all());
    auto mask = predicate.mask(table);
    REQUIRE(mask.has_value());
    REQUIRE(*mask == std::vector<std::uint8_t>{1, 1, 0, 1, 0});

    auto everything = tally::filter::compile_filter({});
    REQUIRE(everything.matches_all());
    REQUIRE(everything.mask(table).value() == std::vector<std::uint8_t>(5, 1));
}
