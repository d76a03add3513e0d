#include <tally/filter/filter.hpp>
#include <tally/io/movements_csv.hpp>
#include <tally/runtime/movements.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

auto write_csv(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto get_string_at(const tally::runtime::Table& table, const char* name, std::size_t row)
    -> std::string {
    if (const auto* col = std::get_if<tally::Column<std::string>>(table.find(name))) {
        return (*col)[row];
    }
    if (const auto* col = std::get_if<tally::Column<tally::Categorical>>(table.find(name))) {
        return std::string((*col)[row]);
    }
    return {};
}

}  // namespace

TEST_CASE("Read movements CSV", "[io][csv]") {
    auto path = tmp("tally_test_movements.csv");
    write_csv(path,
              "year,period,code1,name1,account_code,movement_amount\n"
              "2024,1,700,\"Sales, net\",7000,-1500.50\n"
              "2024,2,600,Cost of sales,6000,800\n"
              "2025,1,700,\"Sales, net\",7000,\n");

    auto table = tally::io::read_movements_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 3);

    const auto* years = std::get_if<tally::Column<std::int64_t>>(table->find("year"));
    REQUIRE(years != nullptr);
    REQUIRE((*years)[2] == 2025);

    const auto* amounts = std::get_if<tally::Column<double>>(table->find("movement_amount"));
    REQUIRE(amounts != nullptr);
    REQUIRE((*amounts)[0] == -1500.5);
    REQUIRE(std::isnan((*amounts)[2]));

    // Codes stay text even when they look numeric.
    REQUIRE_FALSE(std::holds_alternative<tally::Column<std::int64_t>>(*table->find("code1")));
    REQUIRE(get_string_at(*table, "code1", 1) == "600");
    REQUIRE(get_string_at(*table, "name1", 0) == "Sales, net");

    REQUIRE(tally::runtime::available_years(*table) == std::vector<std::int64_t>{2024, 2025});
}

TEST_CASE("Repeated text columns are dictionary-encoded", "[io][csv]") {
    std::string content = "year,period,statement_type,movement_amount\n";
    for (int period = 1; period <= 12; ++period) {
        for (int i = 0; i < 4; ++i) {
            content += "2024," + std::to_string(period) + ",PL,1\n";
        }
    }
    std::istringstream input(content);

    auto table = tally::io::parse_movements_csv(input);

    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 48);
    const auto* statement =
        std::get_if<tally::Column<tally::Categorical>>(table->find("statement_type"));
    REQUIRE(statement != nullptr);
    REQUIRE(statement->dictionary().size() == 1);
}

TEST_CASE("Legacy amount column name is accepted", "[io][csv]") {
    std::istringstream input("year,period,amount\n2024,3,12.5\n");

    auto table = tally::io::parse_movements_csv(input);

    REQUIRE(table.has_value());
    REQUIRE(tally::runtime::amount_column(*table).has_value());
}

TEST_CASE("Absent classification columns load as empty text", "[io][csv]") {
    std::istringstream input("year,period,code1,movement_amount\n2024,1,700,5\n2024,2,700,6\n");

    auto table = tally::io::parse_movements_csv(input);

    REQUIRE(table.has_value());
    for (auto field : tally::filter::kValidFields) {
        REQUIRE(table->contains(std::string(field)));
    }
    REQUIRE(get_string_at(*table, "account_code", 1).empty());
    REQUIRE(get_string_at(*table, "code1", 0) == "700");

    SECTION("a validated filter on a missing field applies without throwing") {
        using tally::filter::FilterScalar;
        using tally::filter::RangeFilter;
        tally::filter::FilterSpec spec{
            {"account_code", FilterScalar{std::string("1")}},
            {"code3", RangeFilter{{"gte", FilterScalar{std::string("a")}}}},
        };
        REQUIRE(tally::filter::validate_filter(spec).is_valid);

        tally::runtime::Table filtered;
        REQUIRE_NOTHROW(filtered = tally::filter::apply_filter(spec, *table));
        REQUIRE(filtered.rows() == 0);
    }
}

TEST_CASE("Movements CSV errors", "[io][csv]") {
    SECTION("missing file") {
        auto table = tally::io::read_movements_csv("/nonexistent/tally/movements.csv");
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().find("failed to open") != std::string::npos);
    }

    SECTION("missing required column") {
        std::istringstream input("year,movement_amount\n2024,1\n");
        auto table = tally::io::parse_movements_csv(input);
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().find("period") != std::string::npos);
    }

    SECTION("non-integer year") {
        std::istringstream input("year,period,movement_amount\nFY24,1,1\n");
        auto table = tally::io::parse_movements_csv(input);
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().find("row 1") != std::string::npos);
    }

    SECTION("non-numeric amount") {
        std::istringstream input("year,period,movement_amount\n2024,1,abc\n");
        auto table = tally::io::parse_movements_csv(input);
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().find("movement_amount") != std::string::npos);
    }
}
