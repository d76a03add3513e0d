#include <tally/tally.hpp>

#include <fmt/core.h>

auto main() -> int {
    // A tiny trial balance: revenue (code1 = 700) and cost of sales (code1 = 600)
    // over the last two periods of 2023 and the first two of 2024.
    tally::runtime::Table movements;
    movements.add_column("year", tally::Column<std::int64_t>{2023, 2023, 2024, 2024, 2024, 2024});
    movements.add_column("period", tally::Column<std::int64_t>{11, 12, 1, 1, 2, 2});
    movements.add_column("code1",
                         tally::Column<std::string>{"700", "600", "700", "600", "700", "600"});
    movements.add_column("movement_amount",
                         tally::Column<double>{-1200.0, 500.0, -1000.0, 450.0, -1100.0, 480.0});

    fmt::print("=== Expressions ===\n");
    auto value = tally::expr::evaluate_expression("(revenue - cogs) / revenue * 100",
                                                  {{"revenue", 2000.0}, {"cogs", 800.0}});
    if (value) {
        fmt::print("margin: {:.1f}%\n", *value);
    }

    fmt::print("\n=== Variables ===\n");
    tally::variables::VariableRegistry registry;
    registry["revenue"] = tally::variables::VariableDefinition{
        .filter = {{"code1", tally::filter::FilterScalar{std::string("700")}}},
        .aggregate = tally::variables::AggregateFunction::Sum,
        .description = "Net revenue",
        .expression = std::nullopt,
    };
    registry["cogs"] = tally::variables::VariableDefinition{
        .filter = {{"code1", tally::filter::FilterScalar{std::string("600")}}},
        .aggregate = tally::variables::AggregateFunction::Sum,
        .description = "Cost of sales",
        .expression = std::nullopt,
    };
    registry["gross_profit"] = tally::variables::VariableDefinition{
        .filter = {},
        .aggregate = tally::variables::AggregateFunction::Sum,
        .description = "Gross profit",
        .expression = "-revenue - cogs",
    };

    auto resolved = tally::variables::resolve_variables(registry, movements);
    if (!resolved) {
        fmt::print("error: {}\n", resolved.error().message);
        return 1;
    }
    for (const auto& [name, by_year] : *resolved) {
        for (const auto& [year, amount] : by_year) {
            fmt::print("{:<14} {} {:>10.2f}\n", name, year, amount);
        }
    }

    fmt::print("\n=== LTM ===\n");
    auto years = tally::runtime::available_years(movements);
    auto info = tally::period::calculate_ltm_info(movements, years, 4);
    if (info) {
        fmt::print("{}: {} row(s), {}\n", info->label, info->table.rows(),
                   info->availability.message);
    }

    return 0;
}
