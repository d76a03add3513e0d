#include <tally/io/definition.hpp>
#include <tally/io/movements_csv.hpp>
#include <tally/period/ltm.hpp>
#include <tally/period/period.hpp>
#include <tally/runtime/movements.hpp>
#include <tally/variables/resolver.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace {

struct ResolveOptions {
    std::string movements_path;
    std::string definition_path;
    std::string period = "All";
    int months = 12;
    bool verbose = false;
};

// Relabel every row with `year` so a trailing window aggregates as one bucket.
auto collapse_to_year(const tally::runtime::Table& table, std::int64_t year)
    -> tally::runtime::Table {
    tally::runtime::Table out = table;
    out.add_column(std::string(tally::runtime::kYearColumn),
                   tally::Column<std::int64_t>(std::vector<std::int64_t>(table.rows(), year)));
    return out;
}

void print_results(const tally::variables::ResolvedValues& values,
                   const std::vector<std::int64_t>& years, const std::string& column_label) {
    constexpr int kNameWidth = 28;
    constexpr int kValueWidth = 16;
    const bool with_variance = years.size() >= 2;

    fmt::print("{:<{}}", "variable", kNameWidth);
    for (auto year : years) {
        fmt::print("{:>{}}", column_label.empty() ? fmt::format("{}", year) : column_label,
                   kValueWidth);
    }
    if (with_variance) {
        fmt::print("{:>{}}{:>{}}", "variance", kValueWidth, "%", 10);
    }
    fmt::print("\n");

    for (const auto& [name, by_year] : values) {
        fmt::print("{:<{}}", name, kNameWidth);
        for (auto year : years) {
            auto it = by_year.find(year);
            fmt::print("{:>{}.2f}", it == by_year.end() ? 0.0 : it->second, kValueWidth);
        }
        if (with_variance) {
            auto prior = by_year.find(years[years.size() - 2]);
            auto current = by_year.find(years.back());
            auto variance = tally::period::calculate_variance(
                current == by_year.end() ? 0.0 : current->second,
                prior == by_year.end() ? 0.0 : prior->second);
            fmt::print("{:>{}.2f}{:>{}.1f}", variance.amount, kValueWidth, variance.percent, 10);
        }
        fmt::print("\n");
    }
}

auto run(const ResolveOptions& options) -> int {
    auto movements = tally::io::read_movements_csv(options.movements_path);
    if (!movements) {
        spdlog::error("{}", movements.error());
        return 1;
    }
    auto report = tally::io::load_definition(options.definition_path);
    if (!report) {
        spdlog::error("{}", report.error());
        return 1;
    }
    spdlog::info("report '{}' ({}): {} variable(s), {} movement row(s)", report->name,
                 report->report_id, report->variables.size(), movements->rows());

    bool definitions_ok = true;
    for (const auto& [name, definition] : report->variables) {
        auto validation = tally::variables::validate_variable(definition);
        for (const auto& error : validation.errors) {
            spdlog::error("variable '{}': {}", name, error);
        }
        definitions_ok = definitions_ok && validation.is_valid;
    }
    if (!definitions_ok) {
        return 1;
    }

    const auto years = tally::runtime::available_years(*movements);
    const auto selection = tally::period::parse_period(options.period);

    tally::runtime::Table working;
    std::string column_label;
    if (selection.is_ltm()) {
        auto info = tally::period::calculate_ltm_info(*movements, years, options.months);
        if (!info) {
            spdlog::error("{}", info.error());
            return 1;
        }
        if (!info->has_complete_data) {
            spdlog::warn("{}", info->availability.message);
        }
        column_label = info->short_label;
        working = collapse_to_year(info->table, info->latest.year);
        spdlog::info("{}", info->label);
    } else {
        auto restricted = tally::period::restrict_to_period(*movements, selection);
        if (!restricted) {
            spdlog::error("{}", restricted.error());
            return 1;
        }
        working = std::move(*restricted);
        spdlog::info("periods 1-{} ({})", selection.max_period,
                     tally::period::to_period_string(selection.max_period));
    }

    auto values = tally::variables::resolve_variables(report->variables, working);
    if (!values) {
        spdlog::error("{}", values.error().message);
        return 1;
    }
    print_results(*values, tally::runtime::available_years(working), column_label);
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tally_resolve: resolve report variables over trial-balance movements"};

    ResolveOptions options;
    app.add_option("movements", options.movements_path, "Movements CSV file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("definition", options.definition_path, "Report definition (YAML or JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-p,--period", options.period, "Period: All, LTM, Q1-Q4, P1-P12")
        ->capture_default_str();
    app.add_option("-m,--months", options.months, "Months in the trailing window (LTM only)")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", options.verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    return run(options);
}
