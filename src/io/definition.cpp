#include <tally/io/definition.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace tally::io {

namespace {

using filter::FilterScalar;
using filter::FilterSpec;
using filter::FilterValue;
using filter::RangeFilter;

auto scalar_of(const YAML::Node& node, std::string_view where)
    -> std::expected<FilterScalar, std::string> {
    if (!node.IsDefined() || node.IsNull()) {
        return FilterScalar{};
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("{}: expected a scalar value", where));
    }
    // Filterable fields are classification text, so a plain `0100` keeps its
    // spelling rather than collapsing to the number 100.
    return FilterScalar{node.Scalar()};
}

auto string_field(const YAML::Node& node, const char* key) -> std::string {
    const YAML::Node value = node[key];
    if (!value.IsDefined() || value.IsNull() || !value.IsScalar()) {
        return {};
    }
    return value.Scalar();
}

auto parse_filter(const YAML::Node& node, const std::string& variable)
    -> std::expected<FilterSpec, std::string> {
    FilterSpec spec;
    if (!node.IsDefined() || node.IsNull()) {
        return spec;
    }
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("variable '{}': filter must be a mapping", variable));
    }
    for (const auto& entry : node) {
        auto field = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        auto where = fmt::format("variable '{}', filter '{}'", variable, field);

        if (value.IsSequence()) {
            std::vector<FilterScalar> items;
            items.reserve(value.size());
            for (const auto& item : value) {
                auto scalar = scalar_of(item, where);
                if (!scalar) {
                    return std::unexpected(scalar.error());
                }
                items.push_back(std::move(*scalar));
            }
            spec.emplace(std::move(field), FilterValue{std::move(items)});
        } else if (value.IsMap()) {
            RangeFilter range;
            for (const auto& bound : value) {
                auto scalar = scalar_of(bound.second, where);
                if (!scalar) {
                    return std::unexpected(scalar.error());
                }
                range.emplace(bound.first.as<std::string>(), std::move(*scalar));
            }
            spec.emplace(std::move(field), FilterValue{std::move(range)});
        } else {
            auto scalar = scalar_of(value, where);
            if (!scalar) {
                return std::unexpected(scalar.error());
            }
            spec.emplace(std::move(field), FilterValue{std::move(*scalar)});
        }
    }
    return spec;
}

auto parse_variable(const std::string& name, const YAML::Node& node)
    -> std::expected<variables::VariableDefinition, std::string> {
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("variable '{}' must be a mapping", name));
    }
    variables::VariableDefinition definition;
    auto filter = parse_filter(node["filter"], name);
    if (!filter) {
        return std::unexpected(filter.error());
    }
    definition.filter = std::move(*filter);

    auto aggregate = string_field(node, "aggregate");
    if (!aggregate.empty()) {
        auto fn = variables::parse_aggregate(aggregate);
        if (!fn.has_value()) {
            return std::unexpected(fmt::format(
                "variable '{}': unknown aggregate '{}' (expected sum, average, count, min, max, "
                "first or last)",
                name, aggregate));
        }
        definition.aggregate = *fn;
    }
    definition.description = string_field(node, "description");
    if (node["expression"]) {
        definition.expression = string_field(node, "expression");
    }
    return definition;
}

auto build_definition(const YAML::Node& root) -> std::expected<ReportDefinition, std::string> {
    if (!root.IsMap()) {
        return std::unexpected("report definition must be a mapping");
    }
    ReportDefinition report{
        .report_id = string_field(root, "reportId"),
        .name = string_field(root, "name"),
        .version = string_field(root, "version"),
        .statement_type = string_field(root, "statementType"),
        .variables = {},
    };
    const YAML::Node vars = root["variables"];
    if (!vars.IsDefined() || vars.IsNull()) {
        return report;
    }
    if (!vars.IsMap()) {
        return std::unexpected("'variables' must be a mapping of name to definition");
    }
    for (const auto& entry : vars) {
        auto name = entry.first.as<std::string>();
        auto definition = parse_variable(name, entry.second);
        if (!definition) {
            return std::unexpected(definition.error());
        }
        report.variables.emplace(std::move(name), std::move(*definition));
    }
    return report;
}

}  // namespace

auto parse_definition(std::string_view text) -> std::expected<ReportDefinition, std::string> {
    try {
        return build_definition(YAML::Load(std::string(text)));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("invalid report definition: {}", e.what()));
    }
}

auto load_definition(std::string_view path) -> std::expected<ReportDefinition, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected(fmt::format("failed to open report definition: {}", path));
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    auto report = parse_definition(buffer.str());
    if (report) {
        spdlog::debug("loaded report '{}' with {} variable(s) from {}", report->report_id,
                      report->variables.size(), path);
    }
    return report;
}

}  // namespace tally::io
