#pragma once

#include <tally/variables/resolver.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace tally::io {

/// A report definition as stored on disk.
struct ReportDefinition {
    std::string report_id;
    std::string name;
    std::string version;
    std::string statement_type;
    variables::VariableRegistry variables;
};

/// Parse a YAML (or JSON) report definition.
///
/// Filter values may be scalars, sequences or maps of range operators.
/// Nulls are kept so that validation can report them. An unknown aggregate
/// name is an error here.
[[nodiscard]] auto parse_definition(std::string_view text)
    -> std::expected<ReportDefinition, std::string>;

[[nodiscard]] auto load_definition(std::string_view path)
    -> std::expected<ReportDefinition, std::string>;

}  // namespace tally::io
