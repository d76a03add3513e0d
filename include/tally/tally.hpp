#pragma once

/// Convenience umbrella header for the tally library.

#include <tally/core/column.hpp>
#include <tally/core/validation.hpp>
#include <tally/expr/evaluator.hpp>
#include <tally/expr/parser.hpp>
#include <tally/filter/filter.hpp>
#include <tally/period/ltm.hpp>
#include <tally/period/period.hpp>
#include <tally/runtime/movements.hpp>
#include <tally/runtime/table.hpp>
#include <tally/variables/resolver.hpp>
