#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tally {

/// Outcome of a non-throwing validation pass. All problems are collected.
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;

    void add_error(std::string message) {
        is_valid = false;
        errors.push_back(std::move(message));
    }
};

}  // namespace tally
