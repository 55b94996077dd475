#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "yieldvault/config/constants.hpp"


namespace yieldvault::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn" || value == "error" || value == "off") {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Batch size validator
// -------------------------------------------------------------
inline auto batch_size_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const unsigned long n = std::stoul(value);
            if (n >= 1 && n <= config::MAX_DEPOSIT_BATCH) {
                return {};
            }
        } catch (const std::exception&) {
            // fall through to the error message
        }
        return "Batch size must be between 1 and " + std::to_string(config::MAX_DEPOSIT_BATCH);
    },
    "Batch size validator"
);

} // namespace yieldvault::examples::cli
