#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace helix::sandbox {

struct ExecutionResult {
    bool success = false;
    // Parsed JSON when stdout is valid JSON, otherwise the raw text.
    nlohmann::json output = "";
    std::string stderr_text;
    int exit_code = 0;
    double execution_time_ms = 0.0;
    std::optional<std::string> error;
};

// Stdout that parses as JSON becomes that value; anything else stays a string.
nlohmann::json ParseOutput(const std::string& stdout_text);

// {success, output, stderr, exitCode, executionTimeMs, error?}
nlohmann::json ToJson(const ExecutionResult& result);

// Result with a synthetic non-zero exit for failures outside the module.
ExecutionResult FailureResult(const std::string& message, double execution_time_ms = 0.0);

}  // namespace helix::sandbox
