#include "sandbox/execution_result.hpp"

#include "sandbox/sandbox_executor.hpp"

namespace helix::sandbox {

nlohmann::json ParseOutput(const std::string& stdout_text) {
    auto parsed = nlohmann::json::parse(stdout_text, nullptr, false);
    if (parsed.is_discarded()) {
        return stdout_text;
    }
    return parsed;
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json data = {
        {"success", result.success},
        {"output", result.output},
        {"stderr", result.stderr_text},
        {"exitCode", result.exit_code},
        {"executionTimeMs", result.execution_time_ms}
    };
    if (result.error) {
        data["error"] = *result.error;
    }
    return data;
}

ExecutionResult FailureResult(const std::string& message, double execution_time_ms) {
    ExecutionResult result{};
    result.success = false;
    result.exit_code = kTrapExitCode;
    result.execution_time_ms = execution_time_ms;
    result.error = message;
    return result;
}

}  // namespace helix::sandbox
