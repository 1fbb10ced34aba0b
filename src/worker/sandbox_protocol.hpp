#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"

namespace helix::worker {

// Messages between the dispatcher and the execution unit, one JSON object
// per line: execute/result, ping/pong, clear-cache/cache-cleared, error.
struct ExecuteRequest {
    std::string task_id;
    std::string module_path;
    std::string input;
};

nlohmann::json EncodeExecute(const ExecuteRequest& request);
// Throws std::invalid_argument without a module path.
ExecuteRequest DecodeExecute(const nlohmann::json& message);

nlohmann::json EncodeResult(const std::string& task_id, const helix::sandbox::ExecutionResult& result);
helix::sandbox::ExecutionResult DecodeResult(const nlohmann::json& message);

nlohmann::json MakeMessage(const std::string& type);
nlohmann::json MakeError(const std::string& error);
std::string MessageType(const nlohmann::json& message);

// Single-line dump. Module output is untrusted, so invalid UTF-8 is replaced
// rather than thrown on.
std::string DumpLine(const nlohmann::json& message);

}  // namespace helix::worker
