#include "worker/sandbox_protocol.hpp"

#include <stdexcept>

namespace helix::worker {
namespace {

std::string StringField(const nlohmann::json& message, const char* key) {
    if (message.contains(key) && message[key].is_string()) {
        return message[key].get<std::string>();
    }
    return "";
}

}  // namespace

nlohmann::json EncodeExecute(const ExecuteRequest& request) {
    auto message = MakeMessage("execute");
    message["taskId"] = request.task_id;
    message["modulePath"] = request.module_path;
    message["input"] = request.input;
    return message;
}

ExecuteRequest DecodeExecute(const nlohmann::json& message) {
    ExecuteRequest request{};
    request.task_id = StringField(message, "taskId");
    request.module_path = StringField(message, "modulePath");
    if (request.module_path.empty()) {
        throw std::invalid_argument("execute request has no modulePath");
    }
    request.input = StringField(message, "input");
    return request;
}

nlohmann::json EncodeResult(const std::string& task_id, const helix::sandbox::ExecutionResult& result) {
    auto message = helix::sandbox::ToJson(result);
    message["type"] = "result";
    message["taskId"] = task_id;
    return message;
}

helix::sandbox::ExecutionResult DecodeResult(const nlohmann::json& message) {
    helix::sandbox::ExecutionResult result{};
    result.success = message.value("success", false);
    result.output = message.contains("output") ? message["output"] : nlohmann::json("");
    result.stderr_text = StringField(message, "stderr");
    result.exit_code = message.value("exitCode", 0);
    result.execution_time_ms = message.value("executionTimeMs", 0.0);
    if (message.contains("error") && message["error"].is_string()) {
        result.error = message["error"].get<std::string>();
    }
    return result;
}

nlohmann::json MakeMessage(const std::string& type) {
    return nlohmann::json{{"type", type}};
}

nlohmann::json MakeError(const std::string& error) {
    auto message = MakeMessage("error");
    message["error"] = error;
    return message;
}

std::string MessageType(const nlohmann::json& message) {
    if (!message.is_object()) {
        return "";
    }
    return StringField(message, "type");
}

std::string DumpLine(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace helix::worker
