#include "worker/task.hpp"

#include "utils/common.hpp"

namespace helix::worker {
namespace {

std::string AsText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

TaskDecodeError::TaskDecodeError(const std::string& message, std::string task_id)
    : std::runtime_error(message)
    , task_id_(std::move(task_id)) {}

Task DecodeTask(const std::string& payload) {
    const auto data = nlohmann::json::parse(payload, nullptr, false);
    if (data.is_discarded()) {
        throw TaskDecodeError("task payload is not valid JSON");
    }
    if (!data.is_object()) {
        throw TaskDecodeError("task payload must be a JSON object");
    }

    Task task{};
    if (!data.contains("task_id") || data["task_id"].is_null()) {
        throw TaskDecodeError("task payload has no task_id");
    }
    if (!data["task_id"].is_string() && !data["task_id"].is_number()) {
        throw TaskDecodeError("task_id must be a string");
    }
    task.id = AsText(data["task_id"]);

    const char* ref_key = data.contains("module_ref") ? "module_ref" : "wasm_path";
    if (!data.contains(ref_key) || !data[ref_key].is_string()
        || data[ref_key].get<std::string>().empty()) {
        throw TaskDecodeError("task " + task.id + " has no module_ref", task.id);
    }
    task.module_ref = data[ref_key].get<std::string>();

    if (data.contains("input") && !data["input"].is_null()) {
        task.input = AsText(data["input"]);
    }
    return task;
}

nlohmann::json EncodeTask(const Task& task) {
    return nlohmann::json{
        {"task_id", task.id},
        {"module_ref", task.module_ref},
        {"input", task.input},
        {"timestamp", helix::utils::NowMs()}
    };
}

nlohmann::json MakeTaskReply(const std::string& task_id,
                             const std::string& worker_id,
                             const helix::sandbox::ExecutionResult& result) {
    nlohmann::json reply = {
        {"task_id", task_id},
        {"worker_id", worker_id},
        {"success", result.success},
        {"output", result.output},
        {"stderr", result.stderr_text},
        {"exit_code", result.exit_code},
        {"execution_time_ms", result.execution_time_ms}
    };
    reply["error"] = result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr);
    return reply;
}

nlohmann::json MakeCapacityReply(const std::string& task_id, const std::string& worker_id) {
    return nlohmann::json{
        {"task_id", task_id},
        {"worker_id", worker_id},
        {"success", false},
        {"output", nullptr},
        {"error", "worker at capacity"}
    };
}

nlohmann::json MakeDecodeErrorReply(const TaskDecodeError& error, const std::string& worker_id) {
    nlohmann::json reply = {
        {"error", error.what()},
        {"worker_id", worker_id}
    };
    if (!error.TaskId().empty()) {
        reply["task_id"] = error.TaskId();
        reply["success"] = false;
    }
    return reply;
}

nlohmann::json MakePingReply(const std::string& worker_id) {
    return nlohmann::json{
        {"worker_id", worker_id},
        {"workers", 1},
        {"timestamp", helix::utils::NowMs()}
    };
}

}  // namespace helix::worker
