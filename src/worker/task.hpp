#pragma once

#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"

namespace helix::worker {

struct Task {
    std::string id;
    std::string module_ref;
    std::string input;
};

// A task envelope that could not be decoded. Carries the task id when the
// envelope got far enough to name one.
class TaskDecodeError : public std::runtime_error {
public:
    TaskDecodeError(const std::string& message, std::string task_id = "");
    const std::string& TaskId() const { return task_id_; }

private:
    std::string task_id_;
};

// Accepts `wasm_path` as an alias of `module_ref`. A non-string input is
// passed on as its JSON text. Throws TaskDecodeError.
Task DecodeTask(const std::string& payload);
nlohmann::json EncodeTask(const Task& task);

nlohmann::json MakeTaskReply(const std::string& task_id,
                             const std::string& worker_id,
                             const helix::sandbox::ExecutionResult& result);
nlohmann::json MakeCapacityReply(const std::string& task_id, const std::string& worker_id);
nlohmann::json MakeDecodeErrorReply(const TaskDecodeError& error, const std::string& worker_id);
nlohmann::json MakePingReply(const std::string& worker_id);

}  // namespace helix::worker
