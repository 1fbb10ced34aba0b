#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "bus/transport.hpp"
#include "nlohmann/json.hpp"

namespace helix::worker {

struct SubmitResult {
    std::string task_id;
    bool success = false;
    nlohmann::json output;
    std::optional<std::string> error;
    double execution_time_ms = 0.0;
    std::string worker_id;
};

struct WorkerProbe {
    bool available = false;
    int workers = 0;
    std::string worker_id;
    double latency_ms = 0.0;
    std::optional<std::string> error;
};

nlohmann::json ToJson(const SubmitResult& result);
nlohmann::json ToJson(const WorkerProbe& probe);

// Publisher side of the task protocol.
class TaskRequester {
public:
    TaskRequester(helix::bus::Transport& transport, std::string task_subject, std::string ping_subject);

    // No answer within the timeout is a failed result, not an exception.
    // Throws bus::BusError when the request cannot be sent.
    SubmitResult Execute(const std::string& module_ref,
                         const std::string& input,
                         std::chrono::milliseconds timeout);

    // Never throws.
    WorkerProbe CheckWorkers(std::chrono::milliseconds timeout);

private:
    helix::bus::Transport& transport_;
    std::string task_subject_;
    std::string ping_subject_;
};

}  // namespace helix::worker
