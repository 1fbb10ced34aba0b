#include "worker/task_requester.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "worker/task.hpp"

namespace helix::worker {

nlohmann::json ToJson(const SubmitResult& result) {
    return nlohmann::json{
        {"task_id", result.task_id},
        {"success", result.success},
        {"output", result.output},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr)},
        {"execution_time_ms", result.execution_time_ms},
        {"worker_id", result.worker_id}
    };
}

nlohmann::json ToJson(const WorkerProbe& probe) {
    nlohmann::json data = {{"available", probe.available}};
    if (probe.available) {
        data["workers"] = probe.workers;
        data["worker_id"] = probe.worker_id;
        data["latency_ms"] = probe.latency_ms;
    } else {
        data["error"] = probe.error.value_or("unknown error");
    }
    return data;
}

TaskRequester::TaskRequester(helix::bus::Transport& transport, std::string task_subject, std::string ping_subject)
    : transport_(transport)
    , task_subject_(std::move(task_subject))
    , ping_subject_(std::move(ping_subject)) {}

SubmitResult TaskRequester::Execute(const std::string& module_ref,
                                    const std::string& input,
                                    std::chrono::milliseconds timeout) {
    SubmitResult result{};
    result.task_id = helix::utils::GenerateId(8);
    const Task task{result.task_id, module_ref, input};

    helix::utils::LogInfo("requester", "submitting task " + task.id + ": " + module_ref);
    const auto reply = transport_.Request(task_subject_, EncodeTask(task).dump(), timeout);
    if (!reply) {
        result.error = "execution timed out after " + std::to_string(timeout.count())
            + "ms (no workers available?)";
        return result;
    }

    const auto data = nlohmann::json::parse(reply->payload, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        result.error = "malformed reply from worker";
        return result;
    }
    if (data.contains("worker_id") && data["worker_id"].is_string()) {
        result.worker_id = data["worker_id"].get<std::string>();
    }
    if (data.contains("error") && data["error"].is_string()) {
        result.error = data["error"].get<std::string>();
    }
    result.success = data.contains("success") && data["success"].is_boolean()
        && data["success"].get<bool>() && !result.error;
    result.output = data.contains("output") ? data["output"] : nlohmann::json(nullptr);
    if (data.contains("execution_time_ms") && data["execution_time_ms"].is_number()) {
        result.execution_time_ms = data["execution_time_ms"].get<double>();
    }
    return result;
}

WorkerProbe TaskRequester::CheckWorkers(std::chrono::milliseconds timeout) {
    WorkerProbe probe{};
    const auto sent_ms = helix::utils::NowMs();
    try {
        const nlohmann::json ping = {{"type", "ping"}, {"timestamp", sent_ms}};
        const auto reply = transport_.Request(ping_subject_, ping.dump(), timeout);
        if (!reply) {
            probe.error = "no worker answered within " + std::to_string(timeout.count()) + "ms";
            return probe;
        }
        const auto data = nlohmann::json::parse(reply->payload, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            probe.error = "malformed ping reply";
            return probe;
        }
        probe.available = true;
        probe.workers = data.contains("workers") && data["workers"].is_number_integer()
            ? data["workers"].get<int>()
            : 1;
        if (data.contains("worker_id") && data["worker_id"].is_string()) {
            probe.worker_id = data["worker_id"].get<std::string>();
        }
        probe.latency_ms = static_cast<double>(helix::utils::NowMs() - sent_ms);
    } catch (const helix::bus::BusError& ex) {
        probe.error = ex.what();
    }
    return probe;
}

}  // namespace helix::worker
