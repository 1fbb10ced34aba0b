#include "worker/worker_client.hpp"

#include <exception>

#include "module/module_source.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "worker/sandbox_protocol.hpp"

namespace helix::worker {

const char* ToString(ClientState state) {
    switch (state) {
        case ClientState::kDisconnected: return "disconnected";
        case ClientState::kConnecting: return "connecting";
        case ClientState::kSubscribed: return "subscribed";
        case ClientState::kDispatching: return "dispatching";
    }
    return "unknown";
}

WorkerOptions MakeWorkerOptions(const helix::config::Config& config) {
    WorkerOptions options{};
    options.worker_id = config.worker.id.empty() ? GenerateWorkerId() : config.worker.id;
    options.task_subject = config.bus.task_subject;
    options.queue_group = config.bus.queue_group;
    options.ping_subject = config.bus.ping_subject;
    options.module_base = config.worker.module_base;
    options.max_pending = static_cast<std::size_t>(config.worker.max_pending);
    return options;
}

std::string GenerateWorkerId() {
    return "native-" + helix::utils::GenerateId(8);
}

nlohmann::json ToJson(const WorkerStatus& status) {
    return nlohmann::json{
        {"state", ToString(status.state)},
        {"worker_id", status.worker_id},
        {"in_flight", status.in_flight}
    };
}

WorkerClient::WorkerClient(helix::bus::Transport& transport, ExecutionUnit& unit, WorkerOptions options)
    : transport_(transport)
    , unit_(unit)
    , options_(std::move(options)) {
    if (options_.worker_id.empty()) {
        options_.worker_id = GenerateWorkerId();
    }
    if (options_.max_pending == 0) {
        options_.max_pending = 1;
    }
}

WorkerClient::~WorkerClient() {
    Stop();
}

void WorkerClient::Start() {
    if (running_) {
        return;
    }
    SetState(ClientState::kConnecting, "connecting");
    try {
        unit_.Start();
        transport_.SetStatusCallback([this](bool connected, const std::string& detail) {
            OnTransportStatus(connected, detail);
        });
        transport_.Connect();
        {
            // Deliveries are queued from here on; the dispatcher picks them up
            // once it starts.
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = true;
        }
        transport_.Subscribe(options_.task_subject, options_.queue_group,
                             [this](const helix::bus::Message& msg) { OnTask(msg); });
        transport_.Subscribe(options_.ping_subject, "",
                             [this](const helix::bus::Message& msg) { OnPing(msg); });
    } catch (const std::exception& ex) {
        helix::utils::LogError("worker", std::string("start failed: ") + ex.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        FailPending("worker failed to start");
        transport_.Close();
        unit_.Stop();
        SetState(ClientState::kDisconnected, ex.what());
        throw;
    }

    SetState(ClientState::kSubscribed, "subscribed");
    dispatcher_ = std::thread([this] { DispatchLoop(); });
    helix::utils::LogInfo("worker", options_.worker_id + " subscribed to " + options_.task_subject
        + " (group " + options_.queue_group + ")");
}

void WorkerClient::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    // Deliveries racing the close are answered directly by OnTask.
    transport_.Close();
    unit_.Stop();
    SetState(ClientState::kDisconnected, "stopped");
    helix::utils::LogInfo("worker", options_.worker_id + " stopped");
}

WorkerStatus WorkerClient::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStatus status{};
    status.state = state_;
    status.worker_id = options_.worker_id;
    status.in_flight = pending_.size() + (executing_ ? 1 : 0);
    return status;
}

void WorkerClient::SetStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callback_ = std::move(callback);
}

void WorkerClient::OnTask(const helix::bus::Message& msg) {
    Task task{};
    bool shutting_down = false;
    try {
        task = DecodeTask(msg.payload);
    } catch (const TaskDecodeError& ex) {
        helix::utils::LogWarn("worker", std::string("rejecting task: ") + ex.what());
        Reply(msg.reply_to, MakeDecodeErrorReply(ex, options_.worker_id));
        return;
    }

    helix::utils::LogInfo("worker", "received task " + task.id + ": " + task.module_ref);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            shutting_down = true;
        } else if (pending_.size() < options_.max_pending) {
            pending_.push(PendingTask{std::move(task), msg.reply_to});
            cv_.notify_one();
            return;
        }
    }
    if (shutting_down) {
        helix::utils::LogWarn("worker", "task " + task.id + " rejected: worker shutting down");
        Reply(msg.reply_to, MakeTaskReply(task.id, options_.worker_id,
                                          helix::sandbox::FailureResult("worker shutting down")));
        return;
    }
    helix::utils::LogWarn("worker", "task " + task.id + " rejected: worker at capacity");
    Reply(msg.reply_to, MakeCapacityReply(task.id, options_.worker_id));
}

void WorkerClient::OnPing(const helix::bus::Message& msg) {
    Reply(msg.reply_to, MakePingReply(options_.worker_id));
}

void WorkerClient::OnTransportStatus(bool connected, const std::string& detail) {
    if (connected) {
        return;
    }
    helix::utils::LogError("worker", "bus connection lost: " + detail);
    SetState(ClientState::kDisconnected, detail);
}

void WorkerClient::DispatchLoop() {
    while (true) {
        PendingTask pending{};
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !pending_.empty() || !running_; });
            if (!running_) {
                break;
            }
            pending = std::move(pending_.front());
            pending_.pop();
            executing_ = true;
        }
        Dispatch(pending);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            executing_ = false;
        }
    }

    FailPending("worker shutting down");
}

void WorkerClient::FailPending(const std::string& reason) {
    std::queue<PendingTask> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(pending_);
    }
    while (!remaining.empty()) {
        const auto& pending = remaining.front();
        Reply(pending.reply_to, MakeTaskReply(pending.task.id, options_.worker_id,
                                              helix::sandbox::FailureResult(reason)));
        remaining.pop();
    }
}

void WorkerClient::Dispatch(const PendingTask& pending) {
    SetState(ClientState::kDispatching, pending.task.id);
    ExecuteRequest request{};
    request.task_id = pending.task.id;
    request.module_path = helix::module::ResolveModuleAddress(options_.module_base, pending.task.module_ref);
    request.input = pending.task.input;

    const auto result = unit_.Execute(request);
    helix::utils::LogInfo("worker", "task " + pending.task.id + " completed: "
        + (result.success ? "success" : "failure") + " exit=" + std::to_string(result.exit_code));
    Reply(pending.reply_to, MakeTaskReply(pending.task.id, options_.worker_id, result));
    SetState(ClientState::kSubscribed, pending.task.id);
}

void WorkerClient::Reply(const std::string& reply_to, const nlohmann::json& payload) {
    if (reply_to.empty()) {
        helix::utils::LogWarn("worker", "message has no reply subject, dropping reply");
        return;
    }
    try {
        transport_.Publish(reply_to, DumpLine(payload));
    } catch (const helix::bus::BusError& ex) {
        helix::utils::LogError("worker", std::string("reply failed: ") + ex.what());
    }
}

void WorkerClient::SetState(ClientState state, const std::string& detail) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto previous = state_;
        bool allowed = true;
        switch (state) {
            case ClientState::kSubscribed:
                allowed = previous == ClientState::kConnecting || previous == ClientState::kDispatching;
                break;
            case ClientState::kDispatching:
                // A lost connection stays lost until the next Start().
                allowed = previous == ClientState::kSubscribed;
                break;
            default:
                break;
        }
        if (!allowed || previous == state) {
            return;
        }
        state_ = state;
        const bool task_edge = state == ClientState::kDispatching
            || previous == ClientState::kDispatching;
        if (!task_edge || state == ClientState::kDisconnected) {
            callback = status_callback_;
        }
    }
    if (callback) {
        callback(state, detail);
    }
}

}  // namespace helix::worker
