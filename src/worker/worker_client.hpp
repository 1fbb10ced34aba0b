#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "bus/transport.hpp"
#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "worker/execution_unit.hpp"
#include "worker/task.hpp"

namespace helix::worker {

enum class ClientState {
    kDisconnected,
    kConnecting,
    kSubscribed,
    kDispatching
};

const char* ToString(ClientState state);

struct WorkerOptions {
    std::string worker_id;
    std::string task_subject = "helix.tasks.wasm";
    std::string queue_group = "wasm-workers";
    std::string ping_subject = "helix.tasks.wasm.ping";
    std::string module_base;
    std::size_t max_pending = 16;
};

WorkerOptions MakeWorkerOptions(const helix::config::Config& config);

// "native-" followed by 8 hex digits.
std::string GenerateWorkerId();

struct WorkerStatus {
    ClientState state = ClientState::kDisconnected;
    std::string worker_id;
    // Queued plus executing.
    std::size_t in_flight = 0;
};

nlohmann::json ToJson(const WorkerStatus& status);

// Member of the worker group on the task subject. Deliveries arrive on the
// transport thread and are queued; one dispatch thread hands them to the
// execution unit in delivery order. Liveness probes are answered directly on
// the transport thread so a long task does not delay them.
class WorkerClient {
public:
    using StatusCallback = std::function<void(ClientState state, const std::string& detail)>;

    WorkerClient(helix::bus::Transport& transport, ExecutionUnit& unit, WorkerOptions options);
    ~WorkerClient();

    WorkerClient(const WorkerClient&) = delete;
    WorkerClient& operator=(const WorkerClient&) = delete;

    // Throws bus::BusError or UnitError; the client is Disconnected afterwards.
    void Start();
    // Pending tasks are answered with a shutdown error before the bus closes.
    void Stop();

    WorkerStatus Status() const;
    const std::string& WorkerId() const { return options_.worker_id; }

    // Called on connection-level changes: Connecting, Subscribed and
    // Disconnected.
    void SetStatusCallback(StatusCallback callback);

private:
    struct PendingTask {
        Task task;
        std::string reply_to;
    };

    void OnTask(const helix::bus::Message& msg);
    void OnPing(const helix::bus::Message& msg);
    void OnTransportStatus(bool connected, const std::string& detail);
    void DispatchLoop();
    // Answers every queued task with a failed result.
    void FailPending(const std::string& reason);
    void Dispatch(const PendingTask& pending);
    void Reply(const std::string& reply_to, const nlohmann::json& payload);
    void SetState(ClientState state, const std::string& detail);

    helix::bus::Transport& transport_;
    ExecutionUnit& unit_;
    WorkerOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<PendingTask> pending_;
    bool executing_ = false;
    ClientState state_ = ClientState::kDisconnected;
    StatusCallback status_callback_;

    // Written under mutex_.
    std::atomic<bool> running_{false};
    std::thread dispatcher_;
};

}  // namespace helix::worker
