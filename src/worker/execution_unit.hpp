#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>

#include "module/module_source.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"
#include "worker/sandbox_protocol.hpp"
#include "worker/sandbox_runtime.hpp"

namespace helix::worker {

// The execution unit stopped answering: timed out, died or was stopped.
class UnitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Isolated context that runs modules. The dispatcher talks to it only through
// request/reply messages, one outstanding request at a time, so requests are
// processed in submission order.
class ExecutionUnit {
public:
    virtual ~ExecutionUnit() = default;

    virtual void Start() = 0;
    virtual void Stop() = 0;

    // Never throws: a unit failure becomes a failed result.
    helix::sandbox::ExecutionResult Execute(const ExecuteRequest& request);
    bool Ping();
    // Throws UnitError.
    void ClearCache();

protected:
    // Sends one message and waits for its reply. Throws UnitError.
    virtual nlohmann::json Exchange(const nlohmann::json& message) = 0;

private:
    std::mutex exchange_mutex_;
};

// Runs the sandbox runtime on a dedicated thread of this process. There is
// no watchdog: a runaway module blocks the unit.
class InProcessExecutionUnit : public ExecutionUnit {
public:
    InProcessExecutionUnit(helix::module::ModuleSource& source,
                           std::size_t cache_capacity,
                           std::uint32_t stack_size_bytes);
    ~InProcessExecutionUnit() override;

    void Start() override;
    void Stop() override;

protected:
    nlohmann::json Exchange(const nlohmann::json& message) override;

private:
    struct Job {
        nlohmann::json message;
        std::promise<nlohmann::json> reply;
    };

    void Run();

    SandboxRuntime runtime_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Job> jobs_;
    bool running_ = false;
    std::thread thread_;
};

}  // namespace helix::worker
