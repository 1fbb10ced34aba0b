#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <boost/process/v1.hpp>

#include "worker/execution_unit.hpp"

namespace helix::worker {

// Execution unit hosted in a child process (`helix sandbox`) talking line
// delimited JSON over its stdin/stdout. A request unanswered after the
// timeout kills the child; a dead child is respawned on the next request.
class ProcessExecutionUnit : public ExecutionUnit {
public:
    // command[0] is the executable. A zero timeout waits forever.
    ProcessExecutionUnit(std::vector<std::string> command, std::chrono::seconds timeout);
    ~ProcessExecutionUnit() override;

    // Throws UnitError when the child cannot be started.
    void Start() override;
    void Stop() override;

    int Restarts() const { return restarts_; }

protected:
    nlohmann::json Exchange(const nlohmann::json& message) override;

private:
    void Spawn();
    void Terminate();
    void Restart(const std::string& reason);
    void ReadLoop(std::shared_ptr<boost::process::v1::ipstream> out, std::uint64_t generation);

    std::vector<std::string> command_;
    std::chrono::seconds timeout_;

    std::unique_ptr<boost::process::v1::child> child_;
    std::unique_ptr<boost::process::v1::opstream> in_;
    std::shared_ptr<boost::process::v1::ipstream> out_;
    std::thread reader_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<nlohmann::json> replies_;
    bool alive_ = false;
    std::uint64_t generation_ = 0;
    std::atomic<int> restarts_{0};
};

}  // namespace helix::worker
