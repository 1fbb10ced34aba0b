#include "worker/process_execution_unit.hpp"

#include <csignal>
#include <istream>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace helix::worker {
namespace bp = boost::process::v1;
namespace {

// True once the pid has been reaped.
bool WaitExit(pid_t pid, std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    int status = 0;
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid || waited < 0) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

}  // namespace

ProcessExecutionUnit::ProcessExecutionUnit(std::vector<std::string> command, std::chrono::seconds timeout)
    : command_(std::move(command))
    , timeout_(timeout) {}

ProcessExecutionUnit::~ProcessExecutionUnit() {
    Stop();
}

void ProcessExecutionUnit::Start() {
    if (command_.empty()) {
        throw UnitError("no execution unit command configured");
    }
    // A child that dies mid-write must not take the worker down with it.
    std::signal(SIGPIPE, SIG_IGN);
    if (!child_) {
        Spawn();
    }
}

void ProcessExecutionUnit::Stop() {
    Terminate();
}

void ProcessExecutionUnit::Spawn() {
    auto in = std::make_unique<bp::opstream>();
    auto out = std::make_shared<bp::ipstream>();
    std::vector<std::string> args(command_.begin() + 1, command_.end());
    auto executable = command_.front();
    if (executable.find('/') == std::string::npos) {
        const auto found = bp::search_path(executable);
        if (found.empty()) {
            throw UnitError("execution unit command not found: " + executable);
        }
        executable = found.string();
    }

    try {
        child_ = std::make_unique<bp::child>(
            executable,
            bp::args(args),
            bp::std_out > *out,
            bp::std_in < *in);
    } catch (const bp::process_error& ex) {
        throw UnitError(std::string("cannot start execution unit: ") + ex.what());
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<nlohmann::json>().swap(replies_);
        alive_ = true;
        generation = ++generation_;
    }
    in_ = std::move(in);
    out_ = out;
    reader_ = std::thread([this, out, generation] { ReadLoop(out, generation); });
    helix::utils::LogInfo("unit", "execution unit started (pid " + std::to_string(child_->id()) + ")");
}

void ProcessExecutionUnit::ReadLoop(std::shared_ptr<bp::ipstream> out, std::uint64_t generation) {
    std::string line;
    while (std::getline(*out, line)) {
        if (line.empty()) {
            continue;
        }
        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            helix::utils::LogWarn("unit", "dropping malformed line from execution unit");
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                return;
            }
            replies_.push(std::move(message));
        }
        cv_.notify_all();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            alive_ = false;
        }
    }
    cv_.notify_all();
}

void ProcessExecutionUnit::Terminate() {
    if (!child_) {
        return;
    }
    const pid_t pid = child_->id();
    if (in_) {
        in_->pipe().close();
    }
    if (!WaitExit(pid, std::chrono::milliseconds(200))) {
        ::kill(pid, SIGTERM);
        if (!WaitExit(pid, std::chrono::seconds(2))) {
            ::kill(pid, SIGKILL);
            WaitExit(pid, std::chrono::seconds(2));
        }
    }
    child_->detach();
    if (reader_.joinable()) {
        reader_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alive_ = false;
        ++generation_;
    }
    child_.reset();
    in_.reset();
    out_.reset();
}

void ProcessExecutionUnit::Restart(const std::string& reason) {
    helix::utils::LogWarn("unit", "restarting execution unit: " + reason);
    Terminate();
    ++restarts_;
    Spawn();
}

nlohmann::json ProcessExecutionUnit::Exchange(const nlohmann::json& message) {
    if (!child_) {
        throw UnitError("execution unit is not running");
    }
    bool alive = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alive = alive_;
    }
    if (!alive) {
        Restart("previous instance exited");
    }

    *in_ << DumpLine(message) << '\n';
    in_->flush();
    if (!*in_) {
        Restart("input pipe closed");
        throw UnitError("execution unit closed its input");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return !replies_.empty() || !alive_; };
    if (timeout_.count() > 0) {
        if (!cv_.wait_for(lock, timeout_, ready)) {
            lock.unlock();
            Restart("request timed out");
            throw UnitError("execution timed out after " + std::to_string(timeout_.count()) + "s");
        }
    } else {
        cv_.wait(lock, ready);
    }
    if (replies_.empty()) {
        lock.unlock();
        Restart("exited during request");
        throw UnitError("execution unit exited unexpectedly");
    }
    auto reply = std::move(replies_.front());
    replies_.pop();
    return reply;
}

}  // namespace helix::worker
