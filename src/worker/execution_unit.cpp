#include "worker/execution_unit.hpp"

#include <chrono>
#include <exception>

#include "utils/logging.hpp"

namespace helix::worker {

helix::sandbox::ExecutionResult ExecutionUnit::Execute(const ExecuteRequest& request) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    const auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started] {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
    };
    try {
        const auto reply = Exchange(EncodeExecute(request));
        const auto type = MessageType(reply);
        if (type == "result") {
            return DecodeResult(reply);
        }
        const auto error = type == "error" && reply.contains("error") && reply["error"].is_string()
            ? reply["error"].get<std::string>()
            : "unexpected reply from execution unit: " + type;
        return helix::sandbox::FailureResult(error, elapsed_ms());
    } catch (const UnitError& ex) {
        helix::utils::LogWarn("unit", "task " + request.task_id + ": " + ex.what());
        return helix::sandbox::FailureResult(ex.what(), elapsed_ms());
    }
}

bool ExecutionUnit::Ping() {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    try {
        return MessageType(Exchange(MakeMessage("ping"))) == "pong";
    } catch (const UnitError& ex) {
        helix::utils::LogWarn("unit", std::string("ping failed: ") + ex.what());
        return false;
    }
}

void ExecutionUnit::ClearCache() {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    const auto reply = Exchange(MakeMessage("clear-cache"));
    if (MessageType(reply) != "cache-cleared") {
        throw UnitError("unexpected reply to clear-cache: " + DumpLine(reply));
    }
}

InProcessExecutionUnit::InProcessExecutionUnit(helix::module::ModuleSource& source,
                                               std::size_t cache_capacity,
                                               std::uint32_t stack_size_bytes)
    : runtime_(source, cache_capacity, stack_size_bytes) {}

InProcessExecutionUnit::~InProcessExecutionUnit() {
    Stop();
}

void InProcessExecutionUnit::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { Run(); });
}

void InProcessExecutionUnit::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

nlohmann::json InProcessExecutionUnit::Exchange(const nlohmann::json& message) {
    std::future<nlohmann::json> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw UnitError("execution unit is not running");
        }
        Job job{message, {}};
        reply = job.reply.get_future();
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
    try {
        return reply.get();
    } catch (const std::future_error&) {
        throw UnitError("execution unit stopped");
    }
}

void InProcessExecutionUnit::Run() {
    while (true) {
        Job job{};
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !jobs_.empty() || !running_; });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job.reply.set_value(runtime_.Handle(job.message));
    }
}

}  // namespace helix::worker
