#include "worker/sandbox_runtime.hpp"

#include <chrono>
#include <exception>
#include <istream>
#include <ostream>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "worker/sandbox_protocol.hpp"

namespace helix::worker {

SandboxRuntime::SandboxRuntime(helix::module::ModuleSource& source,
                               std::size_t cache_capacity,
                               std::uint32_t stack_size_bytes)
    : cache_(source, cache_capacity)
    , executor_(stack_size_bytes) {}

helix::sandbox::ExecutionResult SandboxRuntime::Execute(const std::string& module_path,
                                                        const std::string& input) {
    const auto started = std::chrono::steady_clock::now();
    try {
        const auto module = cache_.Resolve(module_path);
        return executor_.Execute(*module, input);
    } catch (const helix::sandbox::SandboxError& ex) {
        helix::utils::LogWarn("sandbox", ex.what());
        const auto elapsed = std::chrono::steady_clock::now() - started;
        return helix::sandbox::FailureResult(
            ex.what(), std::chrono::duration<double, std::milli>(elapsed).count());
    }
}

nlohmann::json SandboxRuntime::Handle(const nlohmann::json& message) {
    const auto type = MessageType(message);
    try {
        if (type == "execute") {
            const auto request = DecodeExecute(message);
            return EncodeResult(request.task_id, Execute(request.module_path, request.input));
        }
        if (type == "ping") {
            auto reply = MakeMessage("pong");
            reply["timestamp"] = helix::utils::NowMs();
            return reply;
        }
        if (type == "clear-cache") {
            cache_.Clear();
            helix::utils::LogInfo("sandbox", "module cache cleared");
            return MakeMessage("cache-cleared");
        }
    } catch (const std::exception& ex) {
        helix::utils::LogError("sandbox", std::string("request failed: ") + ex.what());
        return MakeError(ex.what());
    }
    return MakeError("unknown message type: " + type);
}

int RunSandboxLoop(SandboxRuntime& runtime, std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        const auto message = nlohmann::json::parse(line, nullptr, false);
        const auto reply = message.is_discarded()
            ? MakeError("malformed message")
            : runtime.Handle(message);
        out << DumpLine(reply) << '\n';
        out.flush();
    }
    return 0;
}

}  // namespace helix::worker
