#include "sandbox/sandbox_executor.hpp"

#include <chrono>
#include <memory>
#include <vector>

#include <wasm3.h>

#include "sandbox/errors.hpp"
#include "sandbox/execution_state.hpp"
#include "sandbox/wasi_shim.hpp"
#include "utils/logging.hpp"

namespace helix::sandbox {
namespace {

const char* const kEntryPoints[] = {"_start", "main"};

struct EnvironmentDeleter {
    void operator()(M3Environment* env) const { m3_FreeEnvironment(env); }
};

struct RuntimeDeleter {
    void operator()(M3Runtime* runtime) const { m3_FreeRuntime(runtime); }
};

// One wasm3 environment + runtime holding one loaded copy of the module,
// linked against a single ExecutionState.
class Instance {
public:
    Instance(const CompiledModule& module, ExecutionState& state, std::uint32_t stack_size)
        : state_(state)
        , env_(m3_NewEnvironment()) {
        if (!env_) {
            throw InstantiationError("cannot allocate wasm environment");
        }
        runtime_.reset(m3_NewRuntime(env_.get(), stack_size, nullptr));
        if (!runtime_) {
            throw InstantiationError("cannot allocate wasm runtime");
        }

        const auto& bytes = module.Bytes();
        M3Result result = m3_ParseModule(
            env_.get(), &module_, bytes.data(), static_cast<std::uint32_t>(bytes.size()));
        if (result != m3Err_none) {
            throw InstantiationError(std::string("parse failed: ") + result);
        }
        result = m3_LoadModule(runtime_.get(), module_);
        if (result != m3Err_none) {
            m3_FreeModule(module_);
            module_ = nullptr;
            throw InstantiationError(std::string("load failed: ") + result);
        }
        wasi::LinkWasi(module_, state_);
    }

    void BindMemory() {
        std::uint32_t size = 0;
        std::uint8_t* memory = m3_GetMemory(runtime_.get(), &size, 0);
        state_.BindMemory(memory, size);
    }

    // Exit code of a completed run. Throws TrapError or InstantiationError.
    int Invoke() {
        M3Result result = m3_RunStart(module_);
        if (result == m3Err_none) {
            result = m3_CallV(FindEntryPoint());
        }
        if (result == m3Err_none) {
            return 0;
        }
        if (result == m3Err_trapExit && state_.RequestedExit().has_value()) {
            return *state_.RequestedExit();
        }
        throw TrapError(ErrorMessage(result));
    }

private:
    IM3Function FindEntryPoint() {
        for (const auto* name : kEntryPoints) {
            IM3Function function = nullptr;
            if (m3_FindFunction(&function, runtime_.get(), name) != m3Err_none || !function) {
                continue;
            }
            if (m3_GetArgCount(function) != 0) {
                throw InstantiationError(std::string("entry point ") + name + " takes parameters");
            }
            return function;
        }
        throw InstantiationError("module exports neither _start nor main");
    }

    std::string ErrorMessage(M3Result result) {
        M3ErrorInfo info{};
        m3_GetErrorInfo(runtime_.get(), &info);
        std::string message = result;
        if (info.message && *info.message) {
            message += ": ";
            message += info.message;
        }
        return message;
    }

    ExecutionState& state_;
    std::unique_ptr<M3Environment, EnvironmentDeleter> env_;
    std::unique_ptr<M3Runtime, RuntimeDeleter> runtime_;
    IM3Module module_ = nullptr;
};

}  // namespace

SandboxExecutor::SandboxExecutor(std::uint32_t stack_size_bytes)
    : stack_size_bytes_(stack_size_bytes) {}

ExecutionResult SandboxExecutor::Execute(const CompiledModule& module, const std::string& input) const {
    const auto started = std::chrono::steady_clock::now();
    ExecutionState state({"agent", input});
    ExecutionResult result{};

    try {
        Instance instance(module, state, stack_size_bytes_);
        instance.BindMemory();
        result.exit_code = instance.Invoke();
    } catch (const SandboxError& ex) {
        helix::utils::LogDebug("sandbox", module.Address() + " failed: " + ex.what());
        state.AppendStderr(ex.what());
        result.exit_code = kTrapExitCode;
        result.error = ex.what();
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    result.execution_time_ms =
        std::chrono::duration<double, std::milli>(elapsed).count();
    result.success = result.exit_code == 0;
    result.output = ParseOutput(state.Stdout());
    result.stderr_text = state.Stderr();
    helix::utils::LogDebug("sandbox", module.Address() + " exit=" + std::to_string(result.exit_code));
    return result;
}

}  // namespace helix::sandbox
