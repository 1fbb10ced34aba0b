#pragma once

#include <cstdint>
#include <string>

#include "sandbox/compiled_module.hpp"
#include "sandbox/execution_result.hpp"

namespace helix::sandbox {

// Exit code reported when instantiation or invocation fails without a
// proc_exit from the module.
constexpr int kTrapExitCode = 1;

class SandboxExecutor {
public:
    explicit SandboxExecutor(std::uint32_t stack_size_bytes = 1024 * 1024);

    // Runs the module in a fresh runtime with argv ["agent", input]. Never
    // throws for module failures: they come back as a non-zero exit.
    ExecutionResult Execute(const CompiledModule& module, const std::string& input) const;

private:
    std::uint32_t stack_size_bytes_;
};

}  // namespace helix::sandbox
