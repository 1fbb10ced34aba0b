#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "module/module_cache.hpp"
#include "module/module_source.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace helix::worker {

// Body of the execution unit: owns the module cache and the executor and
// answers one inter-context message at a time.
class SandboxRuntime {
public:
    SandboxRuntime(helix::module::ModuleSource& source,
                   std::size_t cache_capacity,
                   std::uint32_t stack_size_bytes);

    // Never throws: every request gets a reply message.
    nlohmann::json Handle(const nlohmann::json& message);

    // Fetch and compile failures come back as a failed result.
    helix::sandbox::ExecutionResult Execute(const std::string& module_path, const std::string& input);

    helix::module::ModuleCache& Cache() { return cache_; }

private:
    helix::module::ModuleCache cache_;
    helix::sandbox::SandboxExecutor executor_;
};

// Reads requests line by line from `in` and writes replies to `out` until
// end of input.
int RunSandboxLoop(SandboxRuntime& runtime, std::istream& in, std::ostream& out);

}  // namespace helix::worker
