#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace helix::sandbox {

// Per-execution state behind the syscall table. One instance per execution,
// never reused; the host functions receive it as import user data.
class ExecutionState {
public:
    explicit ExecutionState(std::vector<std::string> args);

    ExecutionState(const ExecutionState&) = delete;
    ExecutionState& operator=(const ExecutionState&) = delete;

    const std::vector<std::string>& Args() const { return args_; }

    // Memory is module-defined, so the binding exists only after
    // instantiation. Rebinding follows memory.grow relocations.
    void BindMemory(std::uint8_t* base, std::uint32_t size);
    bool HasMemory() const { return memory_base_ != nullptr; }
    std::uint32_t MemorySize() const { return memory_size_; }

    // nullptr when unbound or when [offset, offset + length) leaves the memory.
    std::uint8_t* MemoryAt(std::uint32_t offset, std::uint32_t length) const;

    void AppendStdout(std::string text);
    void AppendStderr(std::string text);
    std::string Stdout() const;
    std::string Stderr() const;

    void RequestExit(int code) { exit_code_ = code; }
    const std::optional<int>& RequestedExit() const { return exit_code_; }

private:
    std::vector<std::string> args_;
    std::vector<std::string> stdout_;
    std::vector<std::string> stderr_;
    std::uint8_t* memory_base_ = nullptr;
    std::uint32_t memory_size_ = 0;
    std::optional<int> exit_code_;
};

}  // namespace helix::sandbox
