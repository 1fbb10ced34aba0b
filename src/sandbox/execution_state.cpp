#include "sandbox/execution_state.hpp"

#include <utility>

#include "utils/common.hpp"

namespace helix::sandbox {

ExecutionState::ExecutionState(std::vector<std::string> args)
    : args_(std::move(args)) {}

void ExecutionState::BindMemory(std::uint8_t* base, std::uint32_t size) {
    memory_base_ = base;
    memory_size_ = base ? size : 0;
}

std::uint8_t* ExecutionState::MemoryAt(std::uint32_t offset, std::uint32_t length) const {
    if (!memory_base_) {
        return nullptr;
    }
    const std::uint64_t end = static_cast<std::uint64_t>(offset) + length;
    if (end > memory_size_) {
        return nullptr;
    }
    return memory_base_ + offset;
}

void ExecutionState::AppendStdout(std::string text) {
    stdout_.push_back(std::move(text));
}

void ExecutionState::AppendStderr(std::string text) {
    stderr_.push_back(std::move(text));
}

std::string ExecutionState::Stdout() const {
    return helix::utils::Join(stdout_, "");
}

std::string ExecutionState::Stderr() const {
    return helix::utils::Join(stderr_, "");
}

}  // namespace helix::sandbox
