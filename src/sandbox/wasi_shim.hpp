#pragma once

#include <cstdint>

#include "sandbox/execution_state.hpp"

struct M3Module;

namespace helix::sandbox::wasi {

// WASI preview1 errno values used by the shim.
constexpr std::uint16_t kErrnoSuccess = 0;
constexpr std::uint16_t kErrnoBadf = 8;
constexpr std::uint16_t kErrnoFault = 21;
constexpr std::uint16_t kErrnoInval = 28;
constexpr std::uint16_t kErrnoIo = 29;

constexpr std::int32_t kStdout = 1;
constexpr std::int32_t kStderr = 2;

// Host side of the syscall table. Pointers are guest memory offsets resolved
// through the state's memory binding.
std::uint16_t ArgsSizesGet(ExecutionState& state, std::uint32_t argc_ptr, std::uint32_t buf_size_ptr);
std::uint16_t ArgsGet(ExecutionState& state, std::uint32_t argv_ptr, std::uint32_t buf_ptr);
std::uint16_t EnvironSizesGet(ExecutionState& state, std::uint32_t count_ptr, std::uint32_t buf_size_ptr);
std::uint16_t ClockResGet(ExecutionState& state, std::uint32_t resolution_ptr);
std::uint16_t ClockTimeGet(ExecutionState& state, std::uint32_t time_ptr);
std::uint16_t FdWrite(ExecutionState& state,
                      std::int32_t fd,
                      std::uint32_t iovs_ptr,
                      std::uint32_t iovs_len,
                      std::uint32_t nwritten_ptr);
std::uint16_t FdRead(ExecutionState& state, std::uint32_t nread_ptr);
std::uint16_t FdPrestatGet(ExecutionState& state, std::int32_t fd);
std::uint16_t RandomGet(ExecutionState& state, std::uint32_t buf_ptr, std::uint32_t buf_len);

// Links the table under wasi_snapshot_preview1 and wasi_unstable. Imports the
// module does not declare are skipped. Throws InstantiationError.
void LinkWasi(M3Module* module, ExecutionState& state);

}  // namespace helix::sandbox::wasi
