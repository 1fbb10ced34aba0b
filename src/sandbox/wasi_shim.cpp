#include "sandbox/wasi_shim.hpp"

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstring>
#include <string>
#include <vector>

#include <openssl/rand.h>
#include <wasm3.h>

#include "sandbox/errors.hpp"

namespace helix::sandbox::wasi {
namespace {

void StoreU32(std::uint8_t* target, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        target[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

void StoreU64(std::uint8_t* target, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        target[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

std::uint32_t LoadU32(const std::uint8_t* source) {
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(source[i]) << (8 * i);
    }
    return value;
}

std::uint16_t WriteU32(ExecutionState& state, std::uint32_t ptr, std::uint32_t value) {
    auto* target = state.MemoryAt(ptr, 4);
    if (!target) {
        return kErrnoFault;
    }
    StoreU32(target, value);
    return kErrnoSuccess;
}

std::uint16_t WriteU64(ExecutionState& state, std::uint32_t ptr, std::uint64_t value) {
    auto* target = state.MemoryAt(ptr, 8);
    if (!target) {
        return kErrnoFault;
    }
    StoreU64(target, value);
    return kErrnoSuccess;
}

ExecutionState& StateFrom(IM3Runtime runtime, IM3ImportContext ctx, void* mem) {
    auto* state = static_cast<ExecutionState*>(ctx->userdata);
    if (state->HasMemory()) {
        state->BindMemory(static_cast<std::uint8_t*>(mem), m3_GetMemorySize(runtime));
    }
    return *state;
}

m3ApiRawFunction(HostArgsSizesGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, argc_ptr);
    m3ApiGetArg(uint32_t, buf_size_ptr);
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(ArgsSizesGet(state, argc_ptr, buf_size_ptr));
}

m3ApiRawFunction(HostArgsGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, argv_ptr);
    m3ApiGetArg(uint32_t, buf_ptr);
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(ArgsGet(state, argv_ptr, buf_ptr));
}

m3ApiRawFunction(HostEnvironSizesGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, count_ptr);
    m3ApiGetArg(uint32_t, buf_size_ptr);
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(EnvironSizesGet(state, count_ptr, buf_size_ptr));
}

m3ApiRawFunction(HostEnvironGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, environ_ptr);
    m3ApiGetArg(uint32_t, buf_ptr);
    (void)environ_ptr;
    (void)buf_ptr;
    m3ApiReturn(kErrnoSuccess);
}

m3ApiRawFunction(HostClockResGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, clock_id);
    m3ApiGetArg(uint32_t, resolution_ptr);
    (void)clock_id;
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(ClockResGet(state, resolution_ptr));
}

m3ApiRawFunction(HostClockTimeGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, clock_id);
    m3ApiGetArg(uint64_t, precision);
    m3ApiGetArg(uint32_t, time_ptr);
    (void)clock_id;
    (void)precision;
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(ClockTimeGet(state, time_ptr));
}

m3ApiRawFunction(HostFdWrite) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    m3ApiGetArg(uint32_t, iovs_ptr);
    m3ApiGetArg(uint32_t, iovs_len);
    m3ApiGetArg(uint32_t, nwritten_ptr);
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(FdWrite(state, fd, iovs_ptr, iovs_len, nwritten_ptr));
}

m3ApiRawFunction(HostFdRead) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    m3ApiGetArg(uint32_t, iovs_ptr);
    m3ApiGetArg(uint32_t, iovs_len);
    m3ApiGetArg(uint32_t, nread_ptr);
    (void)fd;
    (void)iovs_ptr;
    (void)iovs_len;
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(FdRead(state, nread_ptr));
}

m3ApiRawFunction(HostFdSeek) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    m3ApiGetArg(int64_t, offset);
    m3ApiGetArg(uint32_t, whence);
    m3ApiGetArg(uint32_t, result_ptr);
    (void)fd;
    (void)offset;
    (void)whence;
    (void)result_ptr;
    m3ApiReturn(kErrnoSuccess);
}

m3ApiRawFunction(HostFdClose) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    (void)fd;
    m3ApiReturn(kErrnoSuccess);
}

m3ApiRawFunction(HostFdFdstatGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    m3ApiGetArg(uint32_t, fdstat_ptr);
    (void)fd;
    (void)fdstat_ptr;
    m3ApiReturn(kErrnoSuccess);
}

m3ApiRawFunction(HostFdPrestatGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    m3ApiGetArg(uint32_t, prestat_ptr);
    (void)prestat_ptr;
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(FdPrestatGet(state, fd));
}

m3ApiRawFunction(HostFdPrestatDirName) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(int32_t, fd);
    m3ApiGetArg(uint32_t, path_ptr);
    m3ApiGetArg(uint32_t, path_len);
    (void)path_ptr;
    (void)path_len;
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(FdPrestatGet(state, fd));
}

m3ApiRawFunction(HostPathOpen) {
    m3ApiReturnType(uint32_t);
    m3ApiReturn(kErrnoBadf);
}

m3ApiRawFunction(HostProcExit) {
    m3ApiGetArg(uint32_t, code);
    auto* state = static_cast<ExecutionState*>(_ctx->userdata);
    state->RequestExit(static_cast<int>(code));
    m3ApiTrap(m3Err_trapExit);
}

m3ApiRawFunction(HostRandomGet) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, buf_ptr);
    m3ApiGetArg(uint32_t, buf_len);
    auto& state = StateFrom(runtime, _ctx, _mem);
    m3ApiReturn(RandomGet(state, buf_ptr, buf_len));
}

struct HostFunction {
    const char* name;
    const char* signature;
    M3RawCall function;
};

const HostFunction kHostFunctions[] = {
    {"args_get", "i(**)", &HostArgsGet},
    {"args_sizes_get", "i(**)", &HostArgsSizesGet},
    {"environ_get", "i(**)", &HostEnvironGet},
    {"environ_sizes_get", "i(**)", &HostEnvironSizesGet},
    {"clock_res_get", "i(i*)", &HostClockResGet},
    {"clock_time_get", "i(iI*)", &HostClockTimeGet},
    {"fd_write", "i(i*i*)", &HostFdWrite},
    {"fd_read", "i(i*i*)", &HostFdRead},
    {"fd_seek", "i(iIi*)", &HostFdSeek},
    {"fd_close", "i(i)", &HostFdClose},
    {"fd_fdstat_get", "i(i*)", &HostFdFdstatGet},
    {"fd_prestat_get", "i(i*)", &HostFdPrestatGet},
    {"fd_prestat_dir_name", "i(i*i)", &HostFdPrestatDirName},
    {"path_open", "i(ii*iiIIi*)", &HostPathOpen},
    {"proc_exit", "v(i)", &HostProcExit},
    {"random_get", "i(*i)", &HostRandomGet},
};

const char* const kNamespaces[] = {"wasi_snapshot_preview1", "wasi_unstable"};

M3Result SuppressLookupFailure(M3Result result) {
    if (result == m3Err_functionLookupFailed) {
        return m3Err_none;
    }
    return result;
}

}  // namespace

std::uint16_t ArgsSizesGet(ExecutionState& state, std::uint32_t argc_ptr, std::uint32_t buf_size_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    std::uint32_t buf_size = 0;
    for (const auto& arg : state.Args()) {
        buf_size += static_cast<std::uint32_t>(arg.size() + 1);
    }
    if (const auto err = WriteU32(state, argc_ptr, static_cast<std::uint32_t>(state.Args().size()))) {
        return err;
    }
    return WriteU32(state, buf_size_ptr, buf_size);
}

std::uint16_t ArgsGet(ExecutionState& state, std::uint32_t argv_ptr, std::uint32_t buf_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    const auto& args = state.Args();
    std::uint32_t buf_size = 0;
    for (const auto& arg : args) {
        buf_size += static_cast<std::uint32_t>(arg.size() + 1);
    }
    auto* argv = state.MemoryAt(argv_ptr, static_cast<std::uint32_t>(args.size() * 4));
    auto* buf = state.MemoryAt(buf_ptr, buf_size);
    if (!argv || !buf) {
        return kErrnoFault;
    }
    std::uint32_t offset = 0;
    for (std::size_t i = 0; i < args.size(); ++i) {
        StoreU32(argv + i * 4, buf_ptr + offset);
        std::memcpy(buf + offset, args[i].data(), args[i].size());
        offset += static_cast<std::uint32_t>(args[i].size());
        buf[offset++] = 0;
    }
    return kErrnoSuccess;
}

std::uint16_t EnvironSizesGet(ExecutionState& state, std::uint32_t count_ptr, std::uint32_t buf_size_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    if (const auto err = WriteU32(state, count_ptr, 0)) {
        return err;
    }
    return WriteU32(state, buf_size_ptr, 0);
}

std::uint16_t ClockResGet(ExecutionState& state, std::uint32_t resolution_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    return WriteU64(state, resolution_ptr, 1000);
}

std::uint16_t ClockTimeGet(ExecutionState& state, std::uint32_t time_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    const auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return WriteU64(state, time_ptr, static_cast<std::uint64_t>(now));
}

std::uint16_t FdWrite(ExecutionState& state,
                      std::int32_t fd,
                      std::uint32_t iovs_ptr,
                      std::uint32_t iovs_len,
                      std::uint32_t nwritten_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    const std::uint64_t table_size = static_cast<std::uint64_t>(iovs_len) * 8;
    if (table_size > UINT32_MAX) {
        return kErrnoFault;
    }
    const auto* iovs = state.MemoryAt(iovs_ptr, static_cast<std::uint32_t>(table_size));
    if (!iovs) {
        return kErrnoFault;
    }

    std::vector<std::string> chunks;
    std::uint64_t written = 0;
    for (std::uint32_t i = 0; i < iovs_len; ++i) {
        const auto buf = LoadU32(iovs + i * 8);
        const auto len = LoadU32(iovs + i * 8 + 4);
        if (len == 0) {
            continue;
        }
        const auto* data = state.MemoryAt(buf, len);
        if (!data) {
            return kErrnoFault;
        }
        if (fd == kStdout || fd == kStderr) {
            chunks.emplace_back(reinterpret_cast<const char*>(data), len);
        }
        written += len;
    }
    if (written > UINT32_MAX) {
        return kErrnoInval;
    }
    if (const auto err = WriteU32(state, nwritten_ptr, static_cast<std::uint32_t>(written))) {
        return err;
    }

    for (auto& chunk : chunks) {
        if (fd == kStdout) {
            state.AppendStdout(std::move(chunk));
        } else {
            state.AppendStderr(std::move(chunk));
        }
    }
    return kErrnoSuccess;
}

std::uint16_t FdRead(ExecutionState& state, std::uint32_t nread_ptr) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    // No descriptor is readable; report end of input.
    return WriteU32(state, nread_ptr, 0);
}

std::uint16_t FdPrestatGet(ExecutionState& state, std::int32_t fd) {
    (void)state;
    (void)fd;
    return kErrnoBadf;
}

std::uint16_t RandomGet(ExecutionState& state, std::uint32_t buf_ptr, std::uint32_t buf_len) {
    if (!state.HasMemory()) {
        return kErrnoInval;
    }
    auto* buf = state.MemoryAt(buf_ptr, buf_len);
    if (!buf) {
        return kErrnoFault;
    }
    while (buf_len > 0) {
        const auto chunk = static_cast<int>(std::min<std::uint32_t>(buf_len, INT_MAX));
        if (RAND_bytes(buf, chunk) != 1) {
            return kErrnoIo;
        }
        buf += chunk;
        buf_len -= static_cast<std::uint32_t>(chunk);
    }
    return kErrnoSuccess;
}

void LinkWasi(M3Module* module, ExecutionState& state) {
    for (const auto* ns : kNamespaces) {
        for (const auto& host : kHostFunctions) {
            const M3Result result = SuppressLookupFailure(m3_LinkRawFunctionEx(
                module, ns, host.name, host.signature, host.function, &state));
            if (result != m3Err_none) {
                throw InstantiationError(
                    std::string("cannot link ") + ns + "." + host.name + ": " + result);
            }
        }
    }
}

}  // namespace helix::sandbox::wasi
