#include "sandbox/compiled_module.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <utility>

#include <wasm3.h>

#include "sandbox/errors.hpp"

namespace helix::sandbox {
namespace {

constexpr std::uint8_t kWasmMagic[] = {0x00, 0x61, 0x73, 0x6d};

struct EnvironmentDeleter {
    void operator()(M3Environment* env) const { m3_FreeEnvironment(env); }
};

}  // namespace

CompiledModule::CompiledModule(std::string address, std::vector<std::uint8_t> bytes)
    : address_(std::move(address))
    , bytes_(std::move(bytes)) {}

std::shared_ptr<const CompiledModule> CompiledModule::Compile(std::string address,
                                                              std::vector<std::uint8_t> bytes) {
    if (bytes.size() < 8 || !std::equal(std::begin(kWasmMagic), std::end(kWasmMagic), bytes.begin())) {
        throw CompileError(address + ": not a WebAssembly module");
    }
    if (bytes.size() > UINT32_MAX) {
        throw CompileError(address + ": module too large");
    }

    std::unique_ptr<M3Environment, EnvironmentDeleter> env(m3_NewEnvironment());
    if (!env) {
        throw CompileError(address + ": cannot allocate wasm environment");
    }
    IM3Module module = nullptr;
    const M3Result result = m3_ParseModule(
        env.get(), &module, bytes.data(), static_cast<std::uint32_t>(bytes.size()));
    if (result != m3Err_none) {
        throw CompileError(address + ": " + result);
    }
    m3_FreeModule(module);

    return std::shared_ptr<const CompiledModule>(
        new CompiledModule(std::move(address), std::move(bytes)));
}

}  // namespace helix::sandbox
