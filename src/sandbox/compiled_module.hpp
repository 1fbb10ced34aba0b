#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace helix::sandbox {

// Validated module bytes for one address. Immutable once built and shared
// read-only by every execution of that address. Holds no runtime state: each
// execution parses the bytes into its own wasm3 environment.
class CompiledModule {
public:
    // Throws CompileError when the bytes are not a WebAssembly module.
    static std::shared_ptr<const CompiledModule> Compile(std::string address,
                                                         std::vector<std::uint8_t> bytes);

    const std::string& Address() const { return address_; }
    const std::vector<std::uint8_t>& Bytes() const { return bytes_; }

private:
    CompiledModule(std::string address, std::vector<std::uint8_t> bytes);

    std::string address_;
    std::vector<std::uint8_t> bytes_;
};

}  // namespace helix::sandbox
