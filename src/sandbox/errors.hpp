#pragma once

#include <stdexcept>
#include <string>

namespace helix::sandbox {

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Module bytes unreachable, or the source answered non-success.
class FetchError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// Bytes are not a valid WebAssembly module.
class CompileError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// Import linking failed or no usable entry point is exported.
class InstantiationError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// Runtime fault during invocation.
class TrapError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

}  // namespace helix::sandbox
