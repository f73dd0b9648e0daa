#pragma once

#include <stdexcept>
#include <string>

namespace codecred::sandbox {

// Failures of the isolation runtime itself, as opposed to failures of the
// code running inside it. TypeName() becomes ExecutionResult::exception_kind.
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}

    virtual const char* TypeName() const noexcept { return "SandboxError"; }
};

// The runtime (interpreter, container engine) cannot be found or reached.
class RuntimeUnavailableError : public SandboxError {
public:
    using SandboxError::SandboxError;
    const char* TypeName() const noexcept override { return "RuntimeUnavailableError"; }
};

class ContextCreateError : public SandboxError {
public:
    using SandboxError::SandboxError;
    const char* TypeName() const noexcept override { return "ContextCreateError"; }
};

class ContextStartError : public SandboxError {
public:
    using SandboxError::SandboxError;
    const char* TypeName() const noexcept override { return "ContextStartError"; }
};

class ContextWaitError : public SandboxError {
public:
    using SandboxError::SandboxError;
    const char* TypeName() const noexcept override { return "ContextWaitError"; }
};

}  // namespace codecred::sandbox
