#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "sandbox/execution_sandbox.hpp"
#include "sandbox/isolated_executor.hpp"

namespace codecred::sandbox {

ResourceLimits ResolveResourceLimits(const config::SandboxConfig& config);

// Throws std::invalid_argument for an unknown backend name.
std::shared_ptr<IsolatedExecutor> CreateExecutor(const config::SandboxConfig& config);

std::shared_ptr<ExecutionSandbox> CreateSandbox(const config::SandboxConfig& config);

}  // namespace codecred::sandbox
