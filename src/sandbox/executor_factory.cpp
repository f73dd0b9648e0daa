#include "sandbox/executor_factory.hpp"

#include <stdexcept>

#include "sandbox/docker_executor.hpp"
#include "sandbox/process_executor.hpp"

namespace codecred::sandbox {

ResourceLimits ResolveResourceLimits(const config::SandboxConfig& config) {
    ResourceLimits limits{};
    limits.memory_bytes = config.memory_limit_mb * 1024 * 1024;
    limits.cpu_period_us = config.cpu_period_us;
    limits.cpu_quota_us = config.cpu_quota_us;
    limits.network_disabled = config.network_disabled;
    return limits;
}

std::shared_ptr<IsolatedExecutor> CreateExecutor(const config::SandboxConfig& config) {
    if (config.backend == "process") {
        ProcessExecutorOptions options{};
        options.interpreter = config.interpreter;
        options.cpu_time_seconds = config.cpu_time_s;
        options.max_output_bytes = config.max_output_bytes;
        return std::make_shared<ProcessExecutor>(std::move(options));
    }
    if (config.backend == "docker") {
        DockerExecutorOptions options{};
        options.docker_binary = config.docker_binary;
        options.image = config.image;
        options.interpreter = config.container_interpreter;
        options.container_path = config.container_path;
        options.max_output_bytes = config.max_output_bytes;
        return std::make_shared<DockerExecutor>(std::move(options));
    }
    throw std::invalid_argument("unknown sandbox backend: " + config.backend);
}

std::shared_ptr<ExecutionSandbox> CreateSandbox(const config::SandboxConfig& config) {
    return std::make_shared<ExecutionSandbox>(
        CreateExecutor(config),
        ResolveResourceLimits(config),
        ClassifyTracebackFailure,
        std::chrono::seconds(config.timeout_s > 0 ? config.timeout_s : 5));
}

}  // namespace codecred::sandbox
