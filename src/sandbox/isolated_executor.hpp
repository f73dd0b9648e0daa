#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace codecred::sandbox {

struct ResourceLimits {
    std::uint64_t memory_bytes = 100ULL * 1024 * 1024;
    std::int64_t cpu_period_us = 100000;
    std::int64_t cpu_quota_us = 50000;
    bool network_disabled = true;
};

struct ContextSpec {
    // Host path of the staged, read-only code file.
    std::string artifact_path;
    ResourceLimits limits;
};

// Capability interface over an isolation runtime. One context per Run().
// Infrastructure problems are reported by throwing SandboxError subclasses.
class IsolatedExecutor {
public:
    virtual ~IsolatedExecutor() = default;

    virtual std::string Name() const = 0;
    virtual std::string Create(const ContextSpec& spec) = 0;
    virtual void Start(const std::string& context_id) = 0;
    // Returns the exit status, or std::nullopt if the context is still running
    // when the timeout elapses.
    virtual std::optional<int> WaitFor(const std::string& context_id,
                                       std::chrono::milliseconds timeout) = 0;
    virtual std::string Logs(const std::string& context_id) = 0;
    virtual void Kill(const std::string& context_id) = 0;
    virtual void Remove(const std::string& context_id) = 0;
};

}  // namespace codecred::sandbox
