#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "sandbox/isolated_executor.hpp"

namespace codecred::sandbox {

struct ProcessExecutorOptions {
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args;
    // Host variables copied into the child when set; nothing else is inherited.
    std::vector<std::string> passthrough_env = {"PATH", "LANG", "LC_ALL", "PYENV_VERSION"};
    // RLIMIT_CPU for the child, in seconds of CPU time.
    std::uint64_t cpu_time_seconds = 10;
    std::size_t max_output_bytes = 1024 * 1024;
};

// Runs the artifact under a local interpreter in its own process group, with
// rlimits and (where the kernel permits) an empty network namespace.
class ProcessExecutor : public IsolatedExecutor {
public:
    explicit ProcessExecutor(ProcessExecutorOptions options = {});
    ~ProcessExecutor() override;

    std::string Name() const override { return "process"; }
    std::string Create(const ContextSpec& spec) override;
    void Start(const std::string& context_id) override;
    std::optional<int> WaitFor(const std::string& context_id,
                               std::chrono::milliseconds timeout) override;
    std::string Logs(const std::string& context_id) override;
    void Kill(const std::string& context_id) override;
    void Remove(const std::string& context_id) override;

private:
    struct Context {
        ContextSpec spec;
        std::string log_path;
        pid_t pid = -1;
        std::optional<int> exit_status;
    };

    Context Snapshot(const std::string& context_id);

    ProcessExecutorOptions options_;
    std::mutex mutex_;
    std::map<std::string, Context> contexts_;
    std::uint64_t next_id_ = 0;
};

}  // namespace codecred::sandbox
