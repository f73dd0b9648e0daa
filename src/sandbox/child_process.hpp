#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace codecred::sandbox {

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

// Polls the child until it exits or the timeout elapses. Returns the decoded
// exit status (128 + signal for signalled children), or std::nullopt on timeout.
// Throws ContextWaitError if the pid cannot be waited on.
std::optional<int> WaitForPid(pid_t pid,
                              std::chrono::milliseconds timeout,
                              std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20));

// SIGKILL to the child's process group and the child itself, then reap it.
void KillAndReap(pid_t pid);

// Kills whatever is left in the process group led by pid. The leader is
// reaped too unless the caller already collected its exit status.
void ReleaseProcessGroup(pid_t pid, bool leader_reaped);

// Runs a host tool (e.g. the container engine CLI) to completion.
// Throws RuntimeUnavailableError if the program is not on PATH.
CommandResult RunCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout);

// Starts a host tool without waiting; stdout and stderr go to log_path.
pid_t SpawnDetached(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& log_path);

std::string ReadFileLimited(const std::string& path, std::size_t max_bytes);

}  // namespace codecred::sandbox
