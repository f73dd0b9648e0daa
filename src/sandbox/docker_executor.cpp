#include "sandbox/docker_executor.hpp"

#include <atomic>
#include <filesystem>
#include <vector>

#include "sandbox/child_process.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codecred::sandbox {
namespace {

std::string LastLine(const std::string& text) {
    const auto lines = utils::SplitLines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto trimmed = utils::Trim(*it);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return {};
}

std::string Describe(const CommandResult& result) {
    auto detail = utils::Trim(result.error);
    if (detail.empty()) {
        detail = utils::Trim(result.output);
    }
    return "exit=" + std::to_string(result.exit_code) + (detail.empty() ? "" : " " + detail);
}

}  // namespace

DockerExecutor::DockerExecutor(DockerExecutorOptions options)
    : options_(std::move(options)) {}

std::string DockerExecutor::Create(const ContextSpec& spec) {
    const auto host_path = std::filesystem::absolute(spec.artifact_path).string();
    std::vector<std::string> args = {
        "create",
        "--memory", std::to_string(spec.limits.memory_bytes),
        "--memory-swap", std::to_string(spec.limits.memory_bytes),
        "--cpu-period", std::to_string(spec.limits.cpu_period_us),
        "--cpu-quota", std::to_string(spec.limits.cpu_quota_us),
        "-v", host_path + ":" + options_.container_path + ":ro",
    };
    if (spec.limits.network_disabled) {
        args.push_back("--network");
        args.push_back("none");
    }
    args.push_back(options_.image);
    args.push_back(options_.interpreter);
    args.push_back(options_.container_path);

    const auto result = RunCommand(options_.docker_binary, args, options_.cli_timeout);
    if (result.timed_out) {
        throw RuntimeUnavailableError("container engine did not answer within " +
                                      std::to_string(options_.cli_timeout.count()) + "s");
    }
    if (result.exit_code != 0) {
        throw ContextCreateError("docker create failed: " + Describe(result));
    }
    const auto container_id = LastLine(result.output);
    if (container_id.empty()) {
        throw ContextCreateError("docker create returned no container id");
    }
    utils::Log(utils::LogLevel::kDebug, "sandbox", "container created",
               {{"id", container_id}, {"image", options_.image}});
    return container_id;
}

void DockerExecutor::Start(const std::string& context_id) {
    const auto result = RunCommand(options_.docker_binary, {"start", context_id}, options_.cli_timeout);
    if (result.timed_out || result.exit_code != 0) {
        throw ContextStartError("docker start failed: " + Describe(result));
    }
}

std::optional<int> DockerExecutor::WaitFor(const std::string& context_id,
                                           std::chrono::milliseconds timeout) {
    static std::atomic<unsigned long> counter{0};
    const auto log_path = (std::filesystem::temp_directory_path() /
                           ("codecred_wait_" + context_id + "_" + std::to_string(counter++) + ".log"))
                              .string();
    const pid_t waiter = SpawnDetached(options_.docker_binary, {"wait", context_id}, log_path);

    std::optional<int> waited;
    try {
        waited = WaitForPid(waiter, timeout);
    } catch (const SandboxError&) {
        KillAndReap(waiter);
        std::error_code ec;
        std::filesystem::remove(log_path, ec);
        throw;
    }
    if (!waited) {
        KillAndReap(waiter);
        std::error_code ec;
        std::filesystem::remove(log_path, ec);
        return std::nullopt;
    }

    const auto output = ReadFileLimited(log_path, 4096);
    std::error_code ec;
    std::filesystem::remove(log_path, ec);
    if (*waited != 0) {
        throw ContextWaitError("docker wait failed: " + utils::Trim(output));
    }
    const auto status_line = LastLine(output);
    try {
        return std::stoi(status_line);
    } catch (const std::exception&) {
        throw ContextWaitError("unexpected docker wait output: " + status_line);
    }
}

std::string DockerExecutor::Logs(const std::string& context_id) {
    const auto result = RunCommand(options_.docker_binary, {"logs", context_id}, options_.cli_timeout);
    if (result.timed_out || result.exit_code != 0) {
        throw SandboxError("docker logs failed: " + Describe(result));
    }
    // Container stdout and stderr arrive on the client's two streams.
    auto combined = result.output + result.error;
    if (combined.size() > options_.max_output_bytes) {
        combined.resize(options_.max_output_bytes);
        combined += "(truncated)";
    }
    return combined;
}

void DockerExecutor::Kill(const std::string& context_id) {
    const auto result = RunCommand(options_.docker_binary, {"kill", context_id}, options_.cli_timeout);
    if (result.timed_out || result.exit_code != 0) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "docker kill failed",
                   {{"id", context_id}, {"detail", Describe(result)}});
    }
}

void DockerExecutor::Remove(const std::string& context_id) {
    const auto result = RunCommand(options_.docker_binary, {"rm", "-f", context_id}, options_.cli_timeout);
    if (result.timed_out || result.exit_code != 0) {
        throw SandboxError("docker rm failed: " + Describe(result));
    }
}

}  // namespace codecred::sandbox
