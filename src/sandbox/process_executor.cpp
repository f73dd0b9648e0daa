#include "sandbox/process_executor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>

#include "sandbox/child_process.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/logging.hpp"

namespace codecred::sandbox {
namespace bp = boost::process;

namespace {

// Runs in the forked child before exec; async-signal-safe calls only.
void ApplyChildLimits(const ResourceLimits& limits, std::uint64_t cpu_time_seconds) {
    ::setpgid(0, 0);

    if (limits.memory_bytes > 0) {
        struct rlimit rl;
        rl.rlim_cur = limits.memory_bytes;
        rl.rlim_max = limits.memory_bytes;
        ::setrlimit(RLIMIT_AS, &rl);
    }
    if (cpu_time_seconds > 0) {
        struct rlimit rl;
        rl.rlim_cur = cpu_time_seconds;
        rl.rlim_max = cpu_time_seconds + 1;
        ::setrlimit(RLIMIT_CPU, &rl);
    }
    struct rlimit no_core;
    no_core.rlim_cur = 0;
    no_core.rlim_max = 0;
    ::setrlimit(RLIMIT_CORE, &no_core);

    // Fewer scheduler slots than the caller, approximating a CPU share.
    if (limits.cpu_period_us > 0 && limits.cpu_quota_us > 0 &&
        limits.cpu_quota_us < limits.cpu_period_us) {
        ::setpriority(PRIO_PROCESS, 0, 10);
    }

    if (limits.network_disabled) {
        // CLONE_NEWNET alone needs CAP_SYS_ADMIN; an unprivileged user
        // namespace grants it inside the new namespace.
        if (::unshare(CLONE_NEWNET) != 0) {
            ::unshare(CLONE_NEWUSER | CLONE_NEWNET);
        }
    }
}

bp::environment BuildChildEnvironment(const std::vector<std::string>& passthrough) {
    bp::environment env;
    for (const auto& name : passthrough) {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            env[name] = value;
        }
    }
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["PYTHONUNBUFFERED"] = "1";
    return env;
}

std::string NextLogPath(std::uint64_t id) {
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return (std::filesystem::temp_directory_path() /
            ("codecred_run_" + stamp + "_" + std::to_string(id) + ".log")).string();
}

}  // namespace

ProcessExecutor::ProcessExecutor(ProcessExecutorOptions options)
    : options_(std::move(options)) {}

ProcessExecutor::~ProcessExecutor() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, context] : contexts_) {
        ReleaseProcessGroup(context.pid, context.exit_status.has_value());
        std::error_code ec;
        std::filesystem::remove(context.log_path, ec);
    }
}

std::string ProcessExecutor::Create(const ContextSpec& spec) {
    if (!std::filesystem::exists(spec.artifact_path)) {
        throw ContextCreateError("artifact not found: " + spec.artifact_path);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = "proc-" + std::to_string(next_id_++);
    Context context{};
    context.spec = spec;
    context.log_path = NextLogPath(next_id_);
    contexts_.emplace(id, std::move(context));
    return id;
}

ProcessExecutor::Context ProcessExecutor::Snapshot(const std::string& context_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        throw SandboxError("unknown context: " + context_id);
    }
    return it->second;
}

void ProcessExecutor::Start(const std::string& context_id) {
    const auto context = Snapshot(context_id);
    const auto exe = bp::search_path(options_.interpreter);
    if (exe.empty()) {
        throw RuntimeUnavailableError("interpreter not found on PATH: " + options_.interpreter);
    }

    std::vector<std::string> args = options_.interpreter_args;
    args.push_back(context.spec.artifact_path);

    auto env = BuildChildEnvironment(options_.passthrough_env);

    const auto limits = context.spec.limits;
    const auto cpu_time_seconds = options_.cpu_time_seconds;
    pid_t pid = -1;
    try {
        bp::child child(
            exe,
            bp::args(args),
            env,
            bp::start_dir = std::filesystem::temp_directory_path().string(),
            bp::std_in < bp::null,
            (bp::std_out & bp::std_err) > context.log_path,
            bp::extend::on_exec_setup = [limits, cpu_time_seconds](auto&) {
                ApplyChildLimits(limits, cpu_time_seconds);
            });
        pid = child.id();
        child.detach();
    } catch (const bp::process_error& ex) {
        throw ContextStartError(std::string("failed to start interpreter: ") + ex.what());
    }

    utils::Log(utils::LogLevel::kDebug, "sandbox", "process started",
               {{"context", context_id}, {"pid", std::to_string(pid)}});

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        KillAndReap(pid);
        throw ContextStartError("context removed while starting: " + context_id);
    }
    it->second.pid = pid;
}

std::optional<int> ProcessExecutor::WaitFor(const std::string& context_id,
                                            std::chrono::milliseconds timeout) {
    const auto context = Snapshot(context_id);
    if (context.exit_status) {
        return context.exit_status;
    }
    if (context.pid <= 0) {
        throw ContextWaitError("context not started: " + context_id);
    }
    const auto status = WaitForPid(context.pid, timeout);
    if (status) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it != contexts_.end()) {
            it->second.exit_status = status;
        }
    }
    return status;
}

std::string ProcessExecutor::Logs(const std::string& context_id) {
    const auto context = Snapshot(context_id);
    return ReadFileLimited(context.log_path, options_.max_output_bytes);
}

void ProcessExecutor::Kill(const std::string& context_id) {
    const auto context = Snapshot(context_id);
    if (context.pid <= 0 || context.exit_status) {
        return;
    }
    KillAndReap(context.pid);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(context_id);
    if (it != contexts_.end()) {
        it->second.exit_status = 128 + SIGKILL;
    }
}

void ProcessExecutor::Remove(const std::string& context_id) {
    Context context{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = contexts_.find(context_id);
        if (it == contexts_.end()) {
            return;
        }
        context = it->second;
        contexts_.erase(it);
    }
    ReleaseProcessGroup(context.pid, context.exit_status.has_value());
    std::error_code ec;
    std::filesystem::remove(context.log_path, ec);
    if (ec) {
        throw SandboxError("failed to remove log " + context.log_path + ": " + ec.message());
    }
}

}  // namespace codecred::sandbox
