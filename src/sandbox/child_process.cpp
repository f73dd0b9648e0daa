#include "sandbox/child_process.hpp"

#include <boost/process.hpp>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/sandbox_error.hpp"

namespace codecred::sandbox {
namespace bp = boost::process;

namespace {

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::filesystem::path TempLogPath(const std::string& label) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path() /
           ("codecred_" + label + "_" + stamp + "_" + std::to_string(counter++) + ".log");
}

boost::filesystem::path ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        boost::filesystem::path direct(program);
        boost::system::error_code ec;
        if (boost::filesystem::exists(direct, ec)) {
            return direct;
        }
        return {};
    }
    return bp::search_path(program);
}

}  // namespace

std::optional<int> WaitForPid(pid_t pid,
                              std::chrono::milliseconds timeout,
                              std::chrono::milliseconds poll_interval) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return DecodeStatus(status);
        }
        if (waited < 0 && errno != EINTR) {
            throw ContextWaitError("waitpid failed for pid " + std::to_string(pid) +
                                   ": " + std::strerror(errno));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            poll_interval, deadline - now));
    }
}

void KillAndReap(pid_t pid) {
    if (pid <= 0) {
        return;
    }
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

void ReleaseProcessGroup(pid_t pid, bool leader_reaped) {
    if (pid <= 0) {
        return;
    }
    if (!leader_reaped) {
        KillAndReap(pid);
        return;
    }
    // The group id stays valid while any descendant is still alive.
    ::kill(-pid, SIGKILL);
}

std::string ReadFileLimited(const std::string& path, std::size_t max_bytes) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string content(max_bytes + 1, '\0');
    input.read(content.data(), static_cast<std::streamsize>(content.size()));
    content.resize(static_cast<std::size_t>(input.gcount()));
    if (content.size() > max_bytes) {
        content.resize(max_bytes);
        content += "(truncated)";
    }
    return content;
}

pid_t SpawnDetached(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& log_path) {
    const auto exe = ResolveProgram(program);
    if (exe.empty()) {
        throw RuntimeUnavailableError("program not found: " + program);
    }
    try {
        bp::child child(
            exe,
            bp::args(args),
            bp::std_in < bp::null,
            (bp::std_out & bp::std_err) > log_path);
        const pid_t pid = child.id();
        child.detach();
        return pid;
    } catch (const bp::process_error& ex) {
        throw RuntimeUnavailableError(std::string("failed to launch ") + program + ": " + ex.what());
    }
}

CommandResult RunCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout) {
    const auto exe = ResolveProgram(program);
    if (exe.empty()) {
        throw RuntimeUnavailableError("program not found: " + program);
    }
    const auto stdout_path = TempLogPath("stdout");
    const auto stderr_path = TempLogPath("stderr");

    CommandResult result{};
    try {
        bp::child child(
            exe,
            bp::args(args),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());
        const pid_t pid = child.id();
        child.detach();

        const auto status = WaitForPid(pid, timeout);
        if (status) {
            result.exit_code = *status;
        } else {
            result.timed_out = true;
            KillAndReap(pid);
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
        throw RuntimeUnavailableError(std::string("failed to launch ") + program + ": " + ex.what());
    } catch (const SandboxError&) {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
        throw;
    }

    std::ostringstream output_stream;
    std::ostringstream error_stream;
    auto read_file = [&](const std::filesystem::path& path, std::ostringstream& target) {
        std::ifstream input(path);
        if (!input.is_open()) {
            return;
        }
        target << input.rdbuf();
    };
    read_file(stdout_path, output_stream);
    read_file(stderr_path, error_stream);
    result.output = output_stream.str();
    result.error = error_stream.str();

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace codecred::sandbox
