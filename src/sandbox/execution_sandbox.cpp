#include "sandbox/execution_sandbox.hpp"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codecred::sandbox {
namespace {

double RoundMillis(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return RoundMillis(std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count());
}

std::string FormatSeconds(std::chrono::milliseconds timeout) {
    std::ostringstream oss;
    oss << std::chrono::duration<double>(timeout).count();
    return oss.str();
}

std::filesystem::path StageArtifact(const std::string& code) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto path = std::filesystem::temp_directory_path() /
                      ("codecred_" + stamp + "_" + std::to_string(counter++) + ".py");
    {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw ContextCreateError("cannot stage code at " + path.string());
        }
        output << code;
        if (!output) {
            throw ContextCreateError("cannot write code to " + path.string());
        }
    }
    std::error_code ec;
    std::filesystem::permissions(
        path,
        std::filesystem::perms::owner_read | std::filesystem::perms::group_read |
            std::filesystem::perms::others_read,
        std::filesystem::perm_options::replace,
        ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "could not make artifact read-only",
                   {{"path", path.string()}, {"error", ec.message()}});
    }
    return path;
}

// Removes the context and the staged artifact when the run leaves scope.
class RunCleanup {
public:
    explicit RunCleanup(IsolatedExecutor& executor) : executor_(executor) {}
    RunCleanup(const RunCleanup&) = delete;
    RunCleanup& operator=(const RunCleanup&) = delete;

    ~RunCleanup() {
        if (!context_id_.empty()) {
            try {
                executor_.Remove(context_id_);
            } catch (const std::exception& ex) {
                utils::Log(utils::LogLevel::kWarn, "sandbox", "context cleanup failed",
                           {{"context", context_id_}, {"error", ex.what()}});
            }
        }
        if (!artifact_.empty()) {
            std::error_code ec;
            std::filesystem::remove(artifact_, ec);
            if (ec) {
                utils::Log(utils::LogLevel::kWarn, "sandbox", "artifact cleanup failed",
                           {{"path", artifact_.string()}, {"error", ec.message()}});
            }
        }
    }

    void SetArtifact(std::filesystem::path path) { artifact_ = std::move(path); }
    void SetContext(std::string context_id) { context_id_ = std::move(context_id); }

private:
    IsolatedExecutor& executor_;
    std::filesystem::path artifact_;
    std::string context_id_;
};

}  // namespace

ExecutionSandbox::ExecutionSandbox(std::shared_ptr<IsolatedExecutor> executor,
                                   ResourceLimits limits,
                                   FailureClassifier classifier,
                                   std::chrono::milliseconds default_timeout)
    : executor_(std::move(executor)),
      limits_(limits),
      classifier_(std::move(classifier)),
      default_timeout_(default_timeout.count() > 0 ? default_timeout : kDefaultTimeout) {
    if (!classifier_) {
        classifier_ = ClassifyTracebackFailure;
    }
}

ExecutionResult ExecutionSandbox::Run(const std::string& code) const {
    return Run(code, default_timeout_);
}

ExecutionResult ExecutionSandbox::Run(const std::string& code,
                                      std::chrono::milliseconds timeout) const {
    if (timeout.count() <= 0) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "non-positive timeout, using default",
                   {{"timeout_ms", std::to_string(timeout.count())}});
        timeout = default_timeout_;
    }

    ExecutionResult result{};
    const auto start = std::chrono::steady_clock::now();
    RunCleanup cleanup(*executor_);
    try {
        const auto artifact = StageArtifact(code);
        cleanup.SetArtifact(artifact);

        ContextSpec spec{};
        spec.artifact_path = artifact.string();
        spec.limits = limits_;
        const auto context_id = executor_->Create(spec);
        cleanup.SetContext(context_id);

        executor_->Start(context_id);
        const auto status = executor_->WaitFor(context_id, timeout);
        if (!status) {
            executor_->Kill(context_id);
            result.elapsed_seconds = std::chrono::duration<double>(timeout).count();
            result.exception_kind = "TimeoutError";
            result.exception_message = "Execution exceeded " + FormatSeconds(timeout) + "s limit";
            utils::Log(utils::LogLevel::kInfo, "sandbox", "timed out",
                       {{"backend", executor_->Name()}, {"timeout_s", FormatSeconds(timeout)}});
            return result;
        }

        result.elapsed_seconds = SecondsSince(start);
        result.success = (*status == 0);
        result.captured_output = utils::Trim(executor_->Logs(context_id));
        if (!result.success) {
            auto failure = classifier_(result.captured_output);
            result.exception_kind = std::move(failure.kind);
            result.exception_message = std::move(failure.message);
        }
        utils::Log(utils::LogLevel::kDebug, "sandbox", "finished",
                   {{"backend", executor_->Name()},
                    {"exit", std::to_string(*status)},
                    {"elapsed_s", std::to_string(result.elapsed_seconds)}});
    } catch (const SandboxError& ex) {
        result = ExecutionResult{};
        result.elapsed_seconds = SecondsSince(start);
        result.exception_kind = ex.TypeName();
        result.exception_message = ex.what();
        utils::Log(utils::LogLevel::kError, "sandbox", "runtime failure",
                   {{"backend", executor_->Name()}, {"kind", result.exception_kind},
                    {"error", result.exception_message}});
    } catch (const std::filesystem::filesystem_error& ex) {
        result = ExecutionResult{};
        result.elapsed_seconds = SecondsSince(start);
        result.exception_kind = "FilesystemError";
        result.exception_message = ex.what();
        utils::Log(utils::LogLevel::kError, "sandbox", "staging failure",
                   {{"backend", executor_->Name()}, {"error", result.exception_message}});
    } catch (const std::exception& ex) {
        // Host-side failures outside the sandbox hierarchy (allocation, locks,
        // third-party filesystem errors) are still infrastructure errors.
        result = ExecutionResult{};
        result.elapsed_seconds = SecondsSince(start);
        result.exception_kind = "SandboxError";
        result.exception_message = ex.what();
        utils::Log(utils::LogLevel::kError, "sandbox", "host failure",
                   {{"backend", executor_->Name()}, {"error", result.exception_message}});
    }
    return result;
}

}  // namespace codecred::sandbox
