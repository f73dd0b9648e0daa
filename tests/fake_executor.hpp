#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "sandbox/isolated_executor.hpp"
#include "sandbox/sandbox_error.hpp"

namespace codecred::test {

using sandbox::ContextSpec;
using sandbox::ContextStartError;
using sandbox::ContextWaitError;
using sandbox::IsolatedExecutor;
using sandbox::RuntimeUnavailableError;
using sandbox::SandboxError;

// Scripted executor that records every call made by the sandbox.
class FakeExecutor : public IsolatedExecutor {
public:
    enum class Fail { kNone, kCreate, kStart, kWait, kHostError, kRemove };

    std::optional<int> exit_status = 0;
    std::string logs;
    Fail fail = Fail::kNone;

    std::vector<std::string> calls;
    std::string artifact_path;
    std::string artifact_content;
    bool artifact_existed_at_create = false;
    ContextSpec last_spec;

    std::string Name() const override { return "fake"; }

    std::string Create(const ContextSpec& spec) override {
        calls.push_back("create");
        last_spec = spec;
        artifact_path = spec.artifact_path;
        artifact_existed_at_create = std::filesystem::exists(spec.artifact_path);
        std::ifstream input(spec.artifact_path);
        std::ostringstream buffer;
        buffer << input.rdbuf();
        artifact_content = buffer.str();
        if (fail == Fail::kCreate) {
            throw RuntimeUnavailableError("engine unreachable");
        }
        return "ctx-1";
    }

    void Start(const std::string&) override {
        calls.push_back("start");
        if (fail == Fail::kStart) {
            throw ContextStartError("cannot start");
        }
    }

    std::optional<int> WaitFor(const std::string&, std::chrono::milliseconds) override {
        calls.push_back("wait");
        if (fail == Fail::kWait) {
            throw ContextWaitError("lost the child");
        }
        if (fail == Fail::kHostError) {
            throw std::system_error(std::make_error_code(std::errc::resource_deadlock_would_occur),
                                    "context table lock");
        }
        return exit_status;
    }

    std::string Logs(const std::string&) override {
        calls.push_back("logs");
        return logs;
    }

    void Kill(const std::string&) override { calls.push_back("kill"); }

    void Remove(const std::string&) override {
        calls.push_back("remove");
        if (fail == Fail::kRemove) {
            throw SandboxError("remove failed");
        }
    }

    bool Called(const std::string& name) const {
        for (const auto& call : calls) {
            if (call == name) {
                return true;
            }
        }
        return false;
    }
};


}  // namespace codecred::test
