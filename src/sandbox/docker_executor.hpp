#pragma once

#include <chrono>
#include <string>

#include "sandbox/isolated_executor.hpp"

namespace codecred::sandbox {

struct DockerExecutorOptions {
    std::string docker_binary = "docker";
    std::string image = "python:3.11-slim";
    std::string interpreter = "python";
    std::string container_path = "/app/code.py";
    std::chrono::seconds cli_timeout{60};
    std::size_t max_output_bytes = 1024 * 1024;
};

// Drives a container engine through its command-line client. Each context is
// one created (not auto-removed) container.
class DockerExecutor : public IsolatedExecutor {
public:
    explicit DockerExecutor(DockerExecutorOptions options = {});

    std::string Name() const override { return "docker"; }
    std::string Create(const ContextSpec& spec) override;
    void Start(const std::string& context_id) override;
    std::optional<int> WaitFor(const std::string& context_id,
                               std::chrono::milliseconds timeout) override;
    std::string Logs(const std::string& context_id) override;
    void Kill(const std::string& context_id) override;
    void Remove(const std::string& context_id) override;

private:
    DockerExecutorOptions options_;
};

}  // namespace codecred::sandbox
