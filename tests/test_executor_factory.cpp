#include <gtest/gtest.h>

#include <stdexcept>

#include "sandbox/executor_factory.hpp"

using namespace codecred;

TEST(ExecutorFactoryTest, ResolvesLimitsFromConfig) {
    config::SandboxConfig config{};
    config.memory_limit_mb = 256;
    config.cpu_period_us = 200000;
    config.cpu_quota_us = 100000;
    config.network_disabled = false;

    const auto limits = sandbox::ResolveResourceLimits(config);
    EXPECT_EQ(limits.memory_bytes, 256ULL * 1024 * 1024);
    EXPECT_EQ(limits.cpu_period_us, 200000);
    EXPECT_EQ(limits.cpu_quota_us, 100000);
    EXPECT_FALSE(limits.network_disabled);
}

TEST(ExecutorFactoryTest, DefaultBackendIsLocalProcess) {
    const auto execution_sandbox = sandbox::CreateSandbox(config::SandboxConfig{});
    ASSERT_NE(execution_sandbox, nullptr);
    EXPECT_EQ(execution_sandbox->Executor().Name(), "process");
}

TEST(ExecutorFactoryTest, DockerBackendIsSelectable) {
    config::SandboxConfig config{};
    config.backend = "docker";
    const auto executor = sandbox::CreateExecutor(config);
    EXPECT_EQ(executor->Name(), "docker");
}

TEST(ExecutorFactoryTest, UnknownBackendIsRejected) {
    config::SandboxConfig config{};
    config.backend = "firecracker";
    EXPECT_THROW(sandbox::CreateExecutor(config), std::invalid_argument);
}
