#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "scoring/weights.hpp"
#include "utils/logging.hpp"

namespace codecred::config {

struct SandboxConfig {
    // "process" or "docker".
    std::string backend = "process";
    std::string interpreter = "python3";
    std::string docker_binary = "docker";
    std::string image = "python:3.11-slim";
    std::string container_interpreter = "python";
    std::string container_path = "/app/code.py";
    int timeout_s = 5;
    std::uint64_t memory_limit_mb = 100;
    std::int64_t cpu_period_us = 100000;
    std::int64_t cpu_quota_us = 50000;
    std::uint64_t cpu_time_s = 10;
    bool network_disabled = true;
    std::size_t max_output_bytes = 1024 * 1024;
};

struct ScoringConfig {
    std::optional<scoring::WeightConfig> weights;
    bool relax_execution_gate = false;
};

struct LoggingConfig {
    utils::LogLevel level = utils::LogLevel::kInfo;
};

struct Config {
    SandboxConfig sandbox;
    ScoringConfig scoring;
    LoggingConfig logging;
};

}  // namespace codecred::config
