#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace codecred::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        items.push_back(item);
    }
    return items;
}

std::optional<double> ParseWeight(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void ApplyWeight(std::optional<double>& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ApplySandboxConfig(SandboxConfig& target, const nlohmann::json& sandbox) {
    if (sandbox.contains("backend") && sandbox["backend"].is_string()) {
        target.backend = sandbox["backend"].get<std::string>();
    }
    if (sandbox.contains("interpreter") && sandbox["interpreter"].is_string()) {
        target.interpreter = sandbox["interpreter"].get<std::string>();
    }
    if (sandbox.contains("dockerBinary") && sandbox["dockerBinary"].is_string()) {
        target.docker_binary = sandbox["dockerBinary"].get<std::string>();
    }
    if (sandbox.contains("image") && sandbox["image"].is_string()) {
        target.image = sandbox["image"].get<std::string>();
    }
    if (sandbox.contains("containerInterpreter") && sandbox["containerInterpreter"].is_string()) {
        target.container_interpreter = sandbox["containerInterpreter"].get<std::string>();
    }
    if (sandbox.contains("containerPath") && sandbox["containerPath"].is_string()) {
        target.container_path = sandbox["containerPath"].get<std::string>();
    }
    if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number_integer()) {
        target.timeout_s = sandbox["timeoutS"].get<int>();
    }
    if (sandbox.contains("memoryLimitMb") && sandbox["memoryLimitMb"].is_number_unsigned()) {
        target.memory_limit_mb = sandbox["memoryLimitMb"].get<std::uint64_t>();
    }
    if (sandbox.contains("cpuPeriodUs") && sandbox["cpuPeriodUs"].is_number_integer()) {
        target.cpu_period_us = sandbox["cpuPeriodUs"].get<std::int64_t>();
    }
    if (sandbox.contains("cpuQuotaUs") && sandbox["cpuQuotaUs"].is_number_integer()) {
        target.cpu_quota_us = sandbox["cpuQuotaUs"].get<std::int64_t>();
    }
    if (sandbox.contains("cpuTimeS") && sandbox["cpuTimeS"].is_number_unsigned()) {
        target.cpu_time_s = sandbox["cpuTimeS"].get<std::uint64_t>();
    }
    if (sandbox.contains("networkDisabled") && sandbox["networkDisabled"].is_boolean()) {
        target.network_disabled = sandbox["networkDisabled"].get<bool>();
    }
    if (sandbox.contains("maxOutputBytes") && sandbox["maxOutputBytes"].is_number_unsigned()) {
        target.max_output_bytes = sandbox["maxOutputBytes"].get<std::size_t>();
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto override_path = GetEnv("CODECRED_CONFIG");
    if (!override_path.empty()) {
        return override_path;
    }
    return GetHomePath() / ".codecred" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }

    if (data.contains("scoring") && data["scoring"].is_object()) {
        const auto& section = data["scoring"];
        if (section.contains("weights") && section["weights"].is_object()) {
            const auto& weights = section["weights"];
            scoring::WeightConfig parsed{};
            ApplyWeight(parsed.confidence, weights, "confidence");
            ApplyWeight(parsed.structure, weights, "structure");
            ApplyWeight(parsed.semantic, weights, "semantic");
            ApplyWeight(parsed.execution, weights, "execution");
            config.scoring.weights = parsed;
        }
        if (section.contains("relaxExecutionGate") && section["relaxExecutionGate"].is_boolean()) {
            config.scoring.relax_execution_gate = section["relaxExecutionGate"].get<bool>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = utils::ParseLogLevel(logging["level"].get<std::string>(),
                                                        config.logging.level);
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto backend = GetEnv("CODECRED_SANDBOX_BACKEND");
    if (!backend.empty()) {
        config.sandbox.backend = backend;
    }

    const auto interpreter = GetEnv("CODECRED_SANDBOX_INTERPRETER");
    if (!interpreter.empty()) {
        config.sandbox.interpreter = interpreter;
    }

    const auto image = GetEnv("CODECRED_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto timeout = GetEnv("CODECRED_SANDBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseInt(timeout, config.sandbox.timeout_s);
    }

    const auto memory = GetEnv("CODECRED_SANDBOX_MEMORY_MB");
    if (!memory.empty()) {
        const auto value = ParseInt(memory, -1);
        if (value > 0) {
            config.sandbox.memory_limit_mb = static_cast<std::uint64_t>(value);
        }
    }

    const auto relax = GetEnv("CODECRED_SCORING_RELAX_EXECUTION_GATE");
    if (!relax.empty()) {
        config.scoring.relax_execution_gate = ParseBool(relax);
    }

    // confidence,structure,semantic,execution
    const auto weights = GetEnv("CODECRED_SCORING_WEIGHTS");
    if (!weights.empty()) {
        const auto items = SplitCsv(weights);
        if (items.size() == 4) {
            scoring::WeightConfig parsed{};
            parsed.confidence = ParseWeight(items[0]);
            parsed.structure = ParseWeight(items[1]);
            parsed.semantic = ParseWeight(items[2]);
            parsed.execution = ParseWeight(items[3]);
            config.scoring.weights = parsed;
        } else {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring CODECRED_SCORING_WEIGHTS",
                       {{"expected", "4 values"}, {"got", std::to_string(items.size())}});
        }
    }

    const auto level = GetEnv("CODECRED_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = utils::ParseLogLevel(level, config.logging.level);
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults, config parse failed",
                       {{"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace codecred::config
