#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "config/config_loader.hpp"
#include "evaluation/evaluator.hpp"
#include "evaluation/report_json.hpp"
#include "sandbox/executor_factory.hpp"
#include "scoring/credibility.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

void PrintUsage() {
    std::cout << "Usage: codecred_cli run <code.py> [timeout_s]"
              << " | codecred_cli evaluate <response.json>"
              << " | codecred_cli score <metrics.json>" << std::endl;
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::optional<nlohmann::json> ReadJsonFile(const std::filesystem::path& path) {
    const auto text = ReadTextFile(path);
    if (!text) {
        std::cerr << "[cli] cannot read " << path.string() << std::endl;
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(*text);
    } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "[cli] invalid JSON in " << path.string() << ": " << ex.what() << std::endl;
        return std::nullopt;
    }
}

template <typename T, typename Reader>
std::optional<T> ReadBundle(const nlohmann::json& data, const char* key, Reader reader) {
    if (!data.contains(key) || data[key].is_null()) {
        return std::nullopt;
    }
    return reader(data[key]);
}

std::optional<double> ReadOptionalNumber(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_number()) {
        return data[key].get<double>();
    }
    return std::nullopt;
}

int RunCode(const codecred::config::Config& config, const std::string& path, const char* timeout_arg) {
    const auto code = ReadTextFile(path);
    if (!code) {
        std::cerr << "[cli] cannot read " << path << std::endl;
        return 1;
    }
    auto timeout = std::chrono::milliseconds(std::chrono::seconds(config.sandbox.timeout_s));
    if (timeout_arg != nullptr) {
        try {
            timeout = std::chrono::milliseconds(static_cast<long long>(std::stod(timeout_arg) * 1000.0));
        } catch (const std::exception&) {
            std::cerr << "[cli] invalid timeout: " << timeout_arg << std::endl;
            return 1;
        }
    }
    const auto sandbox = codecred::sandbox::CreateSandbox(config.sandbox);
    const auto result = sandbox->Run(*code, timeout);
    std::cout << codecred::evaluation::ToJson(result).dump(4) << std::endl;
    return 0;
}

int EvaluateResponse(const codecred::config::Config& config, const std::string& path) {
    const auto data = ReadJsonFile(path);
    if (!data) {
        return 1;
    }
    const auto sample = codecred::evaluation::CodeSampleFromJson(*data);
    const auto structure = ReadBundle<codecred::scoring::StructuralMetrics>(
        *data, "structure_metrics", codecred::evaluation::StructuralMetricsFromJson);
    const auto semantic = ReadBundle<codecred::scoring::SemanticMetrics>(
        *data, "semantic_metrics", codecred::evaluation::SemanticMetricsFromJson);

    const auto evaluator = codecred::evaluation::CreateEvaluator(config);
    const auto report = evaluator->Evaluate(sample, structure, semantic);
    std::cout << codecred::evaluation::ToJson(report).dump(4) << std::endl;
    return 0;
}

int ScoreMetrics(const codecred::config::Config& config, const std::string& path) {
    const auto data = ReadJsonFile(path);
    if (!data) {
        return 1;
    }
    const auto structure = ReadBundle<codecred::scoring::StructuralMetrics>(
        *data, "structure_metrics", codecred::evaluation::StructuralMetricsFromJson);
    const auto semantic = ReadBundle<codecred::scoring::SemanticMetrics>(
        *data, "semantic_metrics", codecred::evaluation::SemanticMetricsFromJson);
    const auto execution = ReadBundle<codecred::sandbox::ExecutionResult>(
        *data, "execution_metrics", codecred::evaluation::ExecutionResultFromJson);

    const auto gate = config.scoring.relax_execution_gate
        ? codecred::scoring::ExecutionGate::kRelaxed
        : codecred::scoring::ExecutionGate::kStrict;
    const auto breakdown = codecred::scoring::ComputeCredibility(
        structure,
        semantic,
        execution,
        ReadOptionalNumber(*data, "avg_prob"),
        ReadOptionalNumber(*data, "perplexity"),
        config.scoring.weights,
        static_cast<double>(config.sandbox.timeout_s),
        gate);
    std::cout << codecred::evaluation::ToJson(breakdown).dump(4) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }

    const auto config = codecred::config::LoadConfig();
    codecred::utils::ApplyLogConfig({config.logging.level});

    const std::string command = argv[1];
    try {
        if (command == "run") {
            return RunCode(config, argv[2], argc > 3 ? argv[3] : nullptr);
        }
        if (command == "evaluate") {
            return EvaluateResponse(config, argv[2]);
        }
        if (command == "score") {
            return ScoreMetrics(config, argv[2]);
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 1;
}
