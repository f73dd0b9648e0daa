#include "evaluation/report_json.hpp"

#include <cmath>
#include <limits>

namespace codecred::evaluation {
namespace {

template <typename T>
void ReadNumber(const nlohmann::json& data, const char* key, T& target) {
    if (data.contains(key) && data[key].is_number()) {
        target = data[key].get<T>();
    }
}

void ReadString(const nlohmann::json& data, const char* key, std::string& target) {
    if (data.contains(key) && data[key].is_string()) {
        target = data[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& data, const char* key, bool& target) {
    if (data.contains(key) && data[key].is_boolean()) {
        target = data[key].get<bool>();
    }
}

void ReadCounts(const nlohmann::json& data, const char* key, std::map<std::string, int>& target) {
    if (!data.contains(key) || !data[key].is_object()) {
        return;
    }
    target.clear();
    for (const auto& [name, value] : data[key].items()) {
        if (value.is_number()) {
            target[name] = value.get<int>();
        }
    }
}

nlohmann::json FiniteOrNull(double value) {
    return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
}

}  // namespace

scoring::StructuralMetrics StructuralMetricsFromJson(const nlohmann::json& data) {
    scoring::StructuralMetrics metrics{};
    if (!data.is_object()) {
        return metrics;
    }
    ReadNumber(data, "token_count", metrics.token_count);
    ReadNumber(data, "function_count", metrics.function_count);
    ReadNumber(data, "class_count", metrics.class_count);
    ReadNumber(data, "num_lines", metrics.num_lines);
    ReadNumber(data, "num_nonempty_lines", metrics.num_nonempty_lines);
    ReadNumber(data, "import_count", metrics.import_count);
    ReadNumber(data, "ast_depth", metrics.ast_depth);
    ReadNumber(data, "avg_cyclomatic_complexity", metrics.avg_cyclomatic_complexity);
    ReadNumber(data, "max_cyclomatic_complexity", metrics.max_cyclomatic_complexity);
    ReadNumber(data, "comment_density_percent", metrics.comment_density_percent);
    ReadNumber(data, "avg_function_size_lines", metrics.avg_function_size_lines);
    ReadNumber(data, "import_redundancy_ratio", metrics.import_redundancy_ratio);
    return metrics;
}

scoring::SemanticMetrics SemanticMetricsFromJson(const nlohmann::json& data) {
    scoring::SemanticMetrics metrics{};
    if (!data.is_object()) {
        return metrics;
    }
    ReadBool(data, "syntax_valid", metrics.syntax_valid);
    ReadNumber(data, "flake8_error_count", metrics.lint_error_count);
    ReadNumber(data, "lint_error_count", metrics.lint_error_count);
    ReadCounts(data, "flake8_error_breakdown", metrics.lint_error_breakdown);
    ReadCounts(data, "lint_error_breakdown", metrics.lint_error_breakdown);
    ReadNumber(data, "mypy_error_count", metrics.typecheck_error_count);
    ReadNumber(data, "typecheck_error_count", metrics.typecheck_error_count);
    ReadCounts(data, "mypy_error_breakdown", metrics.typecheck_error_breakdown);
    ReadCounts(data, "typecheck_error_breakdown", metrics.typecheck_error_breakdown);
    ReadNumber(data, "semantic_quality_score", metrics.semantic_quality_score);
    return metrics;
}

sandbox::ExecutionResult ExecutionResultFromJson(const nlohmann::json& data) {
    sandbox::ExecutionResult result{};
    if (!data.is_object()) {
        return result;
    }
    ReadBool(data, "execution_success", result.success);
    ReadBool(data, "success", result.success);
    ReadNumber(data, "execution_time_sec", result.elapsed_seconds);
    ReadNumber(data, "elapsed_seconds", result.elapsed_seconds);
    ReadString(data, "exception_type", result.exception_kind);
    ReadString(data, "exception_kind", result.exception_kind);
    ReadString(data, "exception_message", result.exception_message);
    ReadString(data, "runtime_output", result.captured_output);
    ReadString(data, "captured_output", result.captured_output);
    return result;
}

CodeSample CodeSampleFromJson(const nlohmann::json& data) {
    CodeSample sample{};
    if (!data.is_object()) {
        return sample;
    }
    ReadString(data, "code", sample.code);
    if (!data.contains("logprobs")) {
        return sample;
    }
    const nlohmann::json* entries = &data["logprobs"];
    if (entries->is_object() && entries->contains("content")) {
        entries = &(*entries)["content"];
    }
    if (!entries->is_array()) {
        return sample;
    }
    for (const auto& item : *entries) {
        if (!item.is_object()) {
            continue;
        }
        scoring::TokenLogprob token{};
        ReadString(item, "token", token.token);
        if (item.contains("logprob") && item["logprob"].is_number()) {
            token.logprob = item["logprob"].get<double>();
        } else {
            token.logprob = -std::numeric_limits<double>::infinity();
        }
        sample.logprobs.push_back(std::move(token));
    }
    return sample;
}

nlohmann::json ToJson(const sandbox::ExecutionResult& result) {
    return {
        {"execution_success", result.success},
        {"execution_time_sec", result.elapsed_seconds},
        {"exception_type", result.exception_kind},
        {"exception_message", result.exception_message},
        {"runtime_output", result.captured_output}
    };
}

nlohmann::json ToJson(const scoring::CredibilityBreakdown& breakdown) {
    return {
        {"syntax_gated", breakdown.syntax_gated},
        {"weights", {
            {"confidence", breakdown.weights.confidence},
            {"structure", breakdown.weights.structure},
            {"semantic", breakdown.weights.semantic},
            {"execution", breakdown.weights.execution}
        }},
        {"confidence_score", breakdown.confidence},
        {"structure_score", breakdown.structure},
        {"semantic_score", breakdown.semantic},
        {"execution_score", breakdown.execution},
        {"raw", breakdown.raw},
        {"credibility", breakdown.credibility}
    };
}

nlohmann::json ToJson(const scoring::ConfidenceSummary& summary, bool include_tokens) {
    nlohmann::json json = {
        {"total_tokens", summary.total_tokens},
        {"total_logprob", FiniteOrNull(summary.total_logprob)},
        {"avg_logprob", FiniteOrNull(summary.avg_logprob)},
        {"avg_prob", summary.avg_prob},
        {"perplexity", FiniteOrNull(summary.perplexity)}
    };
    if (include_tokens) {
        nlohmann::json tokens = nlohmann::json::array();
        for (const auto& stat : summary.tokens) {
            tokens.push_back({
                {"index", stat.index},
                {"token", stat.token},
                {"logprob", FiniteOrNull(stat.logprob)},
                {"probability", stat.probability},
                {"cumulative_logprob", stat.cumulative_logprob}
            });
        }
        json["tokens"] = std::move(tokens);
    }
    return json;
}

nlohmann::json ToJson(const EvaluationReport& report) {
    nlohmann::json json = ToJson(report.confidence, false);
    if (report.structure) {
        const auto& s = *report.structure;
        json["avg_cyclomatic_complexity"] = s.avg_cyclomatic_complexity;
        json["max_cyclomatic_complexity"] = s.max_cyclomatic_complexity;
        json["comment_density_percent"] = s.comment_density_percent;
        json["avg_function_size_lines"] = s.avg_function_size_lines;
        json["import_redundancy_ratio"] = s.import_redundancy_ratio;
        json["function_count"] = s.function_count;
        json["class_count"] = s.class_count;
        json["num_lines"] = s.num_lines;
    }
    if (report.semantic) {
        const auto& s = *report.semantic;
        json["syntax_valid"] = s.syntax_valid;
        json["lint_error_count"] = s.lint_error_count;
        json["lint_error_breakdown"] = s.lint_error_breakdown;
        json["typecheck_error_count"] = s.typecheck_error_count;
        json["typecheck_error_breakdown"] = s.typecheck_error_breakdown;
        json["semantic_quality_score"] = s.semantic_quality_score;
    }
    json.update(ToJson(report.execution));
    json["breakdown"] = ToJson(report.breakdown);
    json["total_credibility"] = report.credibility;
    return json;
}

}  // namespace codecred::evaluation
