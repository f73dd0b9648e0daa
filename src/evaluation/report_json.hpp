#pragma once

#include "nlohmann/json.hpp"

#include "evaluation/evaluation_types.hpp"

namespace codecred::evaluation {

// Readers accept the analyzer output field names; flake8_* and mypy_* are
// aliases for the lint_* and typecheck_* fields. Mistyped fields keep their
// defaults.
scoring::StructuralMetrics StructuralMetricsFromJson(const nlohmann::json& data);
scoring::SemanticMetrics SemanticMetricsFromJson(const nlohmann::json& data);
sandbox::ExecutionResult ExecutionResultFromJson(const nlohmann::json& data);

// {"code": "...", "logprobs": {"content": [{"token", "logprob"}]}} or with
// "logprobs" as a bare array.
CodeSample CodeSampleFromJson(const nlohmann::json& data);

nlohmann::json ToJson(const sandbox::ExecutionResult& result);
nlohmann::json ToJson(const scoring::CredibilityBreakdown& breakdown);
nlohmann::json ToJson(const scoring::ConfidenceSummary& summary, bool include_tokens);
nlohmann::json ToJson(const EvaluationReport& report);

}  // namespace codecred::evaluation
