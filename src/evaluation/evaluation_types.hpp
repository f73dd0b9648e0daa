#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"
#include "scoring/confidence.hpp"
#include "scoring/credibility.hpp"
#include "scoring/metrics.hpp"

namespace codecred::evaluation {

struct CodeSample {
    std::string code;
    std::vector<scoring::TokenLogprob> logprobs;
};

struct EvaluationReport {
    scoring::ConfidenceSummary confidence;
    std::optional<scoring::StructuralMetrics> structure;
    std::optional<scoring::SemanticMetrics> semantic;
    sandbox::ExecutionResult execution;
    scoring::CredibilityBreakdown breakdown;
    double credibility = 0.0;
};

}  // namespace codecred::evaluation
