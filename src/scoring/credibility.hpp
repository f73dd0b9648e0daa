#pragma once

#include <optional>

#include "sandbox/execution_result.hpp"
#include "scoring/metrics.hpp"
#include "scoring/weights.hpp"

namespace codecred::scoring {

// How a failed execution is credited.
enum class ExecutionGate {
    kStrict,   // failure contributes nothing
    kRelaxed   // failure earns up to 0.1, scaled by how quickly it ended
};

inline constexpr double kDefaultTimeoutSeconds = 5.0;

struct CredibilityBreakdown {
    bool syntax_gated = false;
    NormalizedWeights weights;
    double confidence = 0.0;
    double structure = 0.0;
    double semantic = 0.0;
    double execution = 0.0;
    double raw = 0.0;
    // 0..100, three decimals.
    double credibility = 0.0;
};

double Clamp01(double value);

double ConfidenceSubscore(std::optional<double> avg_token_prob, std::optional<double> perplexity);
double StructureSubscore(const std::optional<StructuralMetrics>& metrics);
double SemanticSubscore(const std::optional<SemanticMetrics>& metrics);
double ExecutionSubscore(const std::optional<sandbox::ExecutionResult>& execution,
                         double timeout_seconds,
                         ExecutionGate gate);

// Absent bundles are read as all-zero (an absent semantic bundle does not
// trip the syntax gate). Never throws; keeps no state.
CredibilityBreakdown ComputeCredibility(const std::optional<StructuralMetrics>& structure,
                                        const std::optional<SemanticMetrics>& semantic,
                                        const std::optional<sandbox::ExecutionResult>& execution,
                                        std::optional<double> avg_token_prob,
                                        std::optional<double> perplexity,
                                        const std::optional<WeightConfig>& weights = std::nullopt,
                                        double timeout_seconds = kDefaultTimeoutSeconds,
                                        ExecutionGate gate = ExecutionGate::kStrict);

double Score(const std::optional<StructuralMetrics>& structure,
             const std::optional<SemanticMetrics>& semantic,
             const std::optional<sandbox::ExecutionResult>& execution,
             std::optional<double> avg_token_prob,
             std::optional<double> perplexity,
             const std::optional<WeightConfig>& weights = std::nullopt,
             double timeout_seconds = kDefaultTimeoutSeconds,
             ExecutionGate gate = ExecutionGate::kStrict);

}  // namespace codecred::scoring
