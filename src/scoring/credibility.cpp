#include "scoring/credibility.hpp"

#include <algorithm>
#include <cmath>

namespace codecred::scoring {
namespace {

constexpr double kIdealCommentDensity = 12.5;

// Structure sub-weights: complexity, comments, imports, function size.
constexpr double kComplexityWeight = 0.40;
constexpr double kCommentWeight = 0.25;
constexpr double kImportWeight = 0.20;
constexpr double kFunctionSizeWeight = 0.15;

double NanToZero(double value) {
    return std::isnan(value) ? 0.0 : value;
}

double InverseRatio(double value, double limit) {
    return 1.0 - std::min(value / limit, 1.0);
}

double TimeNorm(double elapsed_seconds, double timeout_seconds) {
    if (!(timeout_seconds > 0.0)) {
        return 0.0;
    }
    return InverseRatio(elapsed_seconds, timeout_seconds);
}

double RoundTo3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

}  // namespace

double Clamp01(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::max(0.0, std::min(1.0, value));
}

double ConfidenceSubscore(std::optional<double> avg_token_prob, std::optional<double> perplexity) {
    const double ap = Clamp01(avg_token_prob.value_or(0.0));
    const double p = perplexity.value_or(1.0);
    double p_norm = 0.0;
    if (std::isnan(p)) {
        p_norm = 0.0;
    } else if (p <= 10.0) {
        p_norm = 1.0;
    } else {
        p_norm = 1.0 - Clamp01((p - 10.0) / 40.0);
    }
    return Clamp01(0.6 * ap + 0.4 * p_norm);
}

double StructureSubscore(const std::optional<StructuralMetrics>& metrics) {
    const StructuralMetrics values = metrics.value_or(StructuralMetrics{});
    const double cc_score = InverseRatio(NanToZero(values.avg_cyclomatic_complexity), 10.0);
    const double comment_score = InverseRatio(
        std::abs(NanToZero(values.comment_density_percent) - kIdealCommentDensity), kIdealCommentDensity);
    const double import_score = 1.0 - std::min(NanToZero(values.import_redundancy_ratio), 1.0);
    const double size_score = InverseRatio(NanToZero(values.avg_function_size_lines), 30.0);
    return Clamp01(kComplexityWeight * cc_score +
                   kCommentWeight * comment_score +
                   kImportWeight * import_score +
                   kFunctionSizeWeight * size_score);
}

double SemanticSubscore(const std::optional<SemanticMetrics>& metrics) {
    const SemanticMetrics values = metrics.value_or(SemanticMetrics{});
    const double base = Clamp01(values.semantic_quality_score / 100.0);
    // A -1 "tool failed" count is not special-cased: it scores slightly above
    // a clean run (1 - (-1/50) = 1.02) and only the final clamp caps it.
    const double lint_score = InverseRatio(static_cast<double>(values.lint_error_count), 50.0);
    const double type_score = InverseRatio(static_cast<double>(values.typecheck_error_count), 10.0);
    return Clamp01(0.60 * base + 0.25 * lint_score + 0.15 * type_score);
}

double ExecutionSubscore(const std::optional<sandbox::ExecutionResult>& execution,
                         double timeout_seconds,
                         ExecutionGate gate) {
    const bool success = execution && execution->success;
    const double elapsed = execution ? NanToZero(execution->elapsed_seconds) : timeout_seconds;
    double score = 0.0;
    if (success) {
        score = 0.7 * TimeNorm(elapsed, timeout_seconds) + 0.3 * 1.0;
    } else if (gate == ExecutionGate::kRelaxed) {
        score = 0.1 * TimeNorm(elapsed, timeout_seconds);
    }
    return Clamp01(score);
}

CredibilityBreakdown ComputeCredibility(const std::optional<StructuralMetrics>& structure,
                                        const std::optional<SemanticMetrics>& semantic,
                                        const std::optional<sandbox::ExecutionResult>& execution,
                                        std::optional<double> avg_token_prob,
                                        std::optional<double> perplexity,
                                        const std::optional<WeightConfig>& weights,
                                        double timeout_seconds,
                                        ExecutionGate gate) {
    CredibilityBreakdown breakdown{};
    breakdown.weights = NormalizeWeights(weights);
    if (semantic && !semantic->syntax_valid) {
        breakdown.syntax_gated = true;
        return breakdown;
    }

    breakdown.confidence = ConfidenceSubscore(avg_token_prob, perplexity);
    breakdown.structure = StructureSubscore(structure);
    breakdown.semantic = SemanticSubscore(semantic);
    breakdown.execution = ExecutionSubscore(execution, timeout_seconds, gate);

    const auto& w = breakdown.weights;
    breakdown.raw = w.confidence * breakdown.confidence +
                    w.structure * breakdown.structure +
                    w.semantic * breakdown.semantic +
                    w.execution * breakdown.execution;
    breakdown.credibility = RoundTo3(Clamp01(breakdown.raw) * 100.0);
    return breakdown;
}

double Score(const std::optional<StructuralMetrics>& structure,
             const std::optional<SemanticMetrics>& semantic,
             const std::optional<sandbox::ExecutionResult>& execution,
             std::optional<double> avg_token_prob,
             std::optional<double> perplexity,
             const std::optional<WeightConfig>& weights,
             double timeout_seconds,
             ExecutionGate gate) {
    return ComputeCredibility(structure, semantic, execution, avg_token_prob, perplexity,
                              weights, timeout_seconds, gate)
        .credibility;
}

}  // namespace codecred::scoring
