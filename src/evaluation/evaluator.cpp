#include "evaluation/evaluator.hpp"

#include "sandbox/executor_factory.hpp"
#include "utils/logging.hpp"

namespace codecred::evaluation {

Evaluator::Evaluator(std::shared_ptr<const sandbox::ExecutionSandbox> sandbox,
                     config::ScoringConfig scoring,
                     std::chrono::milliseconds timeout)
    : sandbox_(std::move(sandbox)),
      scoring_(std::move(scoring)),
      timeout_(timeout.count() > 0 ? timeout : sandbox::kDefaultTimeout) {}

EvaluationReport Evaluator::Evaluate(const CodeSample& sample,
                                     const std::optional<scoring::StructuralMetrics>& structure,
                                     const std::optional<scoring::SemanticMetrics>& semantic) const {
    EvaluationReport report{};
    report.structure = structure;
    report.semantic = semantic;
    report.confidence = scoring::SummarizeLogprobs(sample.logprobs, sample.code);
    report.execution = sandbox_->Run(sample.code, timeout_);

    const auto gate = scoring_.relax_execution_gate ? scoring::ExecutionGate::kRelaxed
                                                    : scoring::ExecutionGate::kStrict;
    report.breakdown = scoring::ComputeCredibility(
        structure,
        semantic,
        report.execution,
        report.confidence.avg_prob,
        report.confidence.perplexity,
        scoring_.weights,
        std::chrono::duration<double>(timeout_).count(),
        gate);
    report.credibility = report.breakdown.credibility;

    utils::Log(utils::LogLevel::kInfo, "evaluate", "scored sample",
               {{"credibility", std::to_string(report.credibility)},
                {"success", report.execution.success ? "true" : "false"},
                {"syntax_gated", report.breakdown.syntax_gated ? "true" : "false"}});
    return report;
}

std::unique_ptr<Evaluator> CreateEvaluator(const config::Config& config) {
    return std::make_unique<Evaluator>(
        sandbox::CreateSandbox(config.sandbox),
        config.scoring,
        std::chrono::seconds(config.sandbox.timeout_s));
}

}  // namespace codecred::evaluation
