#pragma once

#include <memory>
#include <optional>

#include "config/config_schema.hpp"
#include "evaluation/evaluation_types.hpp"
#include "sandbox/execution_sandbox.hpp"

namespace codecred::evaluation {

// One sample through the sandbox and the aggregator. Holds no per-sample
// state, so one instance can serve concurrent callers.
class Evaluator {
public:
    Evaluator(std::shared_ptr<const sandbox::ExecutionSandbox> sandbox,
              config::ScoringConfig scoring,
              std::chrono::milliseconds timeout);

    EvaluationReport Evaluate(const CodeSample& sample,
                              const std::optional<scoring::StructuralMetrics>& structure,
                              const std::optional<scoring::SemanticMetrics>& semantic) const;

private:
    std::shared_ptr<const sandbox::ExecutionSandbox> sandbox_;
    config::ScoringConfig scoring_;
    std::chrono::milliseconds timeout_;
};

std::unique_ptr<Evaluator> CreateEvaluator(const config::Config& config);

}  // namespace codecred::evaluation
