#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "evaluation/evaluator.hpp"
#include "fake_executor.hpp"

using namespace codecred;
using codecred::test::FakeExecutor;

class EvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor = std::make_shared<FakeExecutor>();
        executor->logs = "2";
        sample.code = "print(1+1)";
        sample.logprobs = {{"print", std::log(0.9)}, {"(1+1)", std::log(0.9)}};

        structure.comment_density_percent = 12.5;
        semantic.semantic_quality_score = 100.0;
    }

    std::unique_ptr<evaluation::Evaluator> MakeEvaluator(config::ScoringConfig scoring_config) {
        auto execution_sandbox = std::make_shared<sandbox::ExecutionSandbox>(executor);
        return std::make_unique<evaluation::Evaluator>(
            execution_sandbox, scoring_config, std::chrono::seconds(5));
    }

    std::shared_ptr<FakeExecutor> executor;
    evaluation::CodeSample sample;
    scoring::StructuralMetrics structure;
    scoring::SemanticMetrics semantic;
};

TEST_F(EvaluatorTest, CombinesExecutionConfidenceAndMetrics) {
    const auto evaluator = MakeEvaluator({});
    const auto report = evaluator->Evaluate(sample, structure, semantic);

    EXPECT_TRUE(report.execution.success);
    EXPECT_EQ(report.execution.captured_output, "2");
    EXPECT_NEAR(report.confidence.avg_prob, 0.9, 1e-12);
    EXPECT_EQ(report.credibility, report.breakdown.credibility);

    const auto expected = scoring::Score(structure, semantic, report.execution,
                                         report.confidence.avg_prob, report.confidence.perplexity);
    EXPECT_DOUBLE_EQ(report.credibility, expected);
    EXPECT_GT(report.credibility, 90.0);
}

TEST_F(EvaluatorTest, InvalidSyntaxScoresZeroButStillRecordsExecution) {
    semantic.syntax_valid = false;
    executor->exit_status = 1;
    executor->logs = "  File \"x.py\", line 1\nSyntaxError: invalid syntax";
    const auto report = MakeEvaluator({})->Evaluate(sample, structure, semantic);
    EXPECT_DOUBLE_EQ(report.credibility, 0.0);
    EXPECT_TRUE(report.breakdown.syntax_gated);
    EXPECT_FALSE(report.execution.success);
    EXPECT_EQ(report.execution.exception_kind, "UnknownError");
}

TEST_F(EvaluatorTest, RelaxedGateCreditsFailedExecution) {
    executor->exit_status = 1;
    executor->logs = "Traceback\nValueError: nope";

    config::ScoringConfig strict{};
    config::ScoringConfig relaxed{};
    relaxed.relax_execution_gate = true;

    const auto strict_report = MakeEvaluator(strict)->Evaluate(sample, structure, semantic);
    const auto relaxed_report = MakeEvaluator(relaxed)->Evaluate(sample, structure, semantic);
    EXPECT_DOUBLE_EQ(strict_report.breakdown.execution, 0.0);
    EXPECT_GT(relaxed_report.breakdown.execution, 0.0);
    EXPECT_LE(relaxed_report.breakdown.execution, 0.1);
    EXPECT_GT(relaxed_report.credibility, strict_report.credibility);
}

TEST_F(EvaluatorTest, ConfiguredWeightsAreApplied) {
    config::ScoringConfig execution_only{};
    execution_only.weights = scoring::WeightConfig{0.0, 0.0, 0.0, 1.0};
    executor->exit_status = 1;
    const auto report = MakeEvaluator(execution_only)->Evaluate(sample, structure, semantic);
    EXPECT_DOUBLE_EQ(report.breakdown.weights.execution, 1.0);
    EXPECT_DOUBLE_EQ(report.credibility, 0.0);
}

TEST_F(EvaluatorTest, MissingBundlesAreTolerated) {
    const auto report = MakeEvaluator({})->Evaluate(sample, std::nullopt, std::nullopt);
    EXPECT_FALSE(report.structure.has_value());
    EXPECT_FALSE(report.breakdown.syntax_gated);
    EXPECT_GE(report.credibility, 0.0);
    EXPECT_LE(report.credibility, 100.0);
}
