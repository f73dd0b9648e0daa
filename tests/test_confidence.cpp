#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "scoring/confidence.hpp"

using namespace codecred::scoring;

TEST(ConfidenceSummaryTest, AverageProbabilityAndPerplexityFromLogprobs) {
    const std::vector<TokenLogprob> tokens = {
        {"def", std::log(0.5)},
        {" f", std::log(0.5)},
        {"()", std::log(0.5)},
    };
    const auto summary = SummarizeLogprobs(tokens, "def f(): pass");
    EXPECT_EQ(summary.total_tokens, 3u);
    EXPECT_NEAR(summary.avg_prob, 0.5, 1e-12);
    EXPECT_NEAR(summary.perplexity, 2.0, 1e-12);
    EXPECT_NEAR(summary.total_logprob, 3.0 * std::log(0.5), 1e-12);
}

TEST(ConfidenceSummaryTest, TracksPerTokenProbabilityAndCumulativeLogprob) {
    const std::vector<TokenLogprob> tokens = {{"a", 0.0}, {"b", std::log(0.25)}};
    const auto summary = SummarizeLogprobs(tokens, "");
    ASSERT_EQ(summary.tokens.size(), 2u);
    EXPECT_EQ(summary.tokens[0].index, 1);
    EXPECT_EQ(summary.tokens[1].token, "b");
    EXPECT_NEAR(summary.tokens[0].probability, 1.0, 1e-12);
    EXPECT_NEAR(summary.tokens[1].probability, 0.25, 1e-12);
    EXPECT_NEAR(summary.tokens[1].cumulative_logprob, std::log(0.25), 1e-12);
}

TEST(ConfidenceSummaryTest, WithoutTokensFallsBackToWordCount) {
    const auto summary = SummarizeLogprobs({}, "print(1 + 1)\nx = 2");
    EXPECT_EQ(summary.total_tokens, 6u);
    EXPECT_DOUBLE_EQ(summary.avg_logprob, 0.0);
    EXPECT_DOUBLE_EQ(summary.avg_prob, 1.0);
    EXPECT_DOUBLE_EQ(summary.perplexity, 1.0);
}

TEST(ConfidenceSummaryTest, EmptyCodeAndNoTokens) {
    const auto summary = SummarizeLogprobs({}, "   ");
    EXPECT_EQ(summary.total_tokens, 0u);
    EXPECT_DOUBLE_EQ(summary.avg_prob, 1.0);
}

TEST(ConfidenceSummaryTest, InfiniteLogprobMakesAverageNonFinite) {
    const std::vector<TokenLogprob> tokens = {
        {"x", std::log(0.9)},
        {"y", -std::numeric_limits<double>::infinity()},
    };
    const auto summary = SummarizeLogprobs(tokens, "x y");
    EXPECT_DOUBLE_EQ(summary.avg_prob, 0.0);
    EXPECT_TRUE(std::isinf(summary.perplexity));
    EXPECT_DOUBLE_EQ(summary.tokens[1].probability, 0.0);
    EXPECT_NEAR(summary.tokens[1].cumulative_logprob, std::log(0.9), 1e-12);
}
