#include <gtest/gtest.h>

#include <limits>

#include "scoring/weights.hpp"

using namespace codecred::scoring;

TEST(WeightsTest, AbsentConfigUsesDefaults) {
    const auto weights = NormalizeWeights(std::nullopt);
    EXPECT_DOUBLE_EQ(weights.confidence, 0.10);
    EXPECT_DOUBLE_EQ(weights.structure, 0.15);
    EXPECT_DOUBLE_EQ(weights.semantic, 0.40);
    EXPECT_DOUBLE_EQ(weights.execution, 0.35);
    EXPECT_NEAR(weights.Sum(), 1.0, 1e-12);
}

TEST(WeightsTest, ArbitraryWeightsSumToOne) {
    WeightConfig config{};
    config.confidence = 3.0;
    config.structure = 7.0;
    config.semantic = 0.5;
    config.execution = 11.0;
    const auto weights = NormalizeWeights(config);
    EXPECT_NEAR(weights.Sum(), 1.0, 1e-12);
    EXPECT_NEAR(weights.structure, 7.0 / 21.5, 1e-12);
}

TEST(WeightsTest, MissingKeysCountAsZero) {
    WeightConfig config{};
    config.semantic = 2.0;
    const auto weights = NormalizeWeights(config);
    EXPECT_DOUBLE_EQ(weights.semantic, 1.0);
    EXPECT_DOUBLE_EQ(weights.confidence, 0.0);
    EXPECT_DOUBLE_EQ(weights.structure, 0.0);
    EXPECT_DOUBLE_EQ(weights.execution, 0.0);
}

TEST(WeightsTest, ZeroTotalIsNotDividedByZero) {
    WeightConfig config{0.0, 0.0, 0.0, 0.0};
    const auto weights = NormalizeWeights(config);
    EXPECT_DOUBLE_EQ(weights.Sum(), 0.0);
}

TEST(WeightsTest, NegativeAndNonFiniteWeightsAreClampedToZero) {
    WeightConfig config{};
    config.confidence = -4.0;
    config.structure = std::numeric_limits<double>::quiet_NaN();
    config.semantic = 1.0;
    config.execution = 1.0;
    const auto weights = NormalizeWeights(config);
    EXPECT_DOUBLE_EQ(weights.confidence, 0.0);
    EXPECT_DOUBLE_EQ(weights.structure, 0.0);
    EXPECT_DOUBLE_EQ(weights.semantic, 0.5);
    EXPECT_DOUBLE_EQ(weights.execution, 0.5);
}

TEST(WeightsTest, HugeFiniteWeightsStillSumToOne) {
    const double huge = std::numeric_limits<double>::max() / 2.0;
    WeightConfig config{huge, huge, huge, huge};
    const auto weights = NormalizeWeights(config);
    EXPECT_DOUBLE_EQ(weights.confidence, 0.25);
    EXPECT_DOUBLE_EQ(weights.execution, 0.25);
    EXPECT_DOUBLE_EQ(weights.Sum(), 1.0);
}

TEST(WeightsTest, CallerConfigIsNotModified) {
    const WeightConfig config{1.0, 1.0, 1.0, 1.0};
    const std::optional<WeightConfig> wrapped = config;
    NormalizeWeights(wrapped);
    EXPECT_DOUBLE_EQ(*wrapped->confidence, 1.0);
    EXPECT_DOUBLE_EQ(*wrapped->execution, 1.0);
}
