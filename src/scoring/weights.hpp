#pragma once

#include <optional>

namespace codecred::scoring {

// Caller-supplied factor weights. Unset keys count as zero once any weight
// config is given.
struct WeightConfig {
    std::optional<double> confidence;
    std::optional<double> structure;
    std::optional<double> semantic;
    std::optional<double> execution;
};

struct NormalizedWeights {
    double confidence = 0.0;
    double structure = 0.0;
    double semantic = 0.0;
    double execution = 0.0;

    double Sum() const { return confidence + structure + semantic + execution; }
};

inline constexpr NormalizedWeights kDefaultWeights{0.10, 0.15, 0.40, 0.35};

// Pure: defaults when config is absent, otherwise each non-negative weight
// divided by the total (a zero total divides by 1).
NormalizedWeights NormalizeWeights(const std::optional<WeightConfig>& config);

}  // namespace codecred::scoring
