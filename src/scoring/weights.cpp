#include "scoring/weights.hpp"

#include <algorithm>
#include <cmath>

namespace codecred::scoring {
namespace {

double NonNegative(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value) || *value < 0.0) {
        return 0.0;
    }
    return *value;
}

}  // namespace

NormalizedWeights NormalizeWeights(const std::optional<WeightConfig>& config) {
    NormalizedWeights raw = kDefaultWeights;
    if (config) {
        raw.confidence = NonNegative(config->confidence);
        raw.structure = NonNegative(config->structure);
        raw.semantic = NonNegative(config->semantic);
        raw.execution = NonNegative(config->execution);
    }
    // Huge finite weights can overflow the sum; scale by the largest first.
    if (!std::isfinite(raw.Sum())) {
        const double largest = std::max({raw.confidence, raw.structure, raw.semantic, raw.execution});
        raw = {raw.confidence / largest,
               raw.structure / largest,
               raw.semantic / largest,
               raw.execution / largest};
    }
    double total = raw.Sum();
    if (total == 0.0) {
        total = 1.0;
    }
    return {raw.confidence / total,
            raw.structure / total,
            raw.semantic / total,
            raw.execution / total};
}

}  // namespace codecred::scoring
