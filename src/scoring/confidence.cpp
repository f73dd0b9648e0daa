#include "scoring/confidence.hpp"

#include <cmath>
#include <limits>

#include "utils/common.hpp"

namespace codecred::scoring {

ConfidenceSummary SummarizeLogprobs(const std::vector<TokenLogprob>& tokens,
                                    const std::string& code) {
    ConfidenceSummary summary{};
    summary.tokens.reserve(tokens.size());

    double cumulative = 0.0;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& item = tokens[i];
        const bool finite = std::isfinite(item.logprob);
        if (finite) {
            cumulative += item.logprob;
        }
        summary.total_logprob += item.logprob;

        TokenStat stat{};
        stat.index = static_cast<int>(i) + 1;
        stat.token = item.token;
        stat.logprob = item.logprob;
        stat.probability = finite ? std::exp(item.logprob) : 0.0;
        stat.cumulative_logprob = cumulative;
        summary.tokens.push_back(std::move(stat));
    }

    summary.total_tokens = tokens.empty() ? utils::CountWords(code) : tokens.size();
    summary.avg_logprob = summary.total_tokens > 0
        ? summary.total_logprob / static_cast<double>(summary.total_tokens)
        : 0.0;
    if (std::isfinite(summary.avg_logprob)) {
        summary.avg_prob = std::exp(summary.avg_logprob);
        summary.perplexity = std::exp(-summary.avg_logprob);
    } else {
        summary.avg_prob = 0.0;
        summary.perplexity = std::numeric_limits<double>::infinity();
    }
    return summary;
}

}  // namespace codecred::scoring
