#pragma once

#include <string>
#include <vector>

namespace codecred::scoring {

struct TokenLogprob {
    std::string token;
    double logprob = 0.0;
};

struct TokenStat {
    int index = 0;
    std::string token;
    double logprob = 0.0;
    double probability = 0.0;
    double cumulative_logprob = 0.0;
};

struct ConfidenceSummary {
    std::size_t total_tokens = 0;
    double total_logprob = 0.0;
    double avg_logprob = 0.0;
    double avg_prob = 0.0;
    double perplexity = 0.0;
    std::vector<TokenStat> tokens;
};

// Average token probability is exp(mean logprob) and perplexity is
// exp(-mean logprob). With no tokens the code's word count is the divisor.
// Any -inf logprob makes the mean non-finite: avg_prob 0, perplexity +inf.
ConfidenceSummary SummarizeLogprobs(const std::vector<TokenLogprob>& tokens,
                                    const std::string& code);

}  // namespace codecred::scoring
