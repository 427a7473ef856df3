/**
 * @file discrete_sampler.cpp
 * @brief Beta-Binomial pmf and Vose alias-table construction
 *
 * **Alias method** (Vose, 1991):
 * ```
 * 1. Scale weights so their mean is 1
 * 2. Partition indices into "small" (< 1) and "large" (>= 1)
 * 3. Pair each small index with a large donor until one list empties
 * 4. Remaining indices get probability 1
 * ```
 * A draw picks a column uniformly, then flips a biased coin between the
 * column and its alias.
 *
 * @date 2025
 */

#include "attributor/utils/discrete_sampler.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace attributor {
namespace utils {

namespace {

double LogBeta(double a, double b) {
    return std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
}

double LogChoose(int n, int k) {
    return std::lgamma(n + 1.0) - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0);
}

} // anonymous namespace

// ============================================================================
// BETA-BINOMIAL PMF
// ============================================================================

std::vector<double> BetaBinomialPmf(int n, double alpha, double beta) {
    if (n < 0) {
        throw std::invalid_argument("Beta-Binomial trials must be non-negative");
    }
    if (!(alpha > 0.0) || !(beta > 0.0)) {
        throw std::invalid_argument("Beta-Binomial shape parameters must be positive");
    }

    std::vector<double> pmf(static_cast<std::size_t>(n) + 1);
    const double log_norm = LogBeta(alpha, beta);
    for (int k = 0; k <= n; ++k) {
        pmf[k] = std::exp(LogChoose(n, k) + LogBeta(k + alpha, n - k + beta) - log_norm);
    }

    // Renormalize away accumulated rounding
    double total = std::accumulate(pmf.begin(), pmf.end(), 0.0);
    for (auto& p : pmf) {
        p /= total;
    }
    return pmf;
}

// ============================================================================
// ALIAS TABLE
// ============================================================================

AliasSampler::AliasSampler(const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("Alias sampler needs at least one weight");
    }

    double total = 0.0;
    for (double w : weights) {
        if (w < 0.0 || !std::isfinite(w)) {
            throw std::invalid_argument("Alias sampler weights must be finite and non-negative");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw std::invalid_argument("Alias sampler weights sum to zero");
    }

    const std::size_t n = weights.size();
    probability_.assign(n, 0.0);
    alias_.assign(n, 0);

    std::vector<double> scaled(n);
    std::vector<std::size_t> small;
    std::vector<std::size_t> large;
    small.reserve(n);
    large.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        scaled[i] = weights[i] * static_cast<double>(n) / total;
        if (scaled[i] < 1.0) {
            small.push_back(i);
        } else {
            large.push_back(i);
        }
    }

    while (!small.empty() && !large.empty()) {
        std::size_t less = small.back();
        small.pop_back();
        std::size_t more = large.back();
        large.pop_back();

        probability_[less] = scaled[less];
        alias_[less] = more;

        scaled[more] = (scaled[more] + scaled[less]) - 1.0;
        if (scaled[more] < 1.0) {
            small.push_back(more);
        } else {
            large.push_back(more);
        }
    }

    // Leftovers are full columns (numerical slack lands here too)
    for (std::size_t i : large) {
        probability_[i] = 1.0;
        alias_[i] = i;
    }
    for (std::size_t i : small) {
        probability_[i] = 1.0;
        alias_[i] = i;
    }
}

std::size_t AliasSampler::Sample(std::mt19937_64& rng) const {
    std::uniform_int_distribution<std::size_t> column(0, probability_.size() - 1);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    std::size_t i = column(rng);
    return coin(rng) < probability_[i] ? i : alias_[i];
}

} // namespace utils
} // namespace attributor
