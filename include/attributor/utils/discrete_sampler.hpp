/**
 * @file discrete_sampler.hpp
 * @brief Exact sampling from finite discrete distributions
 *
 * Provides the Beta-Binomial probability mass function used to model
 * incident sizes and a Walker/Vose alias table that draws from any finite
 * pmf in constant time after linear setup.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace attributor {
namespace utils {

/**
 * @brief Beta-Binomial(n, alpha, beta) pmf over the support 0..n
 *
 * Evaluated in log space through std::lgamma so large n stays stable.
 *
 * @return n + 1 probabilities summing to one
 * @throws std::invalid_argument if n < 0 or alpha/beta are not positive
 */
std::vector<double> BetaBinomialPmf(int n, double alpha, double beta);

/**
 * @class AliasSampler
 * @brief Walker alias table over indices 0..weights.size()-1
 *
 * **Usage Example**:
 * @code
 * AliasSampler sampler(BetaBinomialPmf(40, 1.5, 10.0));
 * std::mt19937_64 rng{std::random_device{}()};
 * int size = 10 + static_cast<int>(sampler.Sample(rng));
 * @endcode
 */
class AliasSampler {
public:
    /**
     * @brief Build the alias table
     * @param weights Non-negative weights; need not be normalized
     * @throws std::invalid_argument if weights are empty, negative or all zero
     */
    explicit AliasSampler(const std::vector<double>& weights);

    /**
     * @brief Draw one index
     */
    std::size_t Sample(std::mt19937_64& rng) const;

    std::size_t Size() const { return probability_.size(); }

private:
    std::vector<double> probability_;
    std::vector<std::size_t> alias_;
};

} // namespace utils
} // namespace attributor
