/**
 * @file metrics.hpp
 * @brief Dataset splitting and evaluation metrics for attribution models
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace attributor {
namespace ml {

/**
 * @struct SplitIndices
 * @brief Row indices of a train/test partition
 */
struct SplitIndices {
    std::vector<std::size_t> train;
    std::vector<std::size_t> test;
};

/**
 * @brief Stratified shuffle split
 *
 * The test set receives ceil(n * test_fraction) rows, allocated across
 * classes in proportion to class frequency (largest remainder). Identical
 * inputs and seed always produce the same split.
 *
 * @param labels Class label per row
 * @param test_fraction Fraction of rows held out, in (0, 1)
 * @param seed Shuffle seed
 * @throws std::invalid_argument if a class has fewer than two rows, or if
 *         either side would hold fewer rows than there are classes
 */
SplitIndices StratifiedSplit(const std::vector<std::string>& labels, double test_fraction,
                             std::uint64_t seed);

/**
 * @brief Support-weighted mean of per-class F1 scores
 *
 * Classes are the union of true and predicted labels; each class is weighted
 * by its count in y_true. Classes without true or predicted samples score 0.
 *
 * @throws std::invalid_argument if the inputs differ in length or are empty
 */
double WeightedF1Score(const std::vector<std::string>& y_true, const std::vector<std::string>& y_pred);

} // namespace ml
} // namespace attributor
