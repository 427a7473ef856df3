/**
 * @file metrics.cpp
 * @brief Implementation of stratified splitting and weighted F1
 *
 * @date 2025
 */

#include "attributor/ml/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <random>
#include <set>
#include <stdexcept>

namespace attributor {
namespace ml {

// ============================================================================
// STRATIFIED SPLIT
// ============================================================================

SplitIndices StratifiedSplit(const std::vector<std::string>& labels, double test_fraction,
                             std::uint64_t seed) {
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("Test fraction must lie strictly between 0 and 1");
    }

    std::map<std::string, std::vector<std::size_t>> by_class;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        by_class[labels[i]].push_back(i);
    }

    const std::size_t n = labels.size();
    const std::size_t class_count = by_class.size();
    const auto n_test = static_cast<std::size_t>(std::ceil(static_cast<double>(n) * test_fraction));
    const std::size_t n_train = n - std::min(n, n_test);

    for (const auto& [label, rows] : by_class) {
        if (rows.size() < 2) {
            throw std::invalid_argument("Class '" + label + "' has fewer than two samples");
        }
    }
    if (n_test < class_count || n_train < class_count) {
        throw std::invalid_argument("Split sizes (" + std::to_string(n_train) + " train, " +
                                    std::to_string(n_test) + " test) are smaller than the " +
                                    std::to_string(class_count) + " classes");
    }

    // Largest-remainder allocation of test rows per class
    struct Allocation {
        std::string label;
        std::size_t count;
        double remainder;
    };
    std::vector<Allocation> allocations;
    std::size_t allocated = 0;
    for (const auto& [label, rows] : by_class) {
        const double exact = static_cast<double>(rows.size()) * static_cast<double>(n_test) / static_cast<double>(n);
        // Keep at least one row per class on each side
        auto count = std::clamp<std::size_t>(static_cast<std::size_t>(std::floor(exact)), 1, rows.size() - 1);
        allocations.push_back({label, count, exact - std::floor(exact)});
        allocated += count;
    }

    std::stable_sort(allocations.begin(), allocations.end(),
                     [](const Allocation& a, const Allocation& b) { return a.remainder > b.remainder; });
    for (auto it = allocations.begin(); allocated < n_test && it != allocations.end(); ++it) {
        if (it->count + 1 < by_class[it->label].size()) {
            ++it->count;
            ++allocated;
        }
    }

    std::mt19937_64 rng(seed);
    SplitIndices split;
    std::sort(allocations.begin(), allocations.end(),
              [](const Allocation& a, const Allocation& b) { return a.label < b.label; });
    for (const auto& allocation : allocations) {
        auto rows = by_class[allocation.label];
        std::shuffle(rows.begin(), rows.end(), rng);
        auto boundary = rows.begin() + static_cast<std::ptrdiff_t>(allocation.count);
        split.test.insert(split.test.end(), rows.begin(), boundary);
        split.train.insert(split.train.end(), boundary, rows.end());
    }

    std::shuffle(split.train.begin(), split.train.end(), rng);
    std::shuffle(split.test.begin(), split.test.end(), rng);
    return split;
}

// ============================================================================
// WEIGHTED F1
// ============================================================================

double WeightedF1Score(const std::vector<std::string>& y_true, const std::vector<std::string>& y_pred) {
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument("True and predicted labels differ in length");
    }
    if (y_true.empty()) {
        throw std::invalid_argument("Cannot score an empty prediction set");
    }

    std::set<std::string> classes(y_true.begin(), y_true.end());
    classes.insert(y_pred.begin(), y_pred.end());

    std::map<std::string, std::size_t> true_positive;
    std::map<std::string, std::size_t> false_positive;
    std::map<std::string, std::size_t> false_negative;
    std::map<std::string, std::size_t> support;

    for (std::size_t i = 0; i < y_true.size(); ++i) {
        ++support[y_true[i]];
        if (y_true[i] == y_pred[i]) {
            ++true_positive[y_true[i]];
        } else {
            ++false_positive[y_pred[i]];
            ++false_negative[y_true[i]];
        }
    }

    double weighted = 0.0;
    for (const auto& label : classes) {
        const double tp = static_cast<double>(true_positive[label]);
        const double denominator = 2.0 * tp + static_cast<double>(false_positive[label] + false_negative[label]);
        const double f1 = denominator > 0.0 ? 2.0 * tp / denominator : 0.0;
        weighted += f1 * static_cast<double>(support[label]);
    }

    return weighted / static_cast<double>(y_true.size());
}

} // namespace ml
} // namespace attributor
