/**
 * @file text_classifier.hpp
 * @brief Binary bag-of-tokens vectorizer and Bernoulli Naive Bayes classifier
 *
 * Implements the attribution model: incidents are split on single spaces,
 * turned into presence/absence vectors over a learned vocabulary and scored
 * with a multi-class Bernoulli Naive Bayes model. The fitted pipeline can be
 * serialized to JSON for storage in a model artifact.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace attributor {
namespace ml {

/// Sparse binary row: sorted, unique indices of active features
using BinaryRow = std::vector<std::size_t>;

/**
 * @class BinaryVectorizer
 * @brief Token presence vectorizer with a sorted vocabulary
 */
class BinaryVectorizer {
public:
    /**
     * @brief Split a document on single spaces, dropping empty tokens
     */
    static std::vector<std::string> Tokenize(const std::string& document);

    /**
     * @brief Learn the vocabulary (sorted lexicographically)
     */
    void Fit(const std::vector<std::string>& documents);

    /**
     * @brief Encode a document; tokens outside the vocabulary are ignored
     */
    BinaryRow Transform(const std::string& document) const;

    std::size_t VocabularySize() const { return vocabulary_.size(); }
    const std::map<std::string, std::size_t>& Vocabulary() const { return vocabulary_; }

    /// Rebuild from feature names ordered by index
    void SetFeatureNames(const std::vector<std::string>& names);
    std::vector<std::string> FeatureNames() const;

private:
    std::map<std::string, std::size_t> vocabulary_;
};

/**
 * @class BernoulliNaiveBayes
 * @brief Multi-class Naive Bayes over binary features
 *
 * P(x_j = 1 | c) = (N_cj + alpha) / (N_c + 2 alpha), prior P(c) = N_c / N.
 * Absent features contribute log(1 - P(x_j = 1 | c)).
 */
class BernoulliNaiveBayes {
public:
    explicit BernoulliNaiveBayes(double alpha = 1.0);

    /**
     * @brief Fit on encoded rows
     * @param rows Encoded samples
     * @param labels Class index per row, in [0, class_count)
     * @param class_count Number of classes
     * @param feature_count Vocabulary size
     * @throws std::invalid_argument on size mismatch or out-of-range labels
     */
    void Fit(const std::vector<BinaryRow>& rows, const std::vector<std::size_t>& labels,
             std::size_t class_count, std::size_t feature_count);

    /**
     * @brief Posterior probabilities, one per class, summing to one
     * @throws std::logic_error if not fitted
     */
    std::vector<double> PredictProba(const BinaryRow& row) const;

    /**
     * @brief Index of the most probable class (first on ties)
     */
    std::size_t Predict(const BinaryRow& row) const;

    bool IsFitted() const { return !class_log_prior_.empty(); }
    std::size_t ClassCount() const { return class_log_prior_.size(); }
    std::size_t FeatureCount() const { return feature_count_; }
    double Alpha() const { return alpha_; }

    const std::vector<double>& ClassLogPrior() const { return class_log_prior_; }
    const std::vector<std::vector<double>>& FeatureLogProb() const { return feature_log_prob_; }

    /**
     * @brief Restore fitted parameters
     * @throws std::invalid_argument if shapes are inconsistent or values are not log-probabilities
     */
    void SetParameters(double alpha, std::vector<double> class_log_prior,
                       std::vector<std::vector<double>> feature_log_prob);

private:
    std::vector<double> JointLogLikelihood(const BinaryRow& row) const;
    void PrecomputeScoringTerms();

    double alpha_;
    std::size_t feature_count_{0};
    std::vector<double> class_log_prior_;
    std::vector<std::vector<double>> feature_log_prob_;

    // log p - log(1 - p) per class/feature and sum_j log(1 - p) per class
    std::vector<std::vector<double>> log_odds_;
    std::vector<double> absent_log_sum_;
};

/**
 * @class TextClassifier
 * @brief Tokenize -> binary vectorize -> Bernoulli Naive Bayes pipeline
 *
 * **Usage Example**:
 * @code
 * TextClassifier classifier;
 * classifier.Fit(incidents, labels);
 *
 * auto proba = classifier.PredictProba("malware-PoisonIvy attack-pattern-T1003");
 * for (std::size_t i = 0; i < proba.size(); ++i) {
 *     std::cout << classifier.Classes()[i] << ": " << proba[i] << "\n";
 * }
 *
 * nlohmann::json blob = classifier.ToJson();
 * auto restored = TextClassifier::FromJson(blob);
 * @endcode
 */
class TextClassifier {
public:
    /**
     * @struct Config
     * @brief Pipeline configuration
     */
    struct Config {
        double alpha{1.0};   ///< Laplace/Lidstone smoothing
    };

    TextClassifier();
    explicit TextClassifier(const Config& config);

    /**
     * @brief Fit vocabulary and model
     *
     * Classes are the distinct labels in lexicographic order.
     *
     * @throws std::invalid_argument if documents and labels differ in size or are empty
     */
    void Fit(const std::vector<std::string>& documents, const std::vector<std::string>& labels);

    /**
     * @brief Class probabilities aligned with Classes()
     * @throws std::logic_error if not fitted
     */
    std::vector<double> PredictProba(const std::string& document) const;

    /**
     * @brief Most probable label
     * @throws std::logic_error if not fitted
     */
    std::string Predict(const std::string& document) const;

    std::vector<std::string> Predict(const std::vector<std::string>& documents) const;

    const std::vector<std::string>& Classes() const { return classes_; }
    bool IsFitted() const { return model_.IsFitted(); }
    const BinaryVectorizer& Vectorizer() const { return vectorizer_; }

    /**
     * @brief Serialize the fitted pipeline
     */
    nlohmann::json ToJson() const;

    /**
     * @brief Restore a pipeline serialized by ToJson()
     * @throws std::invalid_argument on missing fields or inconsistent shapes
     */
    static TextClassifier FromJson(const nlohmann::json& blob);

    /// Format tag written into serialized blobs
    static constexpr const char* kFormat = "attributor.bernoulli-nb";
    static constexpr int kFormatVersion = 1;

private:
    void EnsureFitted() const;

    Config config_;
    BinaryVectorizer vectorizer_;
    BernoulliNaiveBayes model_;
    std::vector<std::string> classes_;
};

} // namespace ml
} // namespace attributor
