/**
 * @file text_classifier.cpp
 * @brief Implementation of the Bernoulli Naive Bayes text pipeline
 *
 * **Scoring**:
 * ```
 * jll(c) = log P(c) + sum_j [ x_j log p_cj + (1 - x_j) log(1 - p_cj) ]
 *        = log P(c) + sum_j log(1 - p_cj) + sum_{j: x_j = 1} (log p_cj - log(1 - p_cj))
 * ```
 * The second form only touches active features, so scoring cost is
 * proportional to the incident length rather than the vocabulary size.
 * Posteriors are normalized with log-sum-exp.
 *
 * **Serialized Blob**:
 * ```json
 * {
 *   "format": "attributor.bernoulli-nb",
 *   "format_version": 1,
 *   "alpha": 1.0,
 *   "classes": ["APT1_intrusion-set--...", ...],
 *   "features": ["attack-pattern-T1003", ...],
 *   "class_log_prior": [...],
 *   "feature_log_prob": [[...], ...]
 * }
 * ```
 *
 * @date 2025
 */

#include "attributor/ml/text_classifier.hpp"
#include "attributor/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace attributor {
namespace ml {

using json = nlohmann::json;

// ============================================================================
// BINARY VECTORIZER
// ============================================================================

std::vector<std::string> BinaryVectorizer::Tokenize(const std::string& document) {
    return utils::StringUtils::Split(document, ' ');
}

void BinaryVectorizer::Fit(const std::vector<std::string>& documents) {
    std::set<std::string> tokens;
    for (const auto& document : documents) {
        for (auto& token : Tokenize(document)) {
            tokens.insert(std::move(token));
        }
    }

    vocabulary_.clear();
    std::size_t index = 0;
    for (const auto& token : tokens) {
        vocabulary_.emplace(token, index++);
    }
}

BinaryRow BinaryVectorizer::Transform(const std::string& document) const {
    BinaryRow row;
    for (const auto& token : Tokenize(document)) {
        auto it = vocabulary_.find(token);
        if (it != vocabulary_.end()) {
            row.push_back(it->second);
        }
    }
    std::sort(row.begin(), row.end());
    row.erase(std::unique(row.begin(), row.end()), row.end());
    return row;
}

void BinaryVectorizer::SetFeatureNames(const std::vector<std::string>& names) {
    vocabulary_.clear();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (!vocabulary_.emplace(names[i], i).second) {
            throw std::invalid_argument("Duplicate feature name: " + names[i]);
        }
    }
}

std::vector<std::string> BinaryVectorizer::FeatureNames() const {
    std::vector<std::string> names(vocabulary_.size());
    for (const auto& [token, index] : vocabulary_) {
        names[index] = token;
    }
    return names;
}

// ============================================================================
// BERNOULLI NAIVE BAYES
// ============================================================================

BernoulliNaiveBayes::BernoulliNaiveBayes(double alpha)
    : alpha_(alpha) {
}

void BernoulliNaiveBayes::Fit(const std::vector<BinaryRow>& rows,
                              const std::vector<std::size_t>& labels,
                              std::size_t class_count, std::size_t feature_count) {
    if (rows.size() != labels.size()) {
        throw std::invalid_argument("Rows and labels differ in length");
    }
    if (rows.empty() || class_count == 0) {
        throw std::invalid_argument("Cannot fit on an empty training set");
    }
    if (!(alpha_ > 0.0)) {
        throw std::invalid_argument("Smoothing alpha must be positive");
    }

    std::vector<double> class_counts(class_count, 0.0);
    std::vector<std::vector<double>> feature_counts(class_count, std::vector<double>(feature_count, 0.0));

    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto label = labels[i];
        if (label >= class_count) {
            throw std::invalid_argument("Label index out of range");
        }
        class_counts[label] += 1.0;
        for (auto feature : rows[i]) {
            if (feature >= feature_count) {
                throw std::invalid_argument("Feature index out of range");
            }
            feature_counts[label][feature] += 1.0;
        }
    }

    const double total = static_cast<double>(rows.size());
    std::vector<double> class_log_prior(class_count);
    std::vector<std::vector<double>> feature_log_prob(class_count, std::vector<double>(feature_count));

    for (std::size_t c = 0; c < class_count; ++c) {
        // Classes absent from training keep a zero prior
        class_log_prior[c] = class_counts[c] > 0.0
            ? std::log(class_counts[c] / total)
            : -std::numeric_limits<double>::infinity();

        const double denominator = std::log(class_counts[c] + 2.0 * alpha_);
        for (std::size_t j = 0; j < feature_count; ++j) {
            feature_log_prob[c][j] = std::log(feature_counts[c][j] + alpha_) - denominator;
        }
    }

    feature_count_ = feature_count;
    class_log_prior_ = std::move(class_log_prior);
    feature_log_prob_ = std::move(feature_log_prob);
    PrecomputeScoringTerms();
}

void BernoulliNaiveBayes::SetParameters(double alpha, std::vector<double> class_log_prior,
                                        std::vector<std::vector<double>> feature_log_prob) {
    if (class_log_prior.empty() || class_log_prior.size() != feature_log_prob.size()) {
        throw std::invalid_argument("Class prior and feature table disagree on class count");
    }
    const std::size_t feature_count = feature_log_prob.front().size();
    for (const auto& row : feature_log_prob) {
        if (row.size() != feature_count) {
            throw std::invalid_argument("Ragged feature log-probability table");
        }
        for (double value : row) {
            if (std::isnan(value) || value >= 0.0) {
                throw std::invalid_argument("Feature log-probabilities must be negative");
            }
        }
    }
    for (double value : class_log_prior) {
        if (std::isnan(value) || value > 0.0) {
            throw std::invalid_argument("Class log-priors must not be positive");
        }
    }

    alpha_ = alpha;
    feature_count_ = feature_count;
    class_log_prior_ = std::move(class_log_prior);
    feature_log_prob_ = std::move(feature_log_prob);
    PrecomputeScoringTerms();
}

void BernoulliNaiveBayes::PrecomputeScoringTerms() {
    log_odds_.assign(class_log_prior_.size(), std::vector<double>(feature_count_));
    absent_log_sum_.assign(class_log_prior_.size(), 0.0);

    for (std::size_t c = 0; c < class_log_prior_.size(); ++c) {
        for (std::size_t j = 0; j < feature_count_; ++j) {
            const double log_p = feature_log_prob_[c][j];
            const double log_not_p = std::log1p(-std::exp(log_p));
            log_odds_[c][j] = log_p - log_not_p;
            absent_log_sum_[c] += log_not_p;
        }
    }
}

std::vector<double> BernoulliNaiveBayes::JointLogLikelihood(const BinaryRow& row) const {
    if (!IsFitted()) {
        throw std::logic_error("Bernoulli Naive Bayes model is not fitted");
    }

    std::vector<double> jll(class_log_prior_.size());
    for (std::size_t c = 0; c < jll.size(); ++c) {
        double score = class_log_prior_[c] + absent_log_sum_[c];
        for (auto feature : row) {
            if (feature < feature_count_) {
                score += log_odds_[c][feature];
            }
        }
        jll[c] = score;
    }
    return jll;
}

std::vector<double> BernoulliNaiveBayes::PredictProba(const BinaryRow& row) const {
    auto jll = JointLogLikelihood(row);

    const double max_jll = *std::max_element(jll.begin(), jll.end());
    double sum = 0.0;
    for (double value : jll) {
        sum += std::exp(value - max_jll);
    }
    const double log_norm = max_jll + std::log(sum);

    std::vector<double> proba(jll.size());
    for (std::size_t c = 0; c < jll.size(); ++c) {
        proba[c] = std::exp(jll[c] - log_norm);
    }
    return proba;
}

std::size_t BernoulliNaiveBayes::Predict(const BinaryRow& row) const {
    auto jll = JointLogLikelihood(row);
    return static_cast<std::size_t>(std::distance(jll.begin(), std::max_element(jll.begin(), jll.end())));
}

// ============================================================================
// TEXT CLASSIFIER PIPELINE
// ============================================================================

TextClassifier::TextClassifier()
    : TextClassifier(Config{}) {
}

TextClassifier::TextClassifier(const Config& config)
    : config_(config)
    , model_(config.alpha) {
}

void TextClassifier::Fit(const std::vector<std::string>& documents,
                         const std::vector<std::string>& labels) {
    if (documents.size() != labels.size()) {
        throw std::invalid_argument("Documents and labels differ in length");
    }
    if (documents.empty()) {
        throw std::invalid_argument("Cannot fit on an empty corpus");
    }

    std::set<std::string> distinct(labels.begin(), labels.end());
    std::vector<std::string> classes(distinct.begin(), distinct.end());

    std::map<std::string, std::size_t> class_index;
    for (std::size_t i = 0; i < classes.size(); ++i) {
        class_index.emplace(classes[i], i);
    }

    BinaryVectorizer vectorizer;
    vectorizer.Fit(documents);

    std::vector<BinaryRow> rows;
    std::vector<std::size_t> targets;
    rows.reserve(documents.size());
    targets.reserve(labels.size());
    for (std::size_t i = 0; i < documents.size(); ++i) {
        rows.push_back(vectorizer.Transform(documents[i]));
        targets.push_back(class_index.at(labels[i]));
    }

    BernoulliNaiveBayes model(config_.alpha);
    model.Fit(rows, targets, classes.size(), vectorizer.VocabularySize());

    vectorizer_ = std::move(vectorizer);
    model_ = std::move(model);
    classes_ = std::move(classes);
}

void TextClassifier::EnsureFitted() const {
    if (!IsFitted()) {
        throw std::logic_error("Text classifier is not fitted");
    }
}

std::vector<double> TextClassifier::PredictProba(const std::string& document) const {
    EnsureFitted();
    return model_.PredictProba(vectorizer_.Transform(document));
}

std::string TextClassifier::Predict(const std::string& document) const {
    EnsureFitted();
    return classes_[model_.Predict(vectorizer_.Transform(document))];
}

std::vector<std::string> TextClassifier::Predict(const std::vector<std::string>& documents) const {
    std::vector<std::string> predictions;
    predictions.reserve(documents.size());
    for (const auto& document : documents) {
        predictions.push_back(Predict(document));
    }
    return predictions;
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json TextClassifier::ToJson() const {
    EnsureFitted();

    // Zero priors are stored as null since JSON has no -inf
    json priors = json::array();
    for (double value : model_.ClassLogPrior()) {
        priors.push_back(std::isinf(value) ? json(nullptr) : json(value));
    }

    return {
        {"format", kFormat},
        {"format_version", kFormatVersion},
        {"alpha", model_.Alpha()},
        {"classes", classes_},
        {"features", vectorizer_.FeatureNames()},
        {"class_log_prior", priors},
        {"feature_log_prob", model_.FeatureLogProb()}
    };
}

TextClassifier TextClassifier::FromJson(const json& blob) {
    if (!blob.is_object()) {
        throw std::invalid_argument("Classifier blob must be a JSON object");
    }

    try {
        if (blob.at("format").get<std::string>() != kFormat) {
            throw std::invalid_argument("Unknown classifier format: " + blob.at("format").dump());
        }
        if (blob.at("format_version").get<int>() != kFormatVersion) {
            throw std::invalid_argument("Unsupported classifier format version: " +
                                        blob.at("format_version").dump());
        }

        Config config;
        config.alpha = blob.at("alpha").get<double>();

        auto classes = blob.at("classes").get<std::vector<std::string>>();
        auto features = blob.at("features").get<std::vector<std::string>>();
        auto feature_log_prob = blob.at("feature_log_prob").get<std::vector<std::vector<double>>>();

        std::vector<double> class_log_prior;
        for (const auto& value : blob.at("class_log_prior")) {
            class_log_prior.push_back(value.is_null() ? -std::numeric_limits<double>::infinity()
                                                      : value.get<double>());
        }

        if (classes.size() != class_log_prior.size()) {
            throw std::invalid_argument("Classifier blob lists " + std::to_string(classes.size()) +
                                        " classes but " + std::to_string(class_log_prior.size()) +
                                        " priors");
        }
        // An empty vocabulary still needs one (empty) row per class
        if (features.empty() && feature_log_prob.empty()) {
            feature_log_prob.assign(classes.size(), {});
        }
        if (!feature_log_prob.empty() && feature_log_prob.front().size() != features.size()) {
            throw std::invalid_argument("Classifier blob feature table does not match vocabulary");
        }

        TextClassifier classifier(config);
        classifier.vectorizer_.SetFeatureNames(features);
        classifier.model_.SetParameters(config.alpha, std::move(class_log_prior), std::move(feature_log_prob));
        classifier.classes_ = std::move(classes);
        return classifier;
    }
    catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed classifier blob: ") + e.what());
    }
}

} // namespace ml
} // namespace attributor
