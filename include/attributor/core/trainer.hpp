/**
 * @file trainer.hpp
 * @brief Attribution model training from STIX bundles
 *
 * Turns a set of STIX bundles into a fitted intrusion-set classifier:
 * - Extracts one profile per intrusion set
 * - Synthesizes labeled incidents from each profile
 * - Fits a Bernoulli Naive Bayes model on a stratified 80/20 split
 * - Reports weighted F1 on the held-out split
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "attributor/core/execution_context.hpp"
#include "attributor/generators/incident_synthesizer.hpp"
#include "attributor/ml/text_classifier.hpp"
#include "attributor/utils/version_utils.hpp"

namespace attributor {
namespace core {

/**
 * @struct LabeledIncident
 * @brief One synthesized training document
 */
struct LabeledIncident {
    std::string text;   ///< Space-joined semantic ids
    std::string label;  ///< Intrusion-set label ("name_id")
};

/**
 * @struct TrainingResult
 * @brief Output of a successful retrain
 */
struct TrainingResult {
    ml::TextClassifier classifier;
    double f1_score{0.0};
    std::string db_version;
};

/**
 * @class Trainer
 * @brief Builds an attribution model from intrusion-set bundles
 *
 * **Usage Example**:
 * @code
 * Trainer trainer(bundles, "(0, 0, 5)");
 * LocalExecutionContext context;
 * if (auto result = trainer.Retrain(&context)) {
 *     ModelStore(store_config).Save(result->classifier, result->db_version, result->f1_score);
 * }
 * @endcode
 */
class Trainer {
public:
    /**
     * @struct Config
     * @brief Training parameters
     */
    struct Config {
        std::size_t samples_per_label{100};                 ///< Incidents per intrusion set
        double test_fraction{0.2};                          ///< Held-out share
        std::uint64_t split_seed{27};                       ///< Train/test split seed
        double smoothing_alpha{1.0};                        ///< Naive Bayes smoothing
        generators::IncidentSynthesizer::Config synthesizer;
    };

    /**
     * @brief Construct trainer
     * @param bundles STIX bundles, one intrusion set each
     * @param database_version Caller's version; resolved against the baseline
     * @throws std::invalid_argument if database_version is malformed
     */
    Trainer(std::vector<nlohmann::json> bundles,
            const std::string& database_version = utils::kBaselineDatabaseVersion);
    Trainer(std::vector<nlohmann::json> bundles, const std::string& database_version,
            const Config& config, std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Version assigned to models this trainer produces
     *
     * A version above the baseline yields the baseline with its micro
     * component incremented; anything else yields the baseline.
     *
     * @throws std::invalid_argument if database_version is malformed
     */
    static std::string ResolveDatabaseVersion(const std::string& database_version);

    const std::string& DatabaseVersion() const { return db_version_; }
    const Config& GetConfig() const { return config_; }

    /**
     * @brief Synthesize samples_per_label incidents for every intrusion set
     *
     * Labels are processed in sorted order. With a context, each label is
     * synthesized as its own task; the output order does not depend on
     * scheduling.
     *
     * @param context Optional executor for per-label tasks
     */
    std::vector<LabeledIncident> CreateIncidentData(ExecutionContext* context = nullptr) const;

    /**
     * @brief Full training run
     * @return Trained model, or nullopt on any failure (logged)
     */
    std::optional<TrainingResult> Retrain(ExecutionContext* context = nullptr) const;

private:
    std::vector<nlohmann::json> bundles_;
    std::string db_version_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace core
} // namespace attributor
