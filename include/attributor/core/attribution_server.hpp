/**
 * @file attribution_server.hpp
 * @brief Serving side of intrusion-set attribution
 *
 * Holds a lazily loaded classifier and answers "which intrusion sets does
 * this incident look like" queries. Prediction never throws: every failure
 * is reported through a sentinel label.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "attributor/core/model_store.hpp"
#include "attributor/ml/text_classifier.hpp"
#include "attributor/utils/version_utils.hpp"

namespace attributor {
namespace core {

/// Sentinel labels
inline constexpr int kEmptyInputLabel = -1;    ///< No incident text supplied
inline constexpr int kNoModelLabel = -2;       ///< No usable model could be loaded
inline constexpr int kPredictErrorLabel = -3;  ///< Model failed during prediction

/**
 * @enum ServerState
 * @brief Model lifecycle
 */
enum class ServerState {
    UNINITIALIZED,  ///< No load attempted yet
    READY,          ///< Model cached
    DEGRADED        ///< Last load failed; retried on next request
};

/**
 * @struct RankedLabels
 * @brief Top-N labels with their probabilities, most likely first
 */
struct RankedLabels {
    std::vector<std::string> labels;
    std::vector<double> probas;
};

/**
 * @struct PredictionResult
 * @brief Ranked labels or a sentinel, plus the serving model version
 */
struct PredictionResult {
    std::variant<RankedLabels, int> label;
    std::string db_version;

    bool IsSentinel() const { return std::holds_alternative<int>(label); }
};

/**
 * @class AttributionServer
 * @brief Thread-safe model holder and predictor
 *
 * **Thread Safety**: Predict() may be called concurrently. Loading is
 * serialized by a mutex; the cached model is immutable once published.
 *
 * **Usage Example**:
 * @code
 * AttributionServer::Config config;
 * config.model_directory = "./models/current";
 * AttributionServer server(config);
 *
 * auto result = server.Predict(incident_text);
 * if (!result.IsSentinel()) {
 *     const auto& ranked = std::get<RankedLabels>(result.label);
 *     spdlog::info("Best match: {} ({:.2f})", ranked.labels[0], ranked.probas[0]);
 * }
 * @endcode
 */
class AttributionServer {
public:
    /**
     * @struct Config
     * @brief Model location and ranking depth
     */
    struct Config {
        std::filesystem::path model_directory{kModelPathLocation};
        std::string model_file{kModelFilename};
        std::string meta_file{kMetaDataFilename};
        std::size_t top_n{3};                                      ///< Labels returned per prediction
        std::string database_version{utils::kBaselineDatabaseVersion};
    };

    AttributionServer();
    explicit AttributionServer(const Config& config,
                               std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Construct with an already loaded classifier (state READY)
     */
    AttributionServer(ml::TextClassifier classifier, const Config& config,
                      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Rank intrusion sets for an incident
     *
     * - absent or empty text: kEmptyInputLabel, model untouched
     * - no usable model: kNoModelLabel
     * - prediction failure: kPredictErrorLabel
     *
     * @param incident_text Space-separated semantic ids
     */
    PredictionResult Predict(const std::optional<std::string>& incident_text);

    /**
     * @brief Load the model unless already cached
     * @return true when a model is available
     */
    bool EnsureLoaded();

    ServerState State() const;
    std::string DatabaseVersion() const;

private:
    std::shared_ptr<const ml::TextClassifier> LoadedModel();
    RankedLabels Rank(const ml::TextClassifier& model, const std::string& incident_text) const;

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    ServerState state_{ServerState::UNINITIALIZED};
    std::string db_version_;
    std::shared_ptr<const ml::TextClassifier> model_;
};

/**
 * @brief State name for logging
 */
std::string ToString(ServerState state);

} // namespace core
} // namespace attributor
