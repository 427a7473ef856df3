/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON output for attribution results
 *
 * Renders predictions, extracted intrusion-set profiles and training
 * summaries as JSON documents for the CLI and downstream tooling.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "attributor/core/attribution_server.hpp"
#include "attributor/core/trainer.hpp"
#include "attributor/model/entity.hpp"

namespace attributor {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON output
 */
struct JsonReporterConfig {
    bool pretty_print{true};              ///< Pretty print JSON
    int indent_size{2};                   ///< Indentation spaces
    bool include_timestamps{true};        ///< Add "generated_at" to documents
    bool include_entity_details{false};   ///< Profile entities as objects (STIX id, relation) instead of bare semantic ids
};

/**
 * @class JsonReporter
 * @brief JSON document builder
 *
 * **Prediction document**:
 * ```json
 * {"label": {"labels": ["APT28_intrusion-set--...", ...], "probas": [0.91, ...]},
 *  "db_version": "(0, 0, 2)"}
 * ```
 * Sentinels are rendered as a bare integer label.
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::cout << reporter.Dump(reporter.PredictionToJson(server.Predict(text))) << std::endl;
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{},
                          std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Render a prediction result
     */
    nlohmann::json PredictionToJson(const core::PredictionResult& result) const;

    /**
     * @brief Render one profile as {"label", "identifier", "entities": {type: [...]}}
     */
    nlohmann::json ProfileToJson(const std::string& label, const model::IntrusionSetProfile& profile) const;

    /**
     * @brief Render extracted profiles keyed by label
     */
    nlohmann::json ProfilesToJson(const std::map<std::string, model::IntrusionSetProfile>& profiles) const;

    /**
     * @brief Render training outcome and artifact location
     */
    nlohmann::json TrainingSummaryToJson(const core::TrainingResult& result,
                                         const std::filesystem::path& model_directory) const;

    /**
     * @brief Serialize honoring pretty_print / indent_size
     */
    std::string Dump(const nlohmann::json& document) const;

    /**
     * @brief Write a document to disk
     * @return true on success (failures are logged)
     */
    bool SaveJson(const nlohmann::json& document, const std::filesystem::path& output_path) const;

    const JsonReporterConfig& GetConfig() const { return config_; }

private:
    void Stamp(nlohmann::json& document) const;

    JsonReporterConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace reporters
} // namespace attributor
