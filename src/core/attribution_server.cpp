/**
 * @file attribution_server.cpp
 * @brief Implementation of the attribution server
 *
 * **Load sequence** (serialized by mutex_):
 * 1. Metadata: version, creation time, blob name and digest. Failure is
 *    non-fatal.
 * 2. Version adoption: the metadata version replaces the server's only while
 *    the server still carries the baseline version.
 * 3. Blob: verified against the digest, deserialized, published as an
 *    immutable shared model.
 *
 * A failed blob load, including an unreadable artifact path, leaves the
 * server DEGRADED; the next request retries.
 *
 * @date 2025
 */

#include "attributor/core/attribution_server.hpp"

#include <algorithm>
#include <exception>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace attributor {
namespace core {

AttributionServer::AttributionServer()
    : AttributionServer(Config{}) {
}

AttributionServer::AttributionServer(const Config& config, std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , logger_(std::move(logger))
    , db_version_(utils::DatabaseVersion::Parse(config.database_version).ToString()) {
    logger_->info("Attribution server for {} (version {})", config_.model_directory.string(), db_version_);
}

AttributionServer::AttributionServer(ml::TextClassifier classifier, const Config& config,
                                     std::shared_ptr<spdlog::logger> logger)
    : AttributionServer(config, std::move(logger)) {
    if (!classifier.IsFitted()) {
        throw std::invalid_argument("Attribution server needs a fitted classifier");
    }
    model_ = std::make_shared<const ml::TextClassifier>(std::move(classifier));
    state_ = ServerState::READY;
}

// ============================================================================
// PREDICTION
// ============================================================================

PredictionResult AttributionServer::Predict(const std::optional<std::string>& incident_text) {
    if (!incident_text || incident_text->empty()) {
        logger_->debug("Empty incident supplied");
        return {kEmptyInputLabel, DatabaseVersion()};
    }

    auto model = LoadedModel();
    if (!model) {
        return {kNoModelLabel, DatabaseVersion()};
    }

    try {
        return {Rank(*model, *incident_text), DatabaseVersion()};
    }
    catch (const std::exception& e) {
        logger_->error("Prediction failed: {}", e.what());
        return {kPredictErrorLabel, DatabaseVersion()};
    }
}

RankedLabels AttributionServer::Rank(const ml::TextClassifier& model, const std::string& incident_text) const {
    const auto probas = model.PredictProba(incident_text);
    const auto& classes = model.Classes();

    std::vector<std::size_t> order(probas.size());
    std::iota(order.begin(), order.end(), 0);
    // Stable so equal probabilities keep class order
    std::stable_sort(order.begin(), order.end(),
                     [&probas](std::size_t a, std::size_t b) { return probas[a] > probas[b]; });

    RankedLabels ranked;
    const auto count = std::min(config_.top_n, order.size());
    for (std::size_t i = 0; i < count; ++i) {
        ranked.labels.push_back(classes.at(order[i]));
        ranked.probas.push_back(probas[order[i]]);
    }
    return ranked;
}

// ============================================================================
// MODEL LOADING
// ============================================================================

bool AttributionServer::EnsureLoaded() {
    return LoadedModel() != nullptr;
}

std::shared_ptr<const ml::TextClassifier> AttributionServer::LoadedModel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model_) {
        return model_;
    }

    if (state_ == ServerState::DEGRADED) {
        logger_->info("Retrying model load from {}", config_.model_directory.string());
    }

    ModelStore::Config store_config;
    store_config.directory = config_.model_directory;
    store_config.model_file = config_.model_file;
    store_config.meta_file = config_.meta_file;

    std::optional<ml::TextClassifier> classifier;
    try {
        std::optional<std::string> expected_sha256;
        if (auto metadata = ModelStore(store_config, logger_).LoadMetadata()) {
            expected_sha256 = metadata->model_sha256;
            const auto baseline = utils::DatabaseVersion::Parse(utils::kBaselineDatabaseVersion);
            if (utils::DatabaseVersion::Parse(db_version_) == baseline) {
                db_version_ = metadata->db_version;
            }
            // The blob named by metadata must sit beside it
            const std::filesystem::path named_blob(metadata->model_file);
            if (!metadata->model_file.empty() && named_blob == named_blob.filename()) {
                store_config.model_file = metadata->model_file;
            } else {
                logger_->warn("Ignoring model_file '{}' from metadata", metadata->model_file);
            }
            logger_->info("Model metadata: version {}, created {}", metadata->db_version,
                          metadata->time_metadata_created);
        } else {
            logger_->warn("Continuing without model metadata");
        }

        classifier = ModelStore(store_config, logger_).LoadClassifier(expected_sha256);
    }
    catch (const std::exception& e) {
        logger_->error("Model load failed: {}", e.what());
        classifier.reset();
    }

    if (!classifier) {
        state_ = ServerState::DEGRADED;
        logger_->warn("No usable model; server is {}", ToString(state_));
        return nullptr;
    }

    model_ = std::make_shared<const ml::TextClassifier>(std::move(*classifier));
    state_ = ServerState::READY;
    logger_->info("✓ Model loaded: {} classes, version {}", model_->Classes().size(), db_version_);
    return model_;
}

ServerState AttributionServer::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string AttributionServer::DatabaseVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_version_;
}

std::string ToString(ServerState state) {
    switch (state) {
        case ServerState::UNINITIALIZED: return "UNINITIALIZED";
        case ServerState::READY:         return "READY";
        case ServerState::DEGRADED:      return "DEGRADED";
        default:                         return "UNKNOWN";
    }
}

} // namespace core
} // namespace attributor
