/**
 * @file model_store.hpp
 * @brief Persistence of versioned attribution model artifacts
 *
 * A model artifact is two files under one directory: a metadata record
 * (version, creation time, blob digest) and the serialized classifier.
 * Loading is defensive: missing or corrupted files are logged and reported
 * as absent, never thrown to the caller.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "attributor/ml/text_classifier.hpp"

namespace attributor {
namespace core {

/// Default artifact file names
inline constexpr const char* kMetaDataFilename = "meta_data.json";
inline constexpr const char* kModelFilename = "model.json";
inline constexpr const char* kModelPathLocation = "data";

/**
 * @struct ModelMetadata
 * @brief Contents of meta_data.json
 */
struct ModelMetadata {
    std::string db_version;                    ///< "(major, minor, micro)"
    std::string time_metadata_created;         ///< ISO 8601 UTC
    std::string model_file;                    ///< Blob file name
    std::optional<std::string> model_sha256;   ///< Blob digest, when recorded
    std::vector<std::string> classes;          ///< Labels known to the model
    std::optional<double> f1_score;            ///< Held-out weighted F1

    nlohmann::json ToJson() const;

    /**
     * @brief Parse a metadata record
     * @throws std::invalid_argument when db_version is missing or malformed
     */
    static ModelMetadata FromJson(const nlohmann::json& record);
};

/**
 * @class ModelStore
 * @brief Reads and writes model artifacts in a directory
 *
 * **Thread Safety**: NOT thread-safe for concurrent Save(); loads are read-only.
 *
 * **Usage Example**:
 * @code
 * ModelStore::Config config;
 * config.directory = "./models/current";
 * ModelStore store(config);
 *
 * store.Save(result.classifier, result.db_version, result.f1_score);
 *
 * auto metadata = store.LoadMetadata();
 * auto classifier = store.LoadClassifier(metadata ? metadata->model_sha256 : std::nullopt);
 * @endcode
 */
class ModelStore {
public:
    /**
     * @struct Config
     * @brief Artifact location
     */
    struct Config {
        std::filesystem::path directory{kModelPathLocation};  ///< Artifact directory
        std::string model_file{kModelFilename};               ///< Classifier blob name
        std::string meta_file{kMetaDataFilename};             ///< Metadata record name
        int indent{2};                                        ///< JSON indentation (-1 for compact)
    };

    ModelStore();
    explicit ModelStore(const Config& config,
                        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Write classifier blob and metadata
     *
     * The blob is written first; metadata (carrying the blob digest) is only
     * written once the blob is in place. Both go through a temporary file and
     * rename.
     *
     * @return Path of the metadata file
     * @throws std::runtime_error on I/O failure
     */
    std::filesystem::path Save(const ml::TextClassifier& classifier, const std::string& db_version,
                               std::optional<double> f1_score = std::nullopt) const;

    /**
     * @brief Read the metadata record
     * @return nullopt if missing, unreadable or malformed (logged)
     */
    std::optional<ModelMetadata> LoadMetadata() const;

    /**
     * @brief Read and deserialize the classifier blob
     * @param expected_sha256 Digest recorded in metadata; mismatch means corruption
     * @return nullopt if missing, corrupted or malformed (logged)
     */
    std::optional<ml::TextClassifier> LoadClassifier(
        const std::optional<std::string>& expected_sha256 = std::nullopt) const;

    std::filesystem::path MetadataPath() const { return config_.directory / config_.meta_file; }
    std::filesystem::path ModelPath() const { return config_.directory / config_.model_file; }

private:
    void WriteFile(const std::filesystem::path& path, const std::string& content) const;

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Current UTC time as ISO 8601 ("2025-01-31T12:00:00Z")
 */
std::string GetCurrentTimestamp();

} // namespace core
} // namespace attributor
