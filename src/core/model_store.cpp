/**
 * @file model_store.cpp
 * @brief Implementation of model artifact persistence
 *
 * Layout of a model directory:
 * ```
 * <directory>/
 *   meta_data.json   {"db_version": "(0, 0, 2)", "model_sha256": "...", ...}
 *   model.json       serialized classifier
 * ```
 *
 * @date 2025
 */

#include "attributor/core/model_store.hpp"
#include "attributor/utils/hash_utils.hpp"
#include "attributor/utils/version_utils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace attributor {
namespace core {

// ============================================================================
// METADATA
// ============================================================================

json ModelMetadata::ToJson() const {
    json record;
    record["db_version"] = db_version;
    record["time_metadata_created"] = time_metadata_created;
    record["model_file"] = model_file;
    record["model_sha256"] = model_sha256 ? json(*model_sha256) : json(nullptr);
    record["classes"] = classes;
    record["f1_score"] = f1_score ? json(*f1_score) : json(nullptr);
    return record;
}

ModelMetadata ModelMetadata::FromJson(const json& record) {
    if (!record.is_object() || !record.contains("db_version") || !record["db_version"].is_string()) {
        throw std::invalid_argument("Metadata record has no db_version");
    }

    ModelMetadata metadata;
    // Round trip through the parser so malformed versions are rejected here
    metadata.db_version = utils::DatabaseVersion::Parse(record["db_version"].get<std::string>()).ToString();
    metadata.time_metadata_created = record.value("time_metadata_created", "");
    metadata.model_file = record.value("model_file", kModelFilename);

    if (record.contains("model_sha256") && record["model_sha256"].is_string()) {
        metadata.model_sha256 = record["model_sha256"].get<std::string>();
    }
    if (record.contains("classes") && record["classes"].is_array()) {
        for (const auto& label : record["classes"]) {
            if (label.is_string()) {
                metadata.classes.push_back(label.get<std::string>());
            }
        }
    }
    if (record.contains("f1_score") && record["f1_score"].is_number()) {
        metadata.f1_score = record["f1_score"].get<double>();
    }
    return metadata;
}

// ============================================================================
// STORE
// ============================================================================

ModelStore::ModelStore()
    : ModelStore(Config{}) {
}

ModelStore::ModelStore(const Config& config, std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , logger_(std::move(logger)) {
    logger_->debug("Model store at: {}", config_.directory.string());
}

std::filesystem::path ModelStore::Save(const ml::TextClassifier& classifier,
                                       const std::string& db_version,
                                       std::optional<double> f1_score) const {
    if (!classifier.IsFitted()) {
        throw std::runtime_error("Refusing to save an unfitted classifier");
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create model directory " + config_.directory.string() +
                                 ": " + ec.message());
    }

    const std::string blob = classifier.ToJson().dump(config_.indent);
    WriteFile(ModelPath(), blob);

    ModelMetadata metadata;
    metadata.db_version = db_version;
    metadata.time_metadata_created = GetCurrentTimestamp();
    metadata.model_file = config_.model_file;
    metadata.model_sha256 = utils::HashUtils::ComputeSHA256(blob);
    metadata.classes = classifier.Classes();
    metadata.f1_score = f1_score;

    WriteFile(MetadataPath(), metadata.ToJson().dump(config_.indent));

    logger_->info("Saved model {} ({} classes) to {}", db_version, metadata.classes.size(),
                  config_.directory.string());
    return MetadataPath();
}

std::optional<ModelMetadata> ModelStore::LoadMetadata() const {
    const auto path = MetadataPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            logger_->error("Cannot access model metadata {}: {}", path.string(), ec.message());
        } else {
            logger_->warn("No model metadata at {}", path.string());
        }
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            logger_->error("Failed to open metadata: {}", path.string());
            return std::nullopt;
        }
        return ModelMetadata::FromJson(json::parse(file));
    }
    catch (const json::exception& e) {
        logger_->error("Malformed metadata {}: {}", path.string(), e.what());
    }
    catch (const std::invalid_argument& e) {
        logger_->error("Invalid metadata {}: {}", path.string(), e.what());
    }
    return std::nullopt;
}

std::optional<ml::TextClassifier> ModelStore::LoadClassifier(
    const std::optional<std::string>& expected_sha256) const {
    const auto path = ModelPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            logger_->error("Cannot access model blob {}: {}", path.string(), ec.message());
        } else {
            logger_->warn("No model blob at {}", path.string());
        }
        return std::nullopt;
    }

    if (std::filesystem::file_size(path, ec) == 0 || ec) {
        logger_->error("Model blob is empty or unreadable: {}", path.string());
        return std::nullopt;
    }

    if (expected_sha256 && !utils::HashUtils::VerifyFileHash(path, *expected_sha256, logger_)) {
        logger_->error("Model blob digest does not match metadata: {}", path.string());
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            logger_->error("Failed to open model blob: {}", path.string());
            return std::nullopt;
        }
        auto classifier = ml::TextClassifier::FromJson(json::parse(file));
        logger_->debug("Loaded classifier with {} classes", classifier.Classes().size());
        return classifier;
    }
    catch (const json::exception& e) {
        logger_->error("Malformed model blob {}: {}", path.string(), e.what());
    }
    catch (const std::invalid_argument& e) {
        logger_->error("Corrupted model blob {}: {}", path.string(), e.what());
    }
    return std::nullopt;
}

void ModelStore::WriteFile(const std::filesystem::path& path, const std::string& content) const {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open file for writing: " + temp_path.string());
        }
        file << content;
        if (!file) {
            throw std::runtime_error("Failed to write: " + temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw std::runtime_error("Failed to move " + temp_path.string() + " into place");
    }
}

std::string GetCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&now_time_t), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace core
} // namespace attributor
