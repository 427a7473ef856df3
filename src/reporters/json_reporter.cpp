/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON output for attribution results
 *
 * @date 2025
 */

#include "attributor/reporters/json_reporter.hpp"

#include <fstream>
#include <utility>
#include <variant>

using json = nlohmann::json;

namespace attributor {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config, std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , logger_(std::move(logger)) {
    logger_->debug("JSON Reporter initialized (pretty: {}, indent: {})", config_.pretty_print,
                   config_.indent_size);
}

json JsonReporter::PredictionToJson(const core::PredictionResult& result) const {
    json document;
    if (const auto* ranked = std::get_if<core::RankedLabels>(&result.label)) {
        document["label"] = {{"labels", ranked->labels}, {"probas", ranked->probas}};
    } else {
        document["label"] = std::get<int>(result.label);
    }
    document["db_version"] = result.db_version;
    return document;
}

json JsonReporter::ProfileToJson(const std::string& label, const model::IntrusionSetProfile& profile) const {
    json entities = json::object();
    for (const auto& traits : model::EntityTypeTable()) {
        json group = json::array();
        for (const auto& entity : profile.Entities(traits.type)) {
            if (config_.include_entity_details) {
                group.push_back({{"id", entity.identifier},
                                 {"semantic_id", entity.semantic_id},
                                 {"relation", entity.relation},
                                 {"is_subject", entity.is_subject}});
            } else {
                group.push_back(entity.semantic_id);
            }
        }
        entities[traits.stix_name] = std::move(group);
    }

    json document;
    document["label"] = label;
    document["identifier"] = profile.Identifier();
    document["total_entities"] = profile.TotalEntities();
    document["entities"] = std::move(entities);
    return document;
}

json JsonReporter::ProfilesToJson(const std::map<std::string, model::IntrusionSetProfile>& profiles) const {
    json document;
    document["profiles"] = json::array();
    for (const auto& [label, profile] : profiles) {
        document["profiles"].push_back(ProfileToJson(label, profile));
    }
    document["count"] = profiles.size();
    Stamp(document);
    return document;
}

json JsonReporter::TrainingSummaryToJson(const core::TrainingResult& result,
                                         const std::filesystem::path& model_directory) const {
    json document;
    document["db_version"] = result.db_version;
    document["f1_score"] = result.f1_score;
    document["classes"] = result.classifier.Classes();
    document["vocabulary_size"] = result.classifier.Vectorizer().VocabularySize();
    document["model_directory"] = model_directory.string();
    Stamp(document);
    return document;
}

std::string JsonReporter::Dump(const json& document) const {
    return document.dump(config_.pretty_print ? config_.indent_size : -1);
}

bool JsonReporter::SaveJson(const json& document, const std::filesystem::path& output_path) const {
    std::ofstream file(output_path);
    if (!file) {
        logger_->error("Failed to open file for writing: {}", output_path.string());
        return false;
    }

    file << Dump(document);
    if (!file) {
        logger_->error("Failed to write JSON: {}", output_path.string());
        return false;
    }
    return true;
}

void JsonReporter::Stamp(json& document) const {
    if (config_.include_timestamps) {
        document["generated_at"] = core::GetCurrentTimestamp();
    }
}

} // namespace reporters
} // namespace attributor
