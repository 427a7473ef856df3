/**
 * @file trainer.cpp
 * @brief Implementation of attribution model training
 *
 * @date 2025
 */

#include "attributor/core/trainer.hpp"
#include "attributor/ml/metrics.hpp"
#include "attributor/parsers/stix_bundle_parser.hpp"
#include "attributor/utils/string_utils.hpp"

#include <exception>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace attributor {
namespace core {

Trainer::Trainer(std::vector<json> bundles, const std::string& database_version)
    : Trainer(std::move(bundles), database_version, Config{}) {
}

Trainer::Trainer(std::vector<json> bundles, const std::string& database_version,
                 const Config& config, std::shared_ptr<spdlog::logger> logger)
    : bundles_(std::move(bundles))
    , db_version_(ResolveDatabaseVersion(database_version))
    , config_(config)
    , logger_(std::move(logger)) {
    logger_->info("Trainer initialized with {} bundles, model version {}", bundles_.size(), db_version_);
}

std::string Trainer::ResolveDatabaseVersion(const std::string& database_version) {
    const auto baseline = utils::DatabaseVersion::Parse(utils::kBaselineDatabaseVersion);
    const auto requested = utils::DatabaseVersion::Parse(database_version);

    if (requested > baseline) {
        return utils::IncrementDatabaseVersion(baseline.ToString());
    }
    return baseline.ToString();
}

// ============================================================================
// INCIDENT SYNTHESIS
// ============================================================================

std::vector<LabeledIncident> Trainer::CreateIncidentData(ExecutionContext* context) const {
    parsers::StixBundleParser parser(logger_);
    const auto profiles = parser.ExtractProfiles(bundles_);

    logger_->info("Synthesizing {} incidents for each of {} intrusion sets",
                  config_.samples_per_label, profiles.size());

    // One slot per label so task scheduling cannot reorder the output
    std::vector<std::vector<LabeledIncident>> per_label(profiles.size());

    auto synthesize = [this](const std::string& label, const model::IntrusionSetProfile& profile,
                             std::size_t index, std::vector<LabeledIncident>& out) {
        auto synth_config = config_.synthesizer;
        if (synth_config.seed) {
            *synth_config.seed += index;
        }
        generators::IncidentSynthesizer synthesizer(synth_config, logger_);

        out.reserve(config_.samples_per_label);
        for (std::size_t i = 0; i < config_.samples_per_label; ++i) {
            auto text = utils::StringUtils::Join(synthesizer.Generate(profile), " ");
            if (text.empty()) {
                text = " ";
            }
            out.push_back({std::move(text), label});
        }
        logger_->debug("Synthesized {} incidents for {}", out.size(), label);
    };

    if (context == nullptr) {
        std::size_t index = 0;
        for (const auto& [label, profile] : profiles) {
            synthesize(label, profile, index, per_label[index]);
            ++index;
        }
    } else {
        std::vector<std::future<void>> pending;
        pending.reserve(profiles.size());

        // Every task references locals; let all finish before surfacing an error
        auto wait_all = [&pending] {
            for (auto& task : pending) {
                if (task.valid()) {
                    task.wait();
                }
            }
        };

        try {
            std::size_t index = 0;
            for (const auto& entry : profiles) {
                auto& out = per_label[index];
                pending.push_back(context->Submit(
                    [&synthesize, &entry, index, &out] { synthesize(entry.first, entry.second, index, out); }));
                ++index;
            }
        }
        catch (...) {
            wait_all();
            throw;
        }

        wait_all();
        for (auto& task : pending) {
            task.get();
        }
    }

    std::vector<LabeledIncident> incidents;
    incidents.reserve(profiles.size() * config_.samples_per_label);
    for (auto& label_incidents : per_label) {
        for (auto& incident : label_incidents) {
            incidents.push_back(std::move(incident));
        }
    }
    return incidents;
}

// ============================================================================
// TRAINING
// ============================================================================

std::optional<TrainingResult> Trainer::Retrain(ExecutionContext* context) const {
    try {
        auto incidents = CreateIncidentData(context);

        std::vector<std::string> documents;
        std::vector<std::string> labels;
        documents.reserve(incidents.size());
        labels.reserve(incidents.size());
        for (auto& incident : incidents) {
            documents.push_back(std::move(incident.text));
            labels.push_back(std::move(incident.label));
        }

        const std::set<std::string> distinct(labels.begin(), labels.end());
        if (distinct.size() < 2) {
            logger_->error("Training needs at least two intrusion sets, found {}", distinct.size());
            return std::nullopt;
        }

        const auto split = ml::StratifiedSplit(labels, config_.test_fraction, config_.split_seed);
        logger_->info("Split {} incidents into {} train / {} test", labels.size(), split.train.size(),
                      split.test.size());

        std::vector<std::string> train_docs;
        std::vector<std::string> train_labels;
        for (auto row : split.train) {
            train_docs.push_back(documents[row]);
            train_labels.push_back(labels[row]);
        }

        std::vector<std::string> test_docs;
        std::vector<std::string> test_labels;
        for (auto row : split.test) {
            test_docs.push_back(documents[row]);
            test_labels.push_back(labels[row]);
        }

        ml::TextClassifier::Config classifier_config;
        classifier_config.alpha = config_.smoothing_alpha;
        ml::TextClassifier classifier(classifier_config);
        classifier.Fit(train_docs, train_labels);

        const double f1 = ml::WeightedF1Score(test_labels, classifier.Predict(test_docs));

        logger_->info("═══════════════════════════════════════════════════════════════");
        logger_->info("✓ Training completed");
        logger_->info("  Classes: {}", classifier.Classes().size());
        logger_->info("  Vocabulary: {}", classifier.Vectorizer().VocabularySize());
        logger_->info("  Weighted F1: {:.4f}", f1);
        logger_->info("  Version: {}", db_version_);
        logger_->info("═══════════════════════════════════════════════════════════════");

        return TrainingResult{std::move(classifier), f1, db_version_};
    }
    catch (const std::exception& e) {
        logger_->error("Training failed: {}", e.what());
        return std::nullopt;
    }
    catch (...) {
        logger_->error("Training failed: unknown error");
        return std::nullopt;
    }
}

} // namespace core
} // namespace attributor
