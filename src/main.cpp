/**
 * @file main.cpp
 * @brief Attributor - Command-line interface
 *
 * Entry point for the intrusion-set attribution tool. Trains attribution
 * models from STIX bundles, ranks intrusion sets for incidents, and dumps
 * extracted intrusion-set profiles.
 *
 * Logs and banner go to stderr; JSON documents go to stdout.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "attributor/core/attribution_server.hpp"
#include "attributor/core/execution_context.hpp"
#include "attributor/core/model_store.hpp"
#include "attributor/core/trainer.hpp"
#include "attributor/parsers/stix_bundle_parser.hpp"
#include "attributor/reporters/json_reporter.hpp"
#include "attributor/utils/version_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║    █████╗ ████████╗████████╗██████╗ ██╗██████╗ ██╗   ██╗      ║
║   ██╔══██╗╚══██╔══╝╚══██╔══╝██╔══██╗██║██╔══██╗██║   ██║      ║
║   ███████║   ██║      ██║   ██████╔╝██║██████╔╝██║   ██║      ║
║   ██╔══██║   ██║      ██║   ██╔══██╗██║██╔══██╗██║   ██║      ║
║   ██║  ██║   ██║      ██║   ██║  ██║██║██████╔╝╚██████╔╝      ║
║   ╚═╝  ╚═╝   ╚═╝      ╚═╝   ╚═╝  ╚═╝╚═╝╚═════╝  ╚═════╝       ║
║                                                               ║
║              STIX Intrusion-Set Attribution Engine            ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

std::vector<json> LoadAllBundles(const attributor::parsers::StixBundleParser& parser,
                                 const std::vector<std::string>& inputs) {
    std::vector<json> bundles;
    for (const auto& input : inputs) {
        auto loaded = parser.LoadBundles(input);
        spdlog::info("[LOAD] {} bundle(s) from {}", loaded.size(), input);
        for (auto& bundle : loaded) {
            bundles.push_back(std::move(bundle));
        }
    }
    return bundles;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

struct TrainOptions {
    std::vector<std::string> inputs;
    std::string output_dir;
    std::string db_version{attributor::utils::kBaselineDatabaseVersion};
    std::size_t samples_per_label{100};
    int min_size{10};
    int max_size{50};
    std::optional<std::uint64_t> seed;
    std::size_t jobs{0};
};

int RunTrain(const TrainOptions& options) {
    attributor::parsers::StixBundleParser parser;
    auto bundles = LoadAllBundles(parser, options.inputs);
    if (bundles.empty()) {
        spdlog::error("[ERROR] No bundles loaded");
        return 1;
    }

    attributor::core::Trainer::Config config;
    config.samples_per_label = options.samples_per_label;
    config.synthesizer.min_size = options.min_size;
    config.synthesizer.max_size = options.max_size;
    config.synthesizer.seed = options.seed;

    attributor::core::Trainer trainer(std::move(bundles), options.db_version, config);
    attributor::core::LocalExecutionContext context(options.jobs);

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[START] Training model {}", trainer.DatabaseVersion());

    auto result = trainer.Retrain(&context);
    if (!result) {
        spdlog::error("[FAIL] Training failed");
        return 1;
    }

    attributor::core::ModelStore::Config store_config;
    store_config.directory = options.output_dir;
    attributor::core::ModelStore store(store_config);
    store.Save(result->classifier, result->db_version, result->f1_score);

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[DONE] Model written to {}", options.output_dir);

    attributor::reporters::JsonReporter reporter;
    std::cout << reporter.Dump(reporter.TrainingSummaryToJson(*result, options.output_dir)) << std::endl;
    return 0;
}

struct PredictOptions {
    std::string model_dir;
    std::string text;
    std::string incident_file;
    std::size_t top_n{3};
};

int RunPredict(const PredictOptions& options) {
    std::optional<std::string> incident_text;
    if (!options.incident_file.empty()) {
        std::ifstream file(options.incident_file);
        if (!file) {
            spdlog::error("[ERROR] Cannot open incident: {}", options.incident_file);
            return 1;
        }
        attributor::parsers::StixBundleParser parser;
        incident_text = parser.IncidentToString(json::parse(file));
        spdlog::debug("[INCIDENT] {}", *incident_text);
    } else {
        incident_text = options.text;
    }

    attributor::core::AttributionServer::Config config;
    config.model_directory = options.model_dir;
    config.top_n = options.top_n;
    attributor::core::AttributionServer server(config);

    auto result = server.Predict(incident_text);

    attributor::reporters::JsonReporter reporter;
    std::cout << reporter.Dump(reporter.PredictionToJson(result)) << std::endl;
    return result.IsSentinel() ? 2 : 0;
}

int RunProfile(const std::vector<std::string>& inputs, bool details) {
    attributor::parsers::StixBundleParser parser;
    auto profiles = parser.ExtractProfiles(LoadAllBundles(parser, inputs));
    if (profiles.empty()) {
        spdlog::warn("[WARN] No intrusion sets found");
    }

    attributor::reporters::JsonReporterConfig config;
    config.include_entity_details = details;
    attributor::reporters::JsonReporter reporter(config);
    std::cout << reporter.Dump(reporter.ProfilesToJson(profiles)) << std::endl;
    return 0;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Keep stdout for JSON documents
    spdlog::set_default_logger(spdlog::stderr_color_mt("attributor"));

    CLI::App app{"Attributor - STIX intrusion-set attribution"};
    app.require_subcommand(1);

    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("-q,--quiet", quiet, "Suppress banner and informational logging");

    // train
    TrainOptions train_options;
    auto* train = app.add_subcommand("train", "Train an attribution model from STIX bundles");
    train->add_option("bundles", train_options.inputs, "Bundle files or directories of *.json bundles")
        ->required()
        ->check(CLI::ExistingPath);
    train->add_option("-o,--output", train_options.output_dir, "Model artifact directory")->required();
    train->add_option("--db-version", train_options.db_version, "Database version \"(M, m, u)\"")
        ->default_val(attributor::utils::kBaselineDatabaseVersion);
    train->add_option("--samples-per-label", train_options.samples_per_label, "Incidents per intrusion set")
        ->default_val(100)
        ->check(CLI::PositiveNumber);
    train->add_option("--min-size", train_options.min_size, "Smallest synthesized incident")->default_val(10);
    train->add_option("--max-size", train_options.max_size, "Largest synthesized incident")->default_val(50);
    train->add_option("--seed", train_options.seed, "Fixed synthesis seed");
    train->add_option("-j,--jobs", train_options.jobs, "Parallel synthesis tasks (0 = hardware)")->default_val(0);

    // predict
    PredictOptions predict_options;
    auto* predict = app.add_subcommand("predict", "Rank intrusion sets for an incident");
    predict->add_option("-m,--model", predict_options.model_dir, "Model artifact directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    auto* text_option = predict->add_option("--text", predict_options.text, "Space-separated semantic ids");
    auto* incident_option = predict->add_option("--incident", predict_options.incident_file, "Incident STIX bundle")
        ->check(CLI::ExistingFile);
    text_option->excludes(incident_option);
    predict->add_option("--top", predict_options.top_n, "Number of ranked labels")
        ->default_val(3)
        ->check(CLI::PositiveNumber);

    // profile
    std::vector<std::string> profile_inputs;
    bool profile_details = false;
    auto* profile = app.add_subcommand("profile", "Print intrusion-set profiles extracted from bundles");
    profile->add_option("bundles", profile_inputs, "Bundle files or directories")
        ->required()
        ->check(CLI::ExistingPath);
    profile->add_flag("--details", profile_details, "Include STIX ids and relations per entity");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!quiet) {
        PrintBanner();
    }

    try {
        if (*train) {
            return RunTrain(train_options);
        }
        if (*predict) {
            return RunPredict(predict_options);
        }
        if (*profile) {
            return RunProfile(profile_inputs, profile_details);
        }
        return 1;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const json::exception& e) {
        spdlog::error("[ERROR] Invalid JSON: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
