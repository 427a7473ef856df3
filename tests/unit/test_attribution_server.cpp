/**
 * @file test_attribution_server.cpp
 * @brief Unit tests for model loading, sentinels and ranked prediction
 */

#include <gtest/gtest.h>
#include "attributor/core/attribution_server.hpp"
#include "attributor/core/model_store.hpp"
#include "test_fixtures.hpp"

#include <fstream>
#include <future>
#include <thread>
#include <vector>

using namespace attributor;
using namespace attributor::testing_support;
using core::AttributionServer;
using core::RankedLabels;
using core::ServerState;

namespace {

ml::TextClassifier FourClassClassifier() {
    ml::TextClassifier classifier;
    classifier.Fit({"tool-A malware-A", "tool-A", "tool-B malware-B", "tool-B",
                    "tool-C malware-C", "tool-C", "tool-D malware-D", "tool-D"},
                   {"APT-A", "APT-A", "APT-B", "APT-B", "APT-C", "APT-C", "APT-D", "APT-D"});
    return classifier;
}

AttributionServer::Config ConfigAt(const std::filesystem::path& directory) {
    AttributionServer::Config config;
    config.model_directory = directory;
    return config;
}

void SaveModel(const std::filesystem::path& directory, const std::string& version) {
    core::ModelStore::Config config;
    config.directory = directory;
    core::ModelStore(config).Save(FourClassClassifier(), version, 1.0);
}

int SentinelOf(const core::PredictionResult& result) {
    EXPECT_TRUE(result.IsSentinel());
    return result.IsSentinel() ? std::get<int>(result.label) : 0;
}

} // namespace

// ============================================================================
// Sentinels
// ============================================================================

TEST(AttributionServerTest, EmptyInputReturnsEmptySentinel) {
    TempDirectory dir;
    AttributionServer server(ConfigAt(dir.Path()));

    EXPECT_EQ(SentinelOf(server.Predict(std::nullopt)), core::kEmptyInputLabel);
    EXPECT_EQ(SentinelOf(server.Predict(std::string{})), core::kEmptyInputLabel);
    // The model is not touched for empty input
    EXPECT_EQ(server.State(), ServerState::UNINITIALIZED);
}

TEST(AttributionServerTest, MissingModelReturnsNoModelSentinel) {
    TempDirectory dir;
    AttributionServer server(ConfigAt(dir.Path() / "absent"));

    auto result = server.Predict(std::string("tool-A"));
    EXPECT_EQ(SentinelOf(result), core::kNoModelLabel);
    EXPECT_EQ(result.db_version, utils::kBaselineDatabaseVersion);
    EXPECT_EQ(server.State(), ServerState::DEGRADED);
    EXPECT_FALSE(server.EnsureLoaded());
}

TEST(AttributionServerTest, CorruptedBlobReturnsNoModelSentinel) {
    TempDirectory dir;
    { std::ofstream(dir.Path() / "model.json") << "garbage"; }

    AttributionServer server(ConfigAt(dir.Path()));
    EXPECT_EQ(SentinelOf(server.Predict(std::string("tool-A"))), core::kNoModelLabel);
}

TEST(AttributionServerTest, EmptyBlobReturnsNoModelSentinel) {
    TempDirectory dir;
    { std::ofstream file(dir.Path() / "model.json"); }

    AttributionServer server(ConfigAt(dir.Path()));
    EXPECT_EQ(SentinelOf(server.Predict(std::string("tool-A"))), core::kNoModelLabel);
}

TEST(AttributionServerTest, TamperedBlobIsRejected) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");
    { std::ofstream(dir.Path() / "model.json", std::ios::app) << " "; }

    AttributionServer server(ConfigAt(dir.Path()));
    EXPECT_EQ(SentinelOf(server.Predict(std::string("tool-A"))), core::kNoModelLabel);
}

TEST(AttributionServerTest, UnreadableArtifactPathsReturnNoModelSentinel) {
    TempDirectory dir;
    // Each artifact is a symlink to itself, so probing it fails with ELOOP
    std::filesystem::create_symlink(dir.Path() / "meta_data.json", dir.Path() / "meta_data.json");
    std::filesystem::create_symlink(dir.Path() / "model.json", dir.Path() / "model.json");

    AttributionServer server(ConfigAt(dir.Path()));
    core::PredictionResult result{core::kEmptyInputLabel, ""};
    EXPECT_NO_THROW(result = server.Predict(std::string("tool-A")));
    EXPECT_EQ(SentinelOf(result), core::kNoModelLabel);
    EXPECT_EQ(server.State(), ServerState::DEGRADED);
}

TEST(AttributionServerTest, UnreadableMetadataStillLoadsBlob) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");
    std::filesystem::remove(dir.Path() / "meta_data.json");
    std::filesystem::create_symlink(dir.Path() / "meta_data.json", dir.Path() / "meta_data.json");

    AttributionServer server(ConfigAt(dir.Path()));
    auto result = server.Predict(std::string("tool-A"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(result.db_version, utils::kBaselineDatabaseVersion);
}

// ============================================================================
// Loading and ranking
// ============================================================================

TEST(AttributionServerTest, LoadedModelReturnsRankedTopThree) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");

    AttributionServer server(ConfigAt(dir.Path()));
    auto result = server.Predict(std::string("tool-B malware-B"));

    ASSERT_FALSE(result.IsSentinel());
    const auto& ranked = std::get<RankedLabels>(result.label);
    ASSERT_EQ(ranked.labels.size(), 3u);
    ASSERT_EQ(ranked.probas.size(), 3u);
    EXPECT_EQ(ranked.labels[0], "APT-B");
    EXPECT_GE(ranked.probas[0], ranked.probas[1]);
    EXPECT_GE(ranked.probas[1], ranked.probas[2]);
    EXPECT_EQ(result.db_version, "(0, 0, 2)");
    EXPECT_EQ(server.State(), ServerState::READY);
}

TEST(AttributionServerTest, TopNIsConfigurable) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");

    auto config = ConfigAt(dir.Path());
    config.top_n = 10;
    AttributionServer server(config);

    auto result = server.Predict(std::string("tool-C"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(std::get<RankedLabels>(result.label).labels.size(), 4u);
}

TEST(AttributionServerTest, DegradedServerRecoversOnNextCall) {
    TempDirectory dir;
    AttributionServer server(ConfigAt(dir.Path()));

    EXPECT_EQ(SentinelOf(server.Predict(std::string("tool-A"))), core::kNoModelLabel);
    EXPECT_EQ(server.State(), ServerState::DEGRADED);

    SaveModel(dir.Path(), "(0, 0, 2)");

    auto result = server.Predict(std::string("tool-A"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(std::get<RankedLabels>(result.label).labels[0], "APT-A");
    EXPECT_EQ(server.State(), ServerState::READY);
}

TEST(AttributionServerTest, MissingMetadataIsNotFatal) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");
    std::filesystem::remove(dir.Path() / "meta_data.json");

    AttributionServer server(ConfigAt(dir.Path()));
    auto result = server.Predict(std::string("tool-D"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(result.db_version, utils::kBaselineDatabaseVersion);
}

TEST(AttributionServerTest, ConfiguredVersionIsNotOverriddenByMetadata) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");

    auto config = ConfigAt(dir.Path());
    config.database_version = "(2, 0, 0)";
    AttributionServer server(config);

    EXPECT_TRUE(server.EnsureLoaded());
    EXPECT_EQ(server.DatabaseVersion(), "(2, 0, 0)");
}

TEST(AttributionServerTest, BlobNamedByMetadataIsLoaded) {
    TempDirectory dir;
    core::ModelStore::Config store_config;
    store_config.directory = dir.Path();
    store_config.model_file = "model-0.0.2.json";
    core::ModelStore(store_config).Save(FourClassClassifier(), "(0, 0, 2)");

    AttributionServer server(ConfigAt(dir.Path()));
    auto result = server.Predict(std::string("tool-B"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(std::get<RankedLabels>(result.label).labels[0], "APT-B");
}

TEST(AttributionServerTest, MetadataBlobNameOutsideDirectoryIsIgnored) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");

    json metadata;
    {
        std::ifstream file(dir.Path() / "meta_data.json");
        metadata = json::parse(file);
    }
    metadata["model_file"] = "../model.json";
    metadata.erase("model_sha256");
    { std::ofstream(dir.Path() / "meta_data.json") << metadata.dump(); }

    // Falls back to the configured blob name
    AttributionServer server(ConfigAt(dir.Path()));
    auto result = server.Predict(std::string("tool-C"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(std::get<RankedLabels>(result.label).labels[0], "APT-C");
}

TEST(AttributionServerTest, PreloadedClassifierIsReady) {
    AttributionServer server(FourClassClassifier(), AttributionServer::Config{});
    EXPECT_EQ(server.State(), ServerState::READY);

    auto result = server.Predict(std::string("malware-C"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(std::get<RankedLabels>(result.label).labels[0], "APT-C");
}

TEST(AttributionServerTest, UnknownTokensStillRank) {
    AttributionServer server(FourClassClassifier(), AttributionServer::Config{});
    auto result = server.Predict(std::string("never-seen-token"));
    ASSERT_FALSE(result.IsSentinel());
    EXPECT_EQ(std::get<RankedLabels>(result.label).labels.size(), 3u);
}

TEST(AttributionServerTest, ConcurrentCallersShareOneModel) {
    TempDirectory dir;
    SaveModel(dir.Path(), "(0, 0, 2)");
    AttributionServer server(ConfigAt(dir.Path()));

    std::vector<std::future<core::PredictionResult>> calls;
    for (int i = 0; i < 8; ++i) {
        calls.push_back(std::async(std::launch::async,
                                   [&server] { return server.Predict(std::string("tool-A")); }));
    }
    for (auto& call : calls) {
        auto result = call.get();
        ASSERT_FALSE(result.IsSentinel());
        EXPECT_EQ(std::get<RankedLabels>(result.label).labels[0], "APT-A");
    }
    EXPECT_EQ(server.State(), ServerState::READY);
}
