/**
 * @file test_model_store.cpp
 * @brief Unit tests for model artifact persistence
 *
 * Artifacts are written to per-test temp directories.
 */

#include <gtest/gtest.h>
#include "attributor/core/model_store.hpp"
#include "attributor/utils/hash_utils.hpp"
#include "test_fixtures.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>

using namespace attributor;
using namespace attributor::testing_support;

namespace {

ml::TextClassifier SmallClassifier() {
    ml::TextClassifier classifier;
    classifier.Fit({"tool-A", "tool-B"}, {"first", "second"});
    return classifier;
}

core::ModelStore StoreAt(const std::filesystem::path& directory) {
    core::ModelStore::Config config;
    config.directory = directory;
    return core::ModelStore(config);
}

} // namespace

TEST(ModelStoreTest, SaveWritesBlobAndMetadata) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path() / "model");

    auto meta_path = store.Save(SmallClassifier(), "(0, 0, 2)", 0.75);
    EXPECT_EQ(meta_path.string(), (dir.Path() / "model" / "meta_data.json").string());
    ASSERT_TRUE(std::filesystem::exists(store.ModelPath()));
    ASSERT_TRUE(std::filesystem::exists(store.MetadataPath()));

    auto metadata = store.LoadMetadata();
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->db_version, "(0, 0, 2)");
    EXPECT_EQ(metadata->model_file, "model.json");
    EXPECT_EQ(metadata->classes, (std::vector<std::string>{"first", "second"}));
    ASSERT_TRUE(metadata->f1_score.has_value());
    EXPECT_DOUBLE_EQ(*metadata->f1_score, 0.75);
    ASSERT_TRUE(metadata->model_sha256.has_value());
    EXPECT_EQ(*metadata->model_sha256, utils::HashUtils::ComputeSHA256(store.ModelPath()));
    EXPECT_FALSE(metadata->time_metadata_created.empty());
}

TEST(ModelStoreTest, LoadedClassifierMatchesSaved) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path());
    auto original = SmallClassifier();
    store.Save(original, "(0, 0, 2)");

    auto metadata = store.LoadMetadata();
    ASSERT_TRUE(metadata.has_value());
    EXPECT_FALSE(metadata->f1_score.has_value());

    auto loaded = store.LoadClassifier(metadata->model_sha256);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->Classes(), original.Classes());
    EXPECT_EQ(loaded->Predict("tool-B"), "second");
}

TEST(ModelStoreTest, MissingArtifactsLoadAsAbsent) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path() / "nothing-here");
    EXPECT_FALSE(store.LoadMetadata().has_value());
    EXPECT_FALSE(store.LoadClassifier().has_value());
}

TEST(ModelStoreTest, UnreadableArtifactPathsLoadAsAbsent) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path());
    std::filesystem::create_symlink(store.MetadataPath(), store.MetadataPath());
    std::filesystem::create_symlink(store.ModelPath(), store.ModelPath());

    std::optional<core::ModelMetadata> metadata;
    EXPECT_NO_THROW(metadata = store.LoadMetadata());
    EXPECT_FALSE(metadata.has_value());

    std::optional<ml::TextClassifier> classifier;
    EXPECT_NO_THROW(classifier = store.LoadClassifier());
    EXPECT_FALSE(classifier.has_value());
}

TEST(ModelStoreTest, EmptyOrGarbageBlobLoadsAsAbsent) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path());

    { std::ofstream file(store.ModelPath()); }
    EXPECT_FALSE(store.LoadClassifier().has_value());

    { std::ofstream(store.ModelPath()) << "\x80\x04 pickled bytes"; }
    EXPECT_FALSE(store.LoadClassifier().has_value());

    { std::ofstream(store.ModelPath()) << R"({"format": "something-else"})"; }
    EXPECT_FALSE(store.LoadClassifier().has_value());
}

TEST(ModelStoreTest, DigestMismatchIsCorruption) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path());
    store.Save(SmallClassifier(), "(0, 0, 2)");
    auto metadata = store.LoadMetadata();
    ASSERT_TRUE(metadata && metadata->model_sha256);

    // Still valid JSON, different bytes
    { std::ofstream(store.ModelPath(), std::ios::app) << "\n"; }
    EXPECT_FALSE(store.LoadClassifier(metadata->model_sha256).has_value());
    EXPECT_TRUE(store.LoadClassifier().has_value());
}

TEST(ModelStoreTest, MalformedMetadataLoadsAsAbsent) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path());

    { std::ofstream(store.MetadataPath()) << "not json"; }
    EXPECT_FALSE(store.LoadMetadata().has_value());

    { std::ofstream(store.MetadataPath()) << R"({"db_version": "one point two"})"; }
    EXPECT_FALSE(store.LoadMetadata().has_value());

    { std::ofstream(store.MetadataPath()) << R"({"time_metadata_created": "2025-01-01T00:00:00Z"})"; }
    EXPECT_FALSE(store.LoadMetadata().has_value());
}

TEST(ModelStoreTest, MetadataFromJsonNormalizesVersion) {
    auto metadata = core::ModelMetadata::FromJson({{"db_version", "(1,2,3)"}});
    EXPECT_EQ(metadata.db_version, "(1, 2, 3)");
    EXPECT_EQ(metadata.model_file, "model.json");
    EXPECT_FALSE(metadata.model_sha256.has_value());
    EXPECT_THROW(core::ModelMetadata::FromJson(json::array()), std::invalid_argument);
}

TEST(ModelStoreTest, RefusesUnfittedClassifier) {
    TempDirectory dir;
    auto store = StoreAt(dir.Path());
    EXPECT_THROW(store.Save(ml::TextClassifier{}, "(0, 0, 2)"), std::runtime_error);
}
