/**
 * @file test_entity.cpp
 * @brief Unit tests for entity kind dispatch, semantic ids and profile building
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "attributor/model/entity.hpp"

#include <utility>

using namespace attributor::model;
using json = nlohmann::json;

// ============================================================================
// Semantic ids
// ============================================================================

TEST(SemanticIdTest, AttackPatternCollapsesSubTechnique) {
    EXPECT_EQ(SemanticIdFromAttackPattern({{"x_mitre_id", "T1003.001"}}), "attack-pattern-T1003");
    EXPECT_EQ(SemanticIdFromAttackPattern({{"x_mitre_id", "T1059"}}), "attack-pattern-T1059");
}

TEST(SemanticIdTest, AttackPatternWithoutMitreId) {
    EXPECT_EQ(SemanticIdFromAttackPattern(json::object()), "attack-pattern-");
}

TEST(SemanticIdTest, NamedEntitiesDropSpaces) {
    EXPECT_EQ(SemanticIdFromTool({{"name", "Tool Name"}}), "tool-ToolName");
    EXPECT_EQ(SemanticIdFromMalware({{"name", "Poison Ivy"}}), "malware-PoisonIvy");
}

TEST(SemanticIdTest, OtherKindsUseObjectId) {
    EXPECT_EQ(SemanticIdFromIdentity({{"id", "identity--1"}}), "identity--1");
    EXPECT_EQ(SemanticIdFromLocation({{"id", "location--2"}}), "location--2");
    EXPECT_EQ(SemanticIdFromVulnerability({{"id", "vulnerability--3"}}), "vulnerability--3");
    EXPECT_EQ(SemanticIdFromIndicator({{"id", "indicator--4"}}), "indicator--4");
}

TEST(SemanticIdTest, DispatchMatchesDirectCall) {
    json tool = {{"name", "Cobalt Strike"}};
    EXPECT_EQ(DeriveSemanticId(EntityType::TOOL, tool), SemanticIdFromTool(tool));
    // Deterministic across calls
    EXPECT_EQ(DeriveSemanticId(EntityType::TOOL, tool), DeriveSemanticId(EntityType::TOOL, tool));
}

// ============================================================================
// Kind table
// ============================================================================

TEST(EntityTypeTest, ParseRoundTripsEveryKind) {
    for (const auto& traits : EntityTypeTable()) {
        auto parsed = ParseEntityType(traits.stix_name);
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, traits.type);
        EXPECT_EQ(ToString(traits.type), traits.stix_name);
    }
}

TEST(EntityTypeTest, UnknownKinds) {
    EXPECT_FALSE(ParseEntityType("campaign").has_value());
    EXPECT_FALSE(ParseEntityType("relationship").has_value());
    EXPECT_FALSE(ParseEntityType("").has_value());
}

// ============================================================================
// Profile builder
// ============================================================================

TEST(ProfileBuilderTest, GroupsByKindAndDeduplicates) {
    ProfileBuilder builder("intrusion-set--x");

    Entity malware{"malware--1", EntityType::MALWARE, "malware-A", false, "uses"};
    Entity tool{"tool--1", EntityType::TOOL, "tool-B", false, "uses"};

    EXPECT_TRUE(builder.Add(malware));
    EXPECT_TRUE(builder.Add(tool));
    EXPECT_FALSE(builder.Add(malware));

    auto profile = std::move(builder).Build();
    EXPECT_EQ(profile.Identifier(), "intrusion-set--x");
    EXPECT_EQ(profile.TotalEntities(), 2u);
    ASSERT_EQ(profile.Malwares().size(), 1u);
    EXPECT_EQ(profile.Malwares()[0].semantic_id, "malware-A");
    EXPECT_EQ(profile.Tools().size(), 1u);
    EXPECT_TRUE(profile.AttackPatterns().empty());
    EXPECT_FALSE(profile.IsEmpty());
}

TEST(ProfileBuilderTest, SameIdDifferentKindIsDistinct) {
    ProfileBuilder builder("intrusion-set--x");
    EXPECT_TRUE(builder.Add({"shared--1", EntityType::IDENTITY, "shared--1", true, "attributed-to"}));
    EXPECT_TRUE(builder.Add({"shared--1", EntityType::LOCATION, "shared--1", false, "targets"}));
    EXPECT_EQ(std::move(builder).Build().TotalEntities(), 2u);
}

TEST(ProfileBuilderTest, EmptyProfile) {
    auto profile = ProfileBuilder("intrusion-set--empty").Build();
    EXPECT_TRUE(profile.IsEmpty());
    EXPECT_EQ(profile.TotalEntities(), 0u);
}
