/**
 * @file test_stix_bundle_parser.cpp
 * @brief Unit tests for intrusion-set profile extraction from STIX bundles
 *
 * Bundles are built in-code; file loading uses a per-test temp directory.
 */

#include <gtest/gtest.h>
#include "attributor/parsers/stix_bundle_parser.hpp"
#include "test_fixtures.hpp"

#include <algorithm>
#include <fstream>
#include <set>

using namespace attributor;
using namespace attributor::testing_support;

namespace {

std::set<std::string> SemanticIds(const model::IntrusionSetProfile& profile) {
    std::set<std::string> ids;
    for (const auto& traits : model::EntityTypeTable()) {
        for (const auto& entity : profile.Entities(traits.type)) {
            ids.insert(entity.semantic_id);
        }
    }
    return ids;
}

const model::Entity* FindEntity(const model::IntrusionSetProfile& profile, const std::string& id) {
    for (const auto& traits : model::EntityTypeTable()) {
        for (const auto& entity : profile.Entities(traits.type)) {
            if (entity.identifier == id) {
                return &entity;
            }
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Profile construction
// ============================================================================

TEST(StixBundleParserTest, NoIntrusionSetYieldsNoProfile) {
    parsers::StixBundleParser parser;
    json objects = json::array({Named("malware", "malware--1", "Orphan"),
                                Relationship("malware--1", "uses", "tool--1")});
    EXPECT_FALSE(parser.BuildProfile(objects).has_value());
    EXPECT_FALSE(parser.BuildProfile(json::array()).has_value());
}

TEST(StixBundleParserTest, NonArrayObjectsYieldNoProfile) {
    parsers::StixBundleParser parser;
    EXPECT_FALSE(parser.BuildProfile(json::object()).has_value());
}

TEST(StixBundleParserTest, IntrusionSetWithoutIdYieldsNoProfile) {
    parsers::StixBundleParser parser;
    json relationship = {{"type", "relationship"}, {"relationship_type", "uses"}, {"target_ref", "tool--1"}};
    json objects = json::array({{{"type", "intrusion-set"}, {"name", "Anonymous"}},
                                Named("tool", "tool--1", "Dangling Tool"),
                                relationship});
    EXPECT_FALSE(parser.BuildProfile(objects).has_value());
}

TEST(StixBundleParserTest, IntrusionSetWithoutRelationshipsIsEmpty) {
    parsers::StixBundleParser parser;
    auto profile = parser.BuildProfile(json::array({IntrusionSet("intrusion-set--1", "Lonely")}));
    ASSERT_TRUE(profile.has_value());
    EXPECT_TRUE(profile->IsEmpty());
    EXPECT_EQ(profile->Identifier(), "intrusion-set--1");
}

TEST(StixBundleParserTest, UnconnectedEntitiesAreExcluded) {
    parsers::StixBundleParser parser;
    json objects = json::array({
        IntrusionSet("intrusion-set--1", "APT"),
        Named("malware", "malware--used", "Used"),
        Named("malware", "malware--unrelated", "Unrelated"),
        Named("tool", "tool--other", "Other Tool"),
        Relationship("intrusion-set--1", "uses", "malware--used"),
        // Relationship not touching the intrusion set
        Relationship("malware--unrelated", "uses", "tool--other"),
    });

    auto profile = parser.BuildProfile(objects);
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(SemanticIds(*profile), std::set<std::string>{"malware-Used"});
}

TEST(StixBundleParserTest, DirectionSetsIsSubject) {
    parsers::StixBundleParser parser;
    json objects = json::array({
        IntrusionSet("intrusion-set--1", "APT"),
        Named("malware", "malware--1", "Backdoor"),
        Plain("identity", "identity--1"),
        Plain("location", "location--1"),
        Relationship("intrusion-set--1", "uses", "malware--1"),
        Relationship("identity--1", "attributed-to", "intrusion-set--1"),
        Relationship("intrusion-set--1", "targets", "location--1"),
    });

    auto profile = parser.BuildProfile(objects);
    ASSERT_TRUE(profile.has_value());
    ASSERT_EQ(profile->TotalEntities(), 3u);

    const auto* malware = FindEntity(*profile, "malware--1");
    ASSERT_NE(malware, nullptr);
    EXPECT_FALSE(malware->is_subject);
    EXPECT_EQ(malware->relation, "uses");

    const auto* identity = FindEntity(*profile, "identity--1");
    ASSERT_NE(identity, nullptr);
    EXPECT_TRUE(identity->is_subject);
    EXPECT_EQ(identity->relation, "attributed-to");

    const auto* location = FindEntity(*profile, "location--1");
    ASSERT_NE(location, nullptr);
    EXPECT_FALSE(location->is_subject);
}

TEST(StixBundleParserTest, DuplicateRelationshipsCollapse) {
    parsers::StixBundleParser parser;
    json objects = json::array({
        IntrusionSet("intrusion-set--1", "APT"),
        Named("tool", "tool--1", "Mimi Katz"),
        Relationship("intrusion-set--1", "uses", "tool--1"),
        Relationship("intrusion-set--1", "uses", "tool--1"),
        // Incoming edge to an entity already reached outgoing
        Relationship("tool--1", "related-to", "intrusion-set--1"),
    });

    auto profile = parser.BuildProfile(objects);
    ASSERT_TRUE(profile.has_value());
    ASSERT_EQ(profile->Tools().size(), 1u);
    EXPECT_EQ(profile->Tools()[0].semantic_id, "tool-MimiKatz");
    EXPECT_FALSE(profile->Tools()[0].is_subject);
}

TEST(StixBundleParserTest, UnknownReferencesAndKindsAreSkipped) {
    parsers::StixBundleParser parser;
    json objects = json::array({
        IntrusionSet("intrusion-set--1", "APT"),
        Plain("campaign", "campaign--1"),
        Relationship("intrusion-set--1", "uses", "malware--missing"),
        Relationship("campaign--1", "attributed-to", "intrusion-set--1"),
    });

    auto profile = parser.BuildProfile(objects);
    ASSERT_TRUE(profile.has_value());
    EXPECT_TRUE(profile->IsEmpty());
}

TEST(StixBundleParserTest, ExtractionIsIdempotent) {
    parsers::StixBundleParser parser;
    auto bundle = IntrusionSetBundle("Alpha", 4, 2, 2);

    auto first = parser.BuildProfile(bundle["objects"]);
    auto second = parser.BuildProfile(bundle["objects"]);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(SemanticIds(*first), SemanticIds(*second));
    EXPECT_EQ(first->TotalEntities(), 8u);
}

// ============================================================================
// Labels and multi-bundle extraction
// ============================================================================

TEST(StixBundleParserTest, IntrusionSetLabel) {
    json objects = json::array({Named("malware", "malware--1", "X"), IntrusionSet("intrusion-set--9", "Fancy Bear")});
    EXPECT_EQ(parsers::StixBundleParser::IntrusionSetLabel(objects), "Fancy Bear_intrusion-set--9");
    EXPECT_EQ(parsers::StixBundleParser::IntrusionSetLabel(json::array()), " ");
}

TEST(StixBundleParserTest, ExtractProfilesKeysByLabel) {
    parsers::StixBundleParser parser;
    std::vector<json> bundles = {
        IntrusionSetBundle("Alpha", 3, 1, 1),
        IntrusionSetBundle("Beta", 2, 2, 0),
        json{{"type", "bundle"}, {"objects", json::array({Plain("identity", "identity--1")})}},
    };

    auto profiles = parser.ExtractProfiles(bundles);
    ASSERT_EQ(profiles.size(), 2u);
    ASSERT_TRUE(profiles.count("Alpha_intrusion-set--Alpha"));
    ASSERT_TRUE(profiles.count("Beta_intrusion-set--Beta"));
    EXPECT_EQ(profiles.at("Alpha_intrusion-set--Alpha").TotalEntities(), 5u);
    EXPECT_EQ(profiles.at("Beta_intrusion-set--Beta").TotalEntities(), 4u);
}

TEST(StixBundleParserTest, LaterBundleWinsOnLabelCollision) {
    parsers::StixBundleParser parser;
    auto profiles = parser.ExtractProfiles({IntrusionSetBundle("Alpha", 3, 0, 0),
                                            IntrusionSetBundle("Alpha", 1, 0, 0)});
    ASSERT_EQ(profiles.size(), 1u);
    EXPECT_EQ(profiles.begin()->second.TotalEntities(), 1u);
}

// ============================================================================
// Incident conversion
// ============================================================================

TEST(StixBundleParserTest, IncidentToString) {
    parsers::StixBundleParser parser;
    json incident = {{"type", "bundle"},
                     {"objects", json::array({
                         AttackPattern("attack-pattern--1", "T1566.002"),
                         Named("tool", "tool--1", "Cobalt Strike"),
                         Plain("indicator", "indicator--7"),
                         Plain("observed-data", "observed-data--1"),
                     })}};
    EXPECT_EQ(parser.IncidentToString(incident),
              "attack-pattern-T1566 tool-CobaltStrike indicator--7");
    EXPECT_EQ(parser.IncidentToString(json{{"objects", json::array()}}), "");
}

// ============================================================================
// File loading
// ============================================================================

TEST(StixBundleParserTest, LoadBundlesFromDirectory) {
    TempDirectory dir;
    {
        std::ofstream(dir.Path() / "b.json") << IntrusionSetBundle("Beta", 1, 0, 0).dump();
        std::ofstream(dir.Path() / "a.json") << IntrusionSetBundle("Alpha", 1, 0, 0).dump();
        std::ofstream(dir.Path() / "notes.txt") << "ignored";
        std::ofstream(dir.Path() / "broken.json") << "{ not json";
    }

    parsers::StixBundleParser parser;
    auto bundles = parser.LoadBundles(dir.Path());
    ASSERT_EQ(bundles.size(), 2u);
    EXPECT_EQ(bundles[0]["id"], "bundle--Alpha");
    EXPECT_EQ(bundles[1]["id"], "bundle--Beta");
}

TEST(StixBundleParserTest, LoadBundleFileAcceptsArrayOfBundles) {
    TempDirectory dir;
    const auto file = dir.Path() / "many.json";
    {
        json many = json::array({IntrusionSetBundle("Alpha", 1, 0, 0), IntrusionSetBundle("Beta", 1, 0, 0)});
        std::ofstream(file) << many.dump();
    }

    parsers::StixBundleParser parser;
    EXPECT_EQ(parser.LoadBundleFile(file).size(), 2u);
    EXPECT_TRUE(parser.LoadBundles(dir.Path() / "missing.json").empty());
}
