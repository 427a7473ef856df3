/**
 * @file stix_bundle_parser.cpp
 * @brief Implementation of STIX bundle to intrusion-set profile extraction
 *
 * **Bundle Layout** (one intrusion set per bundle):
 * ```
 * {
 *   "type": "bundle",
 *   "objects": [
 *     {"type": "intrusion-set", "id": "intrusion-set--1", "name": "APT X"},
 *     {"type": "malware", "id": "malware--2", "name": "Poison Ivy"},
 *     {"type": "relationship", "relationship_type": "uses",
 *      "source_ref": "intrusion-set--1", "target_ref": "malware--2"}
 *   ]
 * }
 * ```
 *
 * **Direction**:
 * - intrusion-set --uses--> malware      : malware attached, is_subject = false
 * - identity --attributed-to--> intrusion-set : identity attached, is_subject = true
 *
 * Outgoing relationships are processed before incoming ones, each pass in
 * bundle order; the first relationship to reach a (type, id) pair decides
 * its relation and direction.
 *
 * @date 2025
 */

#include "attributor/parsers/stix_bundle_parser.hpp"
#include "attributor/utils/string_utils.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_map>
#include <utility>

namespace attributor {
namespace parsers {

using json = nlohmann::json;
using model::Entity;
using model::EntityType;
using utils::StringUtils;

namespace {

constexpr const char* kIntrusionSetType = "intrusion-set";
constexpr const char* kRelationshipType = "relationship";

const json kEmptyArray = json::array();

std::string StringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

struct RelatedObject {
    EntityType type;
    std::string semantic_id;
};

} // anonymous namespace

StixBundleParser::StixBundleParser(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    logger_->debug("STIX bundle parser initialized");
}

// ============================================================================
// PROFILE EXTRACTION
// ============================================================================

std::optional<model::IntrusionSetProfile> StixBundleParser::BuildProfile(const json& objects) const {
    if (!objects.is_array()) {
        logger_->warn("Bundle objects must be a JSON array, got {}", objects.type_name());
        return std::nullopt;
    }

    // Step 1: locate the intrusion set
    auto intrusion_set = std::find_if(objects.begin(), objects.end(), [](const json& item) {
        return item.is_object() && StringField(item, "type") == kIntrusionSetType;
    });
    if (intrusion_set == objects.end()) {
        logger_->debug("Bundle holds no intrusion-set object");
        return std::nullopt;
    }
    const std::string intrusion_set_id = StringField(*intrusion_set, "id");
    if (intrusion_set_id.empty()) {
        // An empty id would match every relationship missing a ref
        logger_->debug("Intrusion-set object has no id");
        return std::nullopt;
    }

    // Step 2: index related objects by id
    std::unordered_map<std::string, RelatedObject> related_objects;
    for (const auto& item : objects) {
        if (!item.is_object()) {
            logger_->debug("Skipping non-object bundle entry");
            continue;
        }
        auto type = model::ParseEntityType(StringField(item, "type"));
        if (!type) {
            continue;
        }
        auto id = StringField(item, "id");
        if (id.empty()) {
            logger_->debug("Skipping {} object without id", model::ToString(*type));
            continue;
        }
        related_objects[id] = RelatedObject{*type, model::DeriveSemanticId(*type, item)};
    }

    // Step 3: walk relationships touching the intrusion set
    model::ProfileBuilder builder(intrusion_set_id);
    std::size_t skipped_unknown = 0;
    std::size_t skipped_duplicate = 0;

    auto attach = [&](const json& relationship, const char* other_end, bool is_subject) {
        auto ref = StringField(relationship, other_end);
        auto related = related_objects.find(ref);
        if (related == related_objects.end()) {
            ++skipped_unknown;
            return;
        }
        Entity entity;
        entity.identifier = ref;
        entity.entity_type = related->second.type;
        entity.semantic_id = related->second.semantic_id;
        entity.is_subject = is_subject;
        entity.relation = StringField(relationship, "relationship_type");
        if (!builder.Add(std::move(entity))) {
            ++skipped_duplicate;
        }
    };

    for (const auto& item : objects) {
        if (item.is_object() && StringField(item, "type") == kRelationshipType &&
            StringField(item, "source_ref") == intrusion_set_id) {
            attach(item, "target_ref", false);
        }
    }
    for (const auto& item : objects) {
        if (item.is_object() && StringField(item, "type") == kRelationshipType &&
            StringField(item, "target_ref") == intrusion_set_id) {
            attach(item, "source_ref", true);
        }
    }

    auto profile = std::move(builder).Build();

    logger_->debug("Profile {}: {} entities ({} unknown refs, {} duplicates skipped)",
                   intrusion_set_id, profile.TotalEntities(), skipped_unknown, skipped_duplicate);

    return profile;
}

std::string StixBundleParser::IntrusionSetLabel(const json& objects) {
    if (!objects.is_array()) {
        return " ";
    }
    for (const auto& item : objects) {
        if (!item.is_object()) {
            continue;
        }
        auto id = StringField(item, "id");
        if (StringUtils::StartsWith(id, kIntrusionSetType)) {
            return StringField(item, "name") + "_" + id;
        }
    }
    return " ";
}

std::map<std::string, model::IntrusionSetProfile> StixBundleParser::ExtractProfiles(
    const std::vector<json>& bundles) const {

    std::map<std::string, model::IntrusionSetProfile> profiles;

    for (const auto& bundle : bundles) {
        const auto& objects = BundleObjects(bundle);
        auto profile = BuildProfile(objects);
        if (!profile) {
            continue;
        }

        auto label = IntrusionSetLabel(objects);
        if (profiles.count(label) > 0) {
            logger_->warn("Duplicate intrusion set label '{}', keeping the later bundle", label);
        }
        profiles.insert_or_assign(label, std::move(*profile));
    }

    logger_->info("Extracted {} intrusion set profiles from {} bundles", profiles.size(), bundles.size());
    return profiles;
}

// ============================================================================
// INCIDENT CONVERSION
// ============================================================================

std::string StixBundleParser::IncidentToString(const json& incident) const {
    std::vector<std::string> tokens;

    for (const auto& item : BundleObjects(incident)) {
        if (!item.is_object()) {
            continue;
        }
        auto id = StringField(item, "id");
        for (const auto& traits : model::EntityTypeTable()) {
            if (StringUtils::StartsWith(id, traits.stix_name)) {
                tokens.push_back(traits.semantic_id(item));
                break;
            }
        }
    }

    logger_->debug("Incident converted to {} tokens", tokens.size());
    return StringUtils::Join(tokens, " ");
}

// ============================================================================
// BUNDLE LOADING
// ============================================================================

std::vector<json> StixBundleParser::LoadBundles(const std::filesystem::path& path) const {
    std::vector<json> bundles;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logger_->warn("Bundle path not found: {}", path.string());
        return bundles;
    }

    if (!std::filesystem::is_directory(path, ec)) {
        return LoadBundleFile(path);
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        logger_->error("Failed to list bundle directory {}: {}", path.string(), ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto loaded = LoadBundleFile(file);
        bundles.insert(bundles.end(),
                       std::make_move_iterator(loaded.begin()),
                       std::make_move_iterator(loaded.end()));
    }

    logger_->info("Loaded {} bundles from {} files in {}", bundles.size(), files.size(), path.string());
    return bundles;
}

std::vector<json> StixBundleParser::LoadBundleFile(const std::filesystem::path& file) const {
    std::ifstream stream(file);
    if (!stream.is_open()) {
        logger_->warn("Could not open bundle file: {}", file.string());
        return {};
    }

    try {
        json document = json::parse(stream);
        if (document.is_array() && !document.empty() && document.front().is_object() &&
            document.front().contains("objects")) {
            return document.get<std::vector<json>>();
        }
        return {std::move(document)};
    }
    catch (const json::exception& e) {
        logger_->error("Error parsing bundle file {}: {}", file.string(), e.what());
        return {};
    }
}

const json& StixBundleParser::BundleObjects(const json& bundle) {
    if (bundle.is_array()) {
        return bundle;
    }
    if (bundle.is_object()) {
        auto it = bundle.find("objects");
        if (it != bundle.end()) {
            return *it;
        }
    }
    return kEmptyArray;
}

} // namespace parsers
} // namespace attributor
