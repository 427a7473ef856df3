/**
 * @file entity.cpp
 * @brief Entity kind dispatch, semantic-id derivation and profile building
 *
 * **Semantic IDs**:
 * ```
 * attack-pattern {x_mitre_id: "T1003.001"}  -> attack-pattern-T1003
 * malware        {name: "Poison Ivy"}        -> malware-PoisonIvy
 * tool           {name: "Cobalt Strike"}     -> tool-CobaltStrike
 * identity/location/vulnerability/indicator  -> object id, verbatim
 * ```
 * Sub-techniques collapse onto their parent technique so that incidents
 * reported at different granularity share features.
 *
 * @date 2025
 */

#include "attributor/model/entity.hpp"
#include "attributor/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

namespace attributor {
namespace model {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

// Missing or non-string fields read as empty
std::string StringField(const json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string NamedSemanticId(const char* prefix, const json& object) {
    return std::string(prefix) + StringUtils::RemoveChar(StringField(object, "name"), ' ');
}

const std::vector<Entity> kNoEntities;

} // anonymous namespace

// ============================================================================
// ENTITY KIND DISPATCH
// ============================================================================

const std::array<EntityTypeTraits, kEntityTypeCount>& EntityTypeTable() {
    static const std::array<EntityTypeTraits, kEntityTypeCount> table = {{
        {EntityType::ATTACK_PATTERN, "attack-pattern", &SemanticIdFromAttackPattern},
        {EntityType::MALWARE,        "malware",        &SemanticIdFromMalware},
        {EntityType::TOOL,           "tool",           &SemanticIdFromTool},
        {EntityType::IDENTITY,       "identity",       &SemanticIdFromIdentity},
        {EntityType::LOCATION,       "location",       &SemanticIdFromLocation},
        {EntityType::VULNERABILITY,  "vulnerability",  &SemanticIdFromVulnerability},
        {EntityType::INDICATOR,      "indicator",      &SemanticIdFromIndicator},
    }};
    return table;
}

std::string ToString(EntityType type) {
    return EntityTypeTable()[static_cast<std::size_t>(type)].stix_name;
}

std::optional<EntityType> ParseEntityType(const std::string& stix_type) {
    for (const auto& traits : EntityTypeTable()) {
        if (stix_type == traits.stix_name) {
            return traits.type;
        }
    }
    return std::nullopt;
}

// ============================================================================
// SEMANTIC-ID DERIVATION
// ============================================================================

std::string SemanticIdFromAttackPattern(const json& object) {
    auto technique = StringUtils::FirstSegment(StringField(object, "x_mitre_id"), '.');
    return "attack-pattern-" + StringUtils::RemoveChar(technique, ' ');
}

std::string SemanticIdFromMalware(const json& object) {
    return NamedSemanticId("malware-", object);
}

std::string SemanticIdFromTool(const json& object) {
    return NamedSemanticId("tool-", object);
}

std::string SemanticIdFromIdentity(const json& object) {
    return StringField(object, "id");
}

std::string SemanticIdFromLocation(const json& object) {
    return StringField(object, "id");
}

std::string SemanticIdFromVulnerability(const json& object) {
    return StringField(object, "id");
}

std::string SemanticIdFromIndicator(const json& object) {
    return StringField(object, "id");
}

std::string DeriveSemanticId(EntityType type, const json& object) {
    return EntityTypeTable()[static_cast<std::size_t>(type)].semantic_id(object);
}

// ============================================================================
// INTRUSION SET PROFILE
// ============================================================================

bool IntrusionSetProfile::IsEmpty() const {
    for (const auto& group : entities_) {
        if (!group.empty()) {
            return false;
        }
    }
    return true;
}

const std::vector<Entity>& IntrusionSetProfile::Entities(EntityType type) const {
    auto index = static_cast<std::size_t>(type);
    return index < entities_.size() ? entities_[index] : kNoEntities;
}

std::size_t IntrusionSetProfile::TotalEntities() const {
    std::size_t total = 0;
    for (const auto& group : entities_) {
        total += group.size();
    }
    return total;
}

// ============================================================================
// PROFILE BUILDER
// ============================================================================

ProfileBuilder::ProfileBuilder(std::string identifier) {
    profile_.identifier_ = std::move(identifier);
}

bool ProfileBuilder::Add(Entity entity) {
    if (!seen_.insert(entity.Key()).second) {
        return false;
    }
    profile_.entities_[static_cast<std::size_t>(entity.entity_type)].push_back(std::move(entity));
    return true;
}

IntrusionSetProfile ProfileBuilder::Build() && {
    seen_.clear();
    return std::move(profile_);
}

} // namespace model
} // namespace attributor
