/**
 * @file entity.hpp
 * @brief Threat-intelligence entities and intrusion-set profiles
 *
 * Defines the seven STIX entity kinds that can be attached to an intrusion
 * set, the semantic-id derivation applied to each kind, and the immutable
 * profile produced by the STIX bundle parser.
 *
 * @date 2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace attributor {
namespace model {

/**
 * @enum EntityType
 * @brief STIX domain object kinds related to an intrusion set
 *
 * Declaration order is the storage order inside IntrusionSetProfile.
 */
enum class EntityType {
    ATTACK_PATTERN,   ///< "attack-pattern" (MITRE ATT&CK technique)
    MALWARE,          ///< "malware"
    TOOL,             ///< "tool"
    IDENTITY,         ///< "identity" (targeted organisation / sector)
    LOCATION,         ///< "location"
    VULNERABILITY,    ///< "vulnerability"
    INDICATOR         ///< "indicator"
};

/// Number of EntityType variants
inline constexpr std::size_t kEntityTypeCount = 7;

/**
 * @struct Entity
 * @brief One object related to an intrusion set through a relationship
 *
 * Two entities are the same for deduplication purposes when both
 * entity_type and identifier match.
 */
struct Entity {
    std::string identifier;        ///< Raw STIX id ("malware--...")
    EntityType entity_type{EntityType::ATTACK_PATTERN};
    std::string semantic_id;       ///< Normalized feature token
    bool is_subject{false};        ///< True when the intrusion set is the relationship target
    std::string relation;          ///< relationship_type ("uses", "targets", ...)

    std::pair<EntityType, std::string> Key() const { return {entity_type, identifier}; }
};

/// Semantic-id derivation signature
using SemanticIdFunction = std::string (*)(const nlohmann::json& object);

/**
 * @struct EntityTypeTraits
 * @brief Dispatch row for one entity kind
 */
struct EntityTypeTraits {
    EntityType type;
    const char* stix_name;
    SemanticIdFunction semantic_id;
};

/**
 * @brief Dispatch table, one row per EntityType in declaration order
 */
const std::array<EntityTypeTraits, kEntityTypeCount>& EntityTypeTable();

/**
 * @brief STIX type name ("attack-pattern", "malware", ...)
 */
std::string ToString(EntityType type);

/**
 * @brief Map a STIX type name onto an EntityType
 * @return nullopt for "relationship", "intrusion-set" and unknown kinds
 */
std::optional<EntityType> ParseEntityType(const std::string& stix_type);

/***************************************************************************
 * Semantic-ID Derivation
 *
 * Missing or non-string fields contribute empty components; none of these
 * functions throw.
 ***************************************************************************/

/// "attack-pattern-" + x_mitre_id up to the first '.', spaces removed
std::string SemanticIdFromAttackPattern(const nlohmann::json& object);

/// "malware-" + name with spaces removed
std::string SemanticIdFromMalware(const nlohmann::json& object);

/// "tool-" + name with spaces removed
std::string SemanticIdFromTool(const nlohmann::json& object);

/// The object's id
std::string SemanticIdFromIdentity(const nlohmann::json& object);

/// The object's id
std::string SemanticIdFromLocation(const nlohmann::json& object);

/// The object's id
std::string SemanticIdFromVulnerability(const nlohmann::json& object);

/// The object's id
std::string SemanticIdFromIndicator(const nlohmann::json& object);

/**
 * @brief Dispatch to the derivation for the given kind
 */
std::string DeriveSemanticId(EntityType type, const nlohmann::json& object);

/**
 * @class IntrusionSetProfile
 * @brief Entities related to a single intrusion set, grouped by kind
 *
 * Immutable once built; obtain one from ProfileBuilder::Build(). No group
 * holds two entities with the same (entity_type, identifier).
 */
class IntrusionSetProfile {
public:
    const std::string& Identifier() const { return identifier_; }

    /// True when every group is empty
    bool IsEmpty() const;

    const std::vector<Entity>& Entities(EntityType type) const;

    const std::vector<Entity>& AttackPatterns() const { return Entities(EntityType::ATTACK_PATTERN); }
    const std::vector<Entity>& Malwares() const { return Entities(EntityType::MALWARE); }
    const std::vector<Entity>& Tools() const { return Entities(EntityType::TOOL); }
    const std::vector<Entity>& Identities() const { return Entities(EntityType::IDENTITY); }
    const std::vector<Entity>& Locations() const { return Entities(EntityType::LOCATION); }
    const std::vector<Entity>& Vulnerabilities() const { return Entities(EntityType::VULNERABILITY); }
    const std::vector<Entity>& Indicators() const { return Entities(EntityType::INDICATOR); }

    /// Sum of all group sizes (all entities are distinct)
    std::size_t TotalEntities() const;

private:
    friend class ProfileBuilder;

    std::string identifier_;
    std::array<std::vector<Entity>, kEntityTypeCount> entities_;
};

/**
 * @class ProfileBuilder
 * @brief Accumulates entities for one intrusion set
 *
 * **Usage Example**:
 * @code
 * ProfileBuilder builder("intrusion-set--abc");
 * builder.Add(entity);
 * IntrusionSetProfile profile = std::move(builder).Build();
 * @endcode
 */
class ProfileBuilder {
public:
    explicit ProfileBuilder(std::string identifier);

    /**
     * @brief Append an entity to its group
     * @return false when an entity with the same key was already added
     */
    bool Add(Entity entity);

    /**
     * @brief Finish building; the builder is left empty
     */
    IntrusionSetProfile Build() &&;

private:
    IntrusionSetProfile profile_;
    std::set<std::pair<EntityType, std::string>> seen_;
};

} // namespace model
} // namespace attributor
