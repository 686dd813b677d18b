#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ACE {

using EntityId = std::int64_t;

// EN: Entity categories as stored in the archive ("Person", "Organization").
// FR: Catégories d'entité telles que stockées dans l'archive.
enum class EntityType {
    PERSON,
    ORGANIZATION,
    UNKNOWN
};

std::string entityTypeToString(EntityType type);

// EN: Case-insensitive parse; returns nullopt for unrecognized names.
// FR: Analyse insensible à la casse ; nullopt si le nom est inconnu.
std::optional<EntityType> parseEntityType(const std::string& name);

// EN: Canonical record for a person or organization.
// FR: Enregistrement canonique d'une personne ou organisation.
struct Entity {
    EntityId id = 0;
    std::string full_name;
    EntityType entity_type = EntityType::UNKNOWN;
    std::int64_t mentions = 0;
    std::vector<std::string> aliases;
};

// EN: Total order used to orient merges: more mentions ranks higher, equal mentions
//     are broken by the lower id.
// FR: Ordre total d'orientation des fusions : plus de mentions l'emporte, à égalité
//     l'id le plus bas l'emporte.
inline bool outranks(const Entity& a, const Entity& b) {
    if (a.mentions != b.mentions) {
        return a.mentions > b.mentions;
    }
    return a.id < b.id;
}

} // namespace ACE
