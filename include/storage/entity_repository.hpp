#pragma once

#include "core/entity.hpp"
#include "storage/database.hpp"
#include "storage/schema_contract.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ACE {
namespace Storage {

// EN: Read side of the entity table, plus the mention recount maintenance query.
// FR: Lecture de la table des entités, plus la requête de recomptage des mentions.
class EntityRepository {
public:
    // EN: `schema` must already be resolved against `db`.
    // FR: `schema` doit déjà être résolu contre `db`.
    EntityRepository(Database& db, const SchemaContract& schema);

    // EN: All entities of a type, ordered by id.
    // FR: Toutes les entités d'un type, triées par id.
    DbResult<std::vector<Entity>> loadEntities(EntityType type);

    DbResult<std::optional<Entity>> findById(EntityId id);

    DbResult<std::int64_t> countEntities(EntityType type);

    // EN: Recompute the mention counter of every entity of `type` from the mention table.
    // FR: Recalcule le compteur de mentions de chaque entité de `type` depuis la table des mentions.
    DbResult<int> recountMentions(EntityType type);

private:
    std::string selectColumns() const;
    std::string typeFilter(EntityType type) const;
    Entity readRow(const Statement& stmt) const;

    Database& db_;
    const SchemaContract& schema_;
};

// EN: Alias column codec: JSON array of strings. Legacy values that are not a JSON
//     array are read as a single alias.
// FR: Codec de la colonne d'alias : tableau JSON de chaînes.
std::vector<std::string> parseAliases(const std::string& stored);
std::string serializeAliases(const std::vector<std::string>& aliases);

} // namespace Storage
} // namespace ACE
