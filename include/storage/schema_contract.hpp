#pragma once

#include "storage/database.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ACE {
namespace Storage {

// EN: Shape of a table holding entity references; decides how a merge repoints it.
// FR: Forme d'une table portant des références d'entité ; décide du repointage lors d'une fusion.
enum class ReferenceKind {
    SIMPLE,     // EN: single FK column, no extra uniqueness / FR: colonne FK simple
    UNIQUE,     // EN: FK column that is itself unique / FR: colonne FK elle-même unique
    COMPOSITE,  // EN: FK column + secondary key under a composite key / FR: FK + clé secondaire
    PAIR        // EN: ordered pair of entity columns / FR: paire ordonnée de colonnes d'entité
};

std::string referenceKindToString(ReferenceKind kind);

// EN: One dependent table. For COMPOSITE `secondary` is the other key column, for PAIR it
//     is the second entity column.
// FR: Une table dépendante. Pour COMPOSITE `secondary` est l'autre colonne de clé, pour PAIR
//     la seconde colonne d'entité.
struct TableReference {
    ReferenceKind kind = ReferenceKind::SIMPLE;
    std::string table;
    std::string column;
    std::string secondary;

    // EN: Parse "table.column" or "table.column+secondary". Throws std::invalid_argument.
    // FR: Analyse "table.colonne" ou "table.colonne+secondaire". Lance std::invalid_argument.
    static TableReference parse(ReferenceKind kind, const std::string& raw);

    std::string describe() const;
};

// EN: Optional 1:1 person subtype whose own id is referenced by further tables.
// FR: Sous-type personne 1:1 optionnel dont l'id est référencé par d'autres tables.
struct PersonSubtype {
    std::string table = "people";
    std::string id_column = "id";
    std::string entity_column = "entity_id";
    std::vector<TableReference> dependents;
};

// EN: Enumerates the entity table and every table that references an entity.
// FR: Énumère la table des entités et toutes les tables qui référencent une entité.
struct SchemaContract {
    std::string entity_table = "entities";
    std::string id_column = "id";
    std::string name_column = "full_name";
    std::string type_column = "entity_type";
    std::string mentions_column = "mentions";
    std::string aliases_column = "aliases";

    std::string mention_table = "entity_mentions";
    std::string mention_entity_column = "entity_id";

    std::vector<TableReference> references;
    std::optional<PersonSubtype> person;
    bool drop_self_references = true;

    // EN: Contract matching the archive schema.
    // FR: Contrat correspondant au schéma de l'archive.
    static SchemaContract archiveDefault();

    // EN: Throws std::invalid_argument if any identifier is unsafe to interpolate into SQL.
    // FR: Lance std::invalid_argument si un identifiant n'est pas sûr pour le SQL.
    void validateIdentifiers() const;

    // EN: Copy restricted to what exists in `db`: absent dependent tables are skipped with a
    //     warning, optional columns cleared. Fails if the entity table itself is unusable.
    // FR: Copie restreinte à ce qui existe dans `db` : tables absentes ignorées avec
    //     avertissement, colonnes optionnelles vidées. Échoue si la table d'entités est inutilisable.
    DbResult<SchemaContract> resolveAgainst(Database& db) const;
};

bool isValidIdentifier(const std::string& identifier);

} // namespace Storage
} // namespace ACE
