#pragma once

#include "consolidation/audit_logger.hpp"
#include "consolidation/merge_candidate.hpp"
#include "storage/database.hpp"
#include "storage/entity_repository.hpp"
#include "storage/schema_contract.hpp"

#include <cstdint>
#include <string>

namespace ACE {
namespace Consolidation {

// EN: What happened to the person subtype during a merge.
// FR: Ce qu'il est advenu du sous-type personne lors d'une fusion.
enum class PersonAction {
    NONE,       // EN: source had no person row / FR: pas de ligne personne côté source
    MOVED,      // EN: source person re-attached to the target / FR: personne source rattachée
    MERGED      // EN: both had one; dependents moved, source person deleted / FR: fusionnées
};

struct MergeOutcome {
    EntityId source_id = 0;
    std::string source_name;
    EntityId target_id = 0;
    std::string target_name;
    std::int64_t mentions_transferred = 0;
    std::int64_t rows_repointed = 0;
    std::int64_t rows_dropped = 0;
    PersonAction person_action = PersonAction::NONE;
};

// EN: Applies one merge candidate as a single all-or-nothing transaction and records it
//     in the audit logger once committed.
// FR: Applique un candidat de fusion en une transaction tout-ou-rien et l'enregistre dans
//     le journal d'audit une fois validé.
class MergeExecutor {
public:
    // EN: `schema` must already be resolved against `db`.
    // FR: `schema` doit déjà être résolu contre `db`.
    MergeExecutor(Storage::Database& db, const Storage::SchemaContract& schema, AuditLogger& audit);

    Storage::DbResult<MergeOutcome> execute(const MergeCandidate& candidate);

private:
    Storage::DbResult<MergeOutcome> applyMerge(const MergeCandidate& candidate);

    Storage::DbResult<void> repoint(const Storage::TableReference& ref, EntityId from, EntityId to,
                                    MergeOutcome& outcome);
    Storage::DbResult<void> repointSimple(const Storage::TableReference& ref, EntityId from, EntityId to,
                                          MergeOutcome& outcome);
    Storage::DbResult<void> repointUnique(const Storage::TableReference& ref, EntityId from, EntityId to,
                                          MergeOutcome& outcome);
    Storage::DbResult<void> repointColumnOrDrop(const std::string& table, const std::string& column,
                                                EntityId from, EntityId to, MergeOutcome& outcome);
    Storage::DbResult<void> repointPair(const Storage::TableReference& ref, EntityId from, EntityId to,
                                        MergeOutcome& outcome);

    Storage::DbResult<void> mergePerson(EntityId source_id, EntityId target_id, MergeOutcome& outcome);
    Storage::DbResult<void> mergeAliases(const Entity& source, const Entity& target);

    Storage::DbResult<std::int64_t> findPersonId(EntityId entity_id);

    // EN: Run a statement whose parameters are all ids; returns rows changed.
    // FR: Exécute une requête dont tous les paramètres sont des id ; retourne les lignes modifiées.
    Storage::DbResult<int> run(const std::string& sql, std::initializer_list<std::int64_t> params);

    Storage::Database& db_;
    const Storage::SchemaContract& schema_;
    Storage::EntityRepository repository_;
    AuditLogger& audit_;
};

} // namespace Consolidation
} // namespace ACE
