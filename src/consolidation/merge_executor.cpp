// EN: Transactional cross-table merge. Every dependent table named by the schema contract is
//     repointed from the source entity to the target before the source row is deleted.
// FR: Fusion transactionnelle multi-tables. Chaque table dépendante du contrat de schéma est
//     repointée de la source vers la cible avant la suppression de la ligne source.

#include "consolidation/merge_executor.hpp"
#include "consolidation/name_normalizer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <set>
#include <unordered_map>

namespace ACE {
namespace Consolidation {

using Storage::DbResult;
using Storage::MergeError;
using Storage::ReferenceKind;
using Storage::StorageError;
using Storage::TableReference;

MergeExecutor::MergeExecutor(Storage::Database& db, const Storage::SchemaContract& schema, AuditLogger& audit)
    : db_(db), schema_(schema), repository_(db, schema), audit_(audit) {}

DbResult<MergeOutcome> MergeExecutor::execute(const MergeCandidate& candidate) {
    if (candidate.source_id == candidate.target_id) {
        return StorageError::other("refusing to merge entity " + std::to_string(candidate.source_id) +
                                   " into itself");
    }

    auto outcome = db_.transaction([&]() { return applyMerge(candidate); });
    if (!outcome) {
        return outcome;
    }

    const MergeOutcome& merged = outcome.value();
    AuditEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.source_id = merged.source_id;
    entry.source_name = merged.source_name;
    entry.target_id = merged.target_id;
    entry.target_name = merged.target_name;
    entry.mentions_transferred = merged.mentions_transferred;
    entry.confidence = candidate.confidence;
    entry.method = methodName(candidate.method);
    audit_.append(std::move(entry));

    std::unordered_map<std::string, std::string> metadata = {
        {"source_id", std::to_string(merged.source_id)},
        {"target_id", std::to_string(merged.target_id)},
        {"method", methodName(candidate.method)},
        {"rows_repointed", std::to_string(merged.rows_repointed)},
        {"rows_dropped", std::to_string(merged.rows_dropped)}
    };
    LOG_INFO_META("executor", "Merged \"" + merged.source_name + "\" into \"" + merged.target_name + "\"", metadata);
    return outcome;
}

DbResult<MergeOutcome> MergeExecutor::applyMerge(const MergeCandidate& candidate) {
    auto source = repository_.findById(candidate.source_id);
    if (!source) return source.error();
    if (!source.value()) {
        return StorageError::notFound("source entity " + std::to_string(candidate.source_id) + " not found");
    }
    auto target = repository_.findById(candidate.target_id);
    if (!target) return target.error();
    if (!target.value()) {
        return StorageError::notFound("target entity " + std::to_string(candidate.target_id) + " not found");
    }

    const Entity& src = *source.value();
    const Entity& tgt = *target.value();

    MergeOutcome outcome;
    outcome.source_id = src.id;
    outcome.source_name = src.full_name;
    outcome.target_id = tgt.id;
    outcome.target_name = tgt.full_name;
    outcome.mentions_transferred = src.mentions;

    for (const auto& ref : schema_.references) {
        auto repointed = repoint(ref, src.id, tgt.id, outcome);
        if (!repointed) return repointed.error();
    }

    if (schema_.person) {
        auto person = mergePerson(src.id, tgt.id, outcome);
        if (!person) return person.error();
    }

    if (!schema_.aliases_column.empty()) {
        auto aliases = mergeAliases(src, tgt);
        if (!aliases) return aliases.error();
    }

    // EN: Additive transfer; mention rows are not recounted here.
    // FR: Transfert additif ; les lignes de mention ne sont pas recomptées ici.
    auto counted = run("UPDATE " + schema_.entity_table + " SET " + schema_.mentions_column + " = COALESCE(" +
                       schema_.mentions_column + ", 0) + ? WHERE " + schema_.id_column + " = ?",
                       {src.mentions, tgt.id});
    if (!counted) return counted.error();

    auto deleted = run("DELETE FROM " + schema_.entity_table + " WHERE " + schema_.id_column + " = ?", {src.id});
    if (!deleted) return deleted.error();
    if (deleted.value() != 1) {
        return StorageError::notFound("source entity " + std::to_string(src.id) + " vanished during merge");
    }

    return outcome;
}

DbResult<void> MergeExecutor::repoint(const TableReference& ref, EntityId from, EntityId to, MergeOutcome& outcome) {
    switch (ref.kind) {
        case ReferenceKind::SIMPLE:
            return repointSimple(ref, from, to, outcome);
        case ReferenceKind::UNIQUE:
            return repointUnique(ref, from, to, outcome);
        case ReferenceKind::COMPOSITE:
            return repointColumnOrDrop(ref.table, ref.column, from, to, outcome);
        case ReferenceKind::PAIR:
            return repointPair(ref, from, to, outcome);
    }
    return StorageError::other("unknown reference kind for " + ref.table);
}

DbResult<void> MergeExecutor::repointSimple(const TableReference& ref, EntityId from, EntityId to,
                                            MergeOutcome& outcome) {
    auto changed = run("UPDATE " + ref.table + " SET " + ref.column + " = ? WHERE " + ref.column + " = ?", {to, from});
    if (!changed) return changed.error();
    outcome.rows_repointed += changed.value();
    return {};
}

// EN: A unique FK column admits one row per entity: the target's row wins on conflict.
// FR: Une colonne FK unique n'admet qu'une ligne par entité : celle de la cible l'emporte.
DbResult<void> MergeExecutor::repointUnique(const TableReference& ref, EntityId from, EntityId to,
                                            MergeOutcome& outcome) {
    auto changed = run("UPDATE " + ref.table + " SET " + ref.column + " = ? WHERE " + ref.column + " = ?", {to, from});
    if (changed) {
        outcome.rows_repointed += changed.value();
        return {};
    }
    if (changed.error().kind != MergeError::CONSTRAINT_VIOLATION) {
        return changed.error();
    }

    auto dropped = run("DELETE FROM " + ref.table + " WHERE " + ref.column + " = ?", {from});
    if (!dropped) return dropped.error();
    outcome.rows_dropped += dropped.value();
    LOG_DEBUG("executor", ref.table + ": kept target row, dropped " + std::to_string(dropped.value()) +
              " conflicting source row(s)");
    return {};
}

// EN: Rows that would collide with an existing target row are skipped by OR IGNORE and then
//     deleted; without an enforced composite key every row is moved.
// FR: Les lignes en collision avec une ligne de la cible sont ignorées puis supprimées ; sans
//     clé composite appliquée toutes les lignes sont déplacées.
DbResult<void> MergeExecutor::repointColumnOrDrop(const std::string& table, const std::string& column,
                                                  EntityId from, EntityId to, MergeOutcome& outcome) {
    auto moved = run("UPDATE OR IGNORE " + table + " SET " + column + " = ? WHERE " + column + " = ?", {to, from});
    if (!moved) return moved.error();
    auto dropped = run("DELETE FROM " + table + " WHERE " + column + " = ?", {from});
    if (!dropped) return dropped.error();

    outcome.rows_repointed += moved.value();
    outcome.rows_dropped += dropped.value();
    if (dropped.value() > 0) {
        LOG_DEBUG("executor", table + "." + column + ": dropped " + std::to_string(dropped.value()) +
                  " duplicate row(s) already present on the target");
    }
    return {};
}

DbResult<void> MergeExecutor::repointPair(const TableReference& ref, EntityId from, EntityId to,
                                          MergeOutcome& outcome) {
    auto first = repointColumnOrDrop(ref.table, ref.column, from, to, outcome);
    if (!first) return first;
    auto second = repointColumnOrDrop(ref.table, ref.secondary, from, to, outcome);
    if (!second) return second;

    if (schema_.drop_self_references) {
        auto loops = run("DELETE FROM " + ref.table + " WHERE " + ref.column + " = ? AND " + ref.secondary + " = ?",
                         {to, to});
        if (!loops) return loops.error();
        outcome.rows_dropped += loops.value();
    }
    return {};
}

DbResult<std::int64_t> MergeExecutor::findPersonId(EntityId entity_id) {
    const Storage::PersonSubtype& person = *schema_.person;
    auto stmtR = db_.prepare("SELECT " + person.id_column + " FROM " + person.table + " WHERE " +
                             person.entity_column + " = ?");
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();

    auto br = stmt.bind(1, entity_id);
    if (!br) return br.error();
    auto step = stmt.step();
    if (!step) return step.error();
    if (!step.value()) {
        return StorageError::notFound("no person row for entity " + std::to_string(entity_id));
    }
    return stmt.getInt64(0);
}

// EN: Person rows are keyed by entity but referenced by their own id. With a person on each
//     side the source person's dependents move to the target person before it is deleted.
// FR: Les lignes personne sont indexées par entité mais référencées par leur propre id.
DbResult<void> MergeExecutor::mergePerson(EntityId source_id, EntityId target_id, MergeOutcome& outcome) {
    const Storage::PersonSubtype& person = *schema_.person;

    auto source_person = findPersonId(source_id);
    if (!source_person) {
        if (source_person.error().kind == MergeError::NOT_FOUND) {
            return {};
        }
        return source_person.error();
    }

    auto target_person = findPersonId(target_id);
    if (!target_person) {
        if (target_person.error().kind != MergeError::NOT_FOUND) {
            return target_person.error();
        }
        auto moved = run("UPDATE " + person.table + " SET " + person.entity_column + " = ? WHERE " +
                         person.id_column + " = ?", {target_id, source_person.value()});
        if (!moved) return moved.error();
        outcome.person_action = PersonAction::MOVED;
        return {};
    }

    for (const auto& dependent : person.dependents) {
        auto repointed = repoint(dependent, source_person.value(), target_person.value(), outcome);
        if (!repointed) return repointed;
    }

    auto removed = run("DELETE FROM " + person.table + " WHERE " + person.id_column + " = ?", {source_person.value()});
    if (!removed) return removed.error();
    outcome.person_action = PersonAction::MERGED;
    return {};
}

DbResult<void> MergeExecutor::mergeAliases(const Entity& source, const Entity& target) {
    std::set<std::string> seen = {NameNormalizer::normalize(target.full_name)};
    std::vector<std::string> merged;
    for (const auto& alias : target.aliases) {
        std::string key = NameNormalizer::normalize(alias);
        if (!key.empty() && seen.insert(key).second) {
            merged.push_back(alias);
        }
    }

    size_t added = 0;
    auto add = [&](const std::string& alias) {
        std::string key = NameNormalizer::normalize(alias);
        if (!key.empty() && seen.insert(key).second) {
            merged.push_back(alias);
            ++added;
        }
    };
    add(source.full_name);
    for (const auto& alias : source.aliases) add(alias);

    if (added == 0) {
        return {};
    }

    auto stmtR = db_.prepare("UPDATE " + schema_.entity_table + " SET " + schema_.aliases_column + " = ? WHERE " +
                             schema_.id_column + " = ?");
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();
    auto br = stmt.bind(1, std::string_view(Storage::serializeAliases(merged)));
    if (!br) return br;
    br = stmt.bind(2, target.id);
    if (!br) return br;
    auto er = stmt.execute();
    if (!er) return er.error();
    return {};
}

DbResult<int> MergeExecutor::run(const std::string& sql, std::initializer_list<std::int64_t> params) {
    auto stmtR = db_.prepare(sql);
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();

    int index = 1;
    for (std::int64_t param : params) {
        auto br = stmt.bind(index++, param);
        if (!br) return br.error();
    }
    return stmt.execute();
}

} // namespace Consolidation
} // namespace ACE
