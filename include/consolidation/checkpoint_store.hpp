#pragma once

#include "consolidation/audit_logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ACE {
namespace Consolidation {

// EN: Progress of an interrupted live run
// FR: Progression d'une exécution réelle interrompue
struct Checkpoint {
    std::string run_id;                                  // EN: Correlation id of the run / FR: ID de corrélation de l'exécution
    std::chrono::system_clock::time_point timestamp;     // EN: Save time / FR: Heure de sauvegarde
    std::string database_path;                           // EN: Archive being consolidated / FR: Archive en cours de consolidation
    std::string entity_type;                             // EN: Entity type of the run / FR: Type d'entité de l'exécution
    size_t merges_completed = 0;                         // EN: Successful merges so far / FR: Fusions réussies jusqu'ici
    size_t merges_failed = 0;                            // EN: Failed merges so far / FR: Fusions échouées jusqu'ici
    std::vector<AuditEntry> audit_entries;               // EN: Audit trail so far / FR: Piste d'audit jusqu'ici
    std::map<std::string, size_t> sink_offsets;          // EN: Entries held by each append-only sink / FR: Entrées déjà dans chaque destination en ajout seul
    std::string verification_hash;                       // EN: Hash of the audit payload / FR: Hash de la piste d'audit

    // EN: Serialize checkpoint to JSON, computing the verification hash.
    // FR: Sérialise le checkpoint en JSON en calculant le hash de vérification.
    nlohmann::json toJson() const;

    // EN: Deserialize checkpoint from JSON. Throws nlohmann::json::exception on malformed input.
    // FR: Désérialise le checkpoint depuis JSON.
    static Checkpoint fromJson(const nlohmann::json& json);

    // EN: Verify that the audit payload matches its hash.
    // FR: Vérifie que la piste d'audit correspond à son hash.
    bool verify() const;

    std::string computeHash() const;

    // EN: Whether this checkpoint belongs to the given database and entity type.
    // FR: Indique si ce checkpoint appartient à la base et au type d'entité donnés.
    bool matches(const std::string& database, const std::string& type) const;
};

// EN: Single-file checkpoint storage with atomic replacement.
// FR: Stockage de checkpoint mono-fichier avec remplacement atomique.
class CheckpointStore {
public:
    explicit CheckpointStore(std::string path);

    bool save(const Checkpoint& checkpoint);

    // EN: nullopt when absent, unreadable or failing verification (logged).
    // FR: nullopt si absent, illisible ou non vérifié (journalisé).
    std::optional<Checkpoint> load() const;

    bool remove();
    bool exists() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace Consolidation
} // namespace ACE
