#pragma once

#include "core/entity.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "storage/schema_contract.hpp"

#include <map>
#include <string>
#include <vector>

namespace ACE {
namespace Consolidation {

// EN: Thresholds and switches of the candidate passes. Defaults are the tuned values.
// FR: Seuils et interrupteurs des passes de candidats. Les défauts sont les valeurs ajustées.
struct PassSettings {
    bool exact_match = true;
    bool reordering = true;
    bool fuzzy = true;
    bool prefix_stripping = false;
    bool nickname = false;
    bool known_alias = false;

    size_t min_key_length = 3;
    size_t fuzzy_window = 20;
    size_t fuzzy_min_anchor_length = 6;
    size_t fuzzy_single_edit_min_length = 8;
    size_t fuzzy_single_edit_max_length = 15;
    size_t fuzzy_long_max_distance = 2;
    size_t fuzzy_max_length_delta = 2;

    std::vector<std::string> stop_words = {
        "with", "when", "what", "where", "that", "this",
        "from", "into", "over", "under", "after", "before"
    };

    std::vector<std::string> title_prefixes = {
        "mr", "mrs", "ms", "dr", "prof", "hon", "sir", "madam", "lord", "lady",
        "prince", "princess", "president", "senator", "governor", "secretary",
        "judge", "attorney", "agent", "officer", "detective", "colonel", "general",
        "major", "captain", "lieutenant", "sgt", "sergeant", "rev", "reverend",
        "rep", "representative", "congressman", "congresswoman",
        "sheikh", "sheik", "king", "queen", "baron", "baroness", "count", "countess",
        "duke", "duchess", "emir", "sultan", "minister", "ambassador",
        "chancellor", "premier", "father", "sister", "brother", "rabbi", "imam",
        "bishop", "cardinal", "pope", "deputy"
    };
};

struct ScoringSettings {
    double exact_match = 100.0;
    double reordering = 98.0;
    double typo_base = 100.0;
    double typo_penalty_per_edit = 2.5;
    double prefix_stripping = 90.0;
    double nickname = 85.0;
    double known_alias = 95.0;
    double min_confidence = 0.0;
};

struct DatabaseSettings {
    std::string path;
    bool foreign_keys = true;
    int busy_timeout_ms = 5000;
};

struct AuditSettings {
    std::string output_path = "consolidation_audit.json";
    bool write_file = true;
    bool write_table = false;
    std::string table = "audit_log";
    std::string actor = "entity-consolidator";
};

struct BackupSettings {
    bool enabled = true;
    std::string directory = "backups";
};

struct CheckpointSettings {
    bool enabled = true;
    std::string path = "consolidation.checkpoint.json";
    size_t interval = 100;
    bool resume = false;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;
};

// EN: Read-only configuration of one consolidation run, built once at startup and passed
//     by const reference into every component.
// FR: Configuration en lecture seule d'une exécution, construite au démarrage et passée
//     par référence constante à chaque composant.
struct ConsolidationConfig {
    DatabaseSettings database;
    EntityType entity_type = EntityType::PERSON;
    bool dry_run = false;
    bool recount_mentions = false;

    PassSettings passes;
    ScoringSettings scoring;
    Storage::SchemaContract schema = Storage::SchemaContract::archiveDefault();
    AuditSettings audit;
    BackupSettings backup;
    CheckpointSettings checkpoint;
    LoggingSettings logging;

    // EN: formal first name -> nicknames ("william" -> {"bill", "billy"}).
    // FR: prénom formel -> surnoms.
    std::map<std::string, std::vector<std::string>> nicknames;

    // EN: canonical full name -> variant spellings.
    // FR: nom complet canonique -> variantes.
    std::map<std::string, std::vector<std::string>> known_aliases;

    // EN: Build from the configuration manager, falling back to defaults for absent keys.
    //     Throws std::invalid_argument on malformed values.
    // FR: Construit depuis le gestionnaire de configuration, avec les défauts pour les clés
    //     absentes. Lance std::invalid_argument sur valeur malformée.
    static ConsolidationConfig fromConfigManager(const ConfigManager& manager);

    static std::vector<ConfigManager::ValidationRule> validationRules();
    static std::vector<ConfigManager::EnvironmentBinding> environmentBindings();
};

} // namespace Consolidation
} // namespace ACE
