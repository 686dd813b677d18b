#include "consolidation/consolidation_config.hpp"
#include "consolidation/name_normalizer.hpp"

#include <stdexcept>

namespace ACE {
namespace Consolidation {

namespace {

using Storage::ReferenceKind;
using Storage::TableReference;

// EN: Typed readers: absent keys keep the default, wrong types throw.
// FR: Lecteurs typés : clé absente = défaut, mauvais type = exception.
class SettingsReader {
public:
    explicit SettingsReader(const ConfigManager& manager) : manager_(manager) {}

    void read(const std::string& section, const std::string& key, bool& target) const {
        ConfigValue value = manager_.get(section, key);
        if (!value.isValid()) return;
        auto parsed = value.tryAs<bool>();
        if (!parsed) fail(section, key, "bool", value);
        target = *parsed;
    }

    void read(const std::string& section, const std::string& key, int& target) const {
        ConfigValue value = manager_.get(section, key);
        if (!value.isValid()) return;
        auto parsed = value.tryAs<int>();
        if (!parsed) fail(section, key, "int", value);
        target = *parsed;
    }

    void read(const std::string& section, const std::string& key, size_t& target) const {
        ConfigValue value = manager_.get(section, key);
        if (!value.isValid()) return;
        auto parsed = value.tryAs<int>();
        if (!parsed || *parsed < 0) fail(section, key, "non-negative int", value);
        target = static_cast<size_t>(*parsed);
    }

    void read(const std::string& section, const std::string& key, double& target) const {
        ConfigValue value = manager_.get(section, key);
        if (!value.isValid()) return;
        auto parsed = value.tryAs<double>();
        if (!parsed) fail(section, key, "number", value);
        target = *parsed;
    }

    void read(const std::string& section, const std::string& key, std::string& target) const {
        ConfigValue value = manager_.get(section, key);
        if (!value.isValid()) return;
        auto parsed = value.tryAs<std::string>();
        if (!parsed) fail(section, key, "string", value);
        target = *parsed;
    }

    void read(const std::string& section, const std::string& key, std::vector<std::string>& target) const {
        ConfigValue value = manager_.get(section, key);
        if (!value.isValid()) return;
        auto parsed = value.tryAs<std::vector<std::string>>();
        if (!parsed) fail(section, key, "list", value);
        target = *parsed;
    }

    // EN: Every key of a section read as a list, for lookup tables.
    // FR: Chaque clé d'une section lue comme liste, pour les tables de correspondance.
    std::map<std::string, std::vector<std::string>> readTable(const std::string& section) const {
        std::map<std::string, std::vector<std::string>> table;
        ConfigSection config_section = manager_.getSection(section);
        for (const auto& key : config_section.keys()) {
            std::vector<std::string> values;
            read(section, key, values);
            table[key] = values;
        }
        return table;
    }

private:
    [[noreturn]] static void fail(const std::string& section, const std::string& key,
                                  const std::string& expected, const ConfigValue& value) {
        throw std::invalid_argument(section + "." + key + ": expected " + expected + ", got " +
                                    value.typeName() + " '" + value.toString() + "'");
    }

    const ConfigManager& manager_;
};

void replaceReferences(std::vector<TableReference>& references, ReferenceKind kind,
                       const std::vector<std::string>& entries) {
    std::vector<TableReference> kept;
    for (const auto& ref : references) {
        if (ref.kind != kind) {
            kept.push_back(ref);
        }
    }
    for (const auto& entry : entries) {
        kept.push_back(TableReference::parse(kind, entry));
    }
    references = std::move(kept);
}

void readSchema(const SettingsReader& reader, const ConfigManager& manager, Storage::SchemaContract& schema) {
    reader.read("schema", "entity_table", schema.entity_table);
    reader.read("schema", "id_column", schema.id_column);
    reader.read("schema", "name_column", schema.name_column);
    reader.read("schema", "type_column", schema.type_column);
    reader.read("schema", "mentions_column", schema.mentions_column);
    reader.read("schema", "aliases_column", schema.aliases_column);
    reader.read("schema", "mention_table", schema.mention_table);
    reader.read("schema", "mention_entity_column", schema.mention_entity_column);
    reader.read("schema", "drop_self_references", schema.drop_self_references);

    const std::pair<const char*, ReferenceKind> kinds[] = {
        {"simple_references", ReferenceKind::SIMPLE},
        {"unique_references", ReferenceKind::UNIQUE},
        {"composite_references", ReferenceKind::COMPOSITE},
        {"pair_references", ReferenceKind::PAIR},
    };
    for (const auto& [key, kind] : kinds) {
        if (manager.has("schema", key)) {
            std::vector<std::string> entries;
            reader.read("schema", key, entries);
            replaceReferences(schema.references, kind, entries);
        }
    }

    bool person_enabled = schema.person.has_value();
    reader.read("schema", "person.enabled", person_enabled);
    if (!person_enabled) {
        schema.person.reset();
    } else {
        Storage::PersonSubtype person = schema.person.value_or(Storage::PersonSubtype{});
        reader.read("schema", "person.table", person.table);
        reader.read("schema", "person.id_column", person.id_column);
        reader.read("schema", "person.entity_column", person.entity_column);
        if (manager.has("schema", "person.dependents")) {
            std::vector<std::string> entries;
            reader.read("schema", "person.dependents", entries);
            person.dependents.clear();
            for (const auto& entry : entries) {
                ReferenceKind kind = entry.find('+') != std::string::npos ? ReferenceKind::COMPOSITE
                                                                           : ReferenceKind::SIMPLE;
                person.dependents.push_back(TableReference::parse(kind, entry));
            }
        }
        schema.person = person;
    }

    schema.validateIdentifiers();
}

std::vector<std::string> normalizedList(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    for (const auto& value : values) {
        std::string normalized = NameNormalizer::normalize(value);
        if (!normalized.empty()) {
            out.push_back(normalized);
        }
    }
    return out;
}

} // namespace

ConsolidationConfig ConsolidationConfig::fromConfigManager(const ConfigManager& manager) {
    ConsolidationConfig config;
    SettingsReader reader(manager);

    reader.read("database", "path", config.database.path);
    reader.read("database", "foreign_keys", config.database.foreign_keys);
    reader.read("database", "busy_timeout_ms", config.database.busy_timeout_ms);

    std::string entity_type = entityTypeToString(config.entity_type);
    reader.read("run", "entity_type", entity_type);
    auto parsed_type = parseEntityType(entity_type);
    if (!parsed_type) {
        throw std::invalid_argument("run.entity_type: unknown entity type '" + entity_type + "'");
    }
    config.entity_type = *parsed_type;
    reader.read("run", "dry_run", config.dry_run);
    reader.read("run", "recount_mentions", config.recount_mentions);

    PassSettings& passes = config.passes;
    reader.read("passes", "exact_match", passes.exact_match);
    reader.read("passes", "reordering", passes.reordering);
    reader.read("passes", "fuzzy", passes.fuzzy);
    reader.read("passes", "prefix_stripping", passes.prefix_stripping);
    reader.read("passes", "nickname", passes.nickname);
    reader.read("passes", "known_alias", passes.known_alias);
    reader.read("passes", "min_key_length", passes.min_key_length);
    reader.read("passes", "fuzzy_window", passes.fuzzy_window);
    reader.read("passes", "fuzzy_min_anchor_length", passes.fuzzy_min_anchor_length);
    reader.read("passes", "fuzzy_single_edit_min_length", passes.fuzzy_single_edit_min_length);
    reader.read("passes", "fuzzy_single_edit_max_length", passes.fuzzy_single_edit_max_length);
    reader.read("passes", "fuzzy_long_max_distance", passes.fuzzy_long_max_distance);
    reader.read("passes", "fuzzy_max_length_delta", passes.fuzzy_max_length_delta);
    reader.read("passes", "stop_words", passes.stop_words);
    reader.read("passes", "title_prefixes", passes.title_prefixes);
    passes.stop_words = normalizedList(passes.stop_words);
    passes.title_prefixes = normalizedList(passes.title_prefixes);

    ScoringSettings& scoring = config.scoring;
    reader.read("scoring", "exact_match", scoring.exact_match);
    reader.read("scoring", "reordering", scoring.reordering);
    reader.read("scoring", "typo_base", scoring.typo_base);
    reader.read("scoring", "typo_penalty_per_edit", scoring.typo_penalty_per_edit);
    reader.read("scoring", "prefix_stripping", scoring.prefix_stripping);
    reader.read("scoring", "nickname", scoring.nickname);
    reader.read("scoring", "known_alias", scoring.known_alias);
    reader.read("scoring", "min_confidence", scoring.min_confidence);

    readSchema(reader, manager, config.schema);

    reader.read("audit", "output_path", config.audit.output_path);
    reader.read("audit", "write_file", config.audit.write_file);
    reader.read("audit", "write_table", config.audit.write_table);
    reader.read("audit", "table", config.audit.table);
    reader.read("audit", "actor", config.audit.actor);
    if (!Storage::isValidIdentifier(config.audit.table)) {
        throw std::invalid_argument("audit.table: invalid identifier '" + config.audit.table + "'");
    }

    reader.read("backup", "enabled", config.backup.enabled);
    reader.read("backup", "directory", config.backup.directory);

    reader.read("checkpoint", "enabled", config.checkpoint.enabled);
    reader.read("checkpoint", "path", config.checkpoint.path);
    reader.read("checkpoint", "interval", config.checkpoint.interval);
    reader.read("checkpoint", "resume", config.checkpoint.resume);
    if (config.checkpoint.interval == 0) {
        throw std::invalid_argument("checkpoint.interval must be at least 1");
    }

    reader.read("logging", "level", config.logging.level);
    reader.read("logging", "file", config.logging.file);

    for (const auto& [formal, nicks] : reader.readTable("nicknames")) {
        std::string key = NameNormalizer::normalize(formal);
        if (!key.empty()) {
            config.nicknames[key] = normalizedList(nicks);
        }
    }
    config.known_aliases = reader.readTable("known_aliases");

    return config;
}

std::vector<ConfigManager::ValidationRule> ConsolidationConfig::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule db_path;
    db_path.key = "database.path";
    db_path.type = "string";
    db_path.required = true;
    db_path.description = "SQLite archive to consolidate";
    rules.push_back(db_path);

    ConfigManager::ValidationRule min_confidence;
    min_confidence.key = "scoring.min_confidence";
    min_confidence.type = "double";
    min_confidence.min_value = 0.0;
    min_confidence.max_value = 100.0;
    min_confidence.description = "Candidates below this confidence are discarded";
    rules.push_back(min_confidence);

    ConfigManager::ValidationRule window;
    window.key = "passes.fuzzy_window";
    window.type = "int";
    window.min_value = 1.0;
    window.description = "Neighbours scanned per anchor in the fuzzy pass";
    rules.push_back(window);

    ConfigManager::ValidationRule interval;
    interval.key = "checkpoint.interval";
    interval.type = "int";
    interval.min_value = 1.0;
    interval.description = "Merges between two checkpoints";
    rules.push_back(interval);

    ConfigManager::ValidationRule timeout;
    timeout.key = "database.busy_timeout_ms";
    timeout.type = "int";
    timeout.min_value = 0.0;
    rules.push_back(timeout);

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info", "warn", "warning", "error",
                            "DEBUG", "INFO", "WARN", "WARNING", "ERROR"};
    rules.push_back(level);

    return rules;
}

std::vector<ConfigManager::EnvironmentBinding> ConsolidationConfig::environmentBindings() {
    return {
        {"DB_PATH", "database", "path", "string"},
        {"ENTITY_TYPE", "run", "entity_type", "string"},
        {"DRY_RUN", "run", "dry_run", "bool"},
        {"AUDIT_PATH", "audit", "output_path", "string"},
        {"BACKUP_DIR", "backup", "directory", "string"},
        {"LOG_LEVEL", "logging", "level", "string"},
    };
}

} // namespace Consolidation
} // namespace ACE
