#pragma once

#include "core/entity.hpp"
#include "storage/database.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ACE {
namespace Consolidation {

// EN: One completed merge. Never mutated after append.
// FR: Une fusion effectuée. Jamais modifiée après ajout.
struct AuditEntry {
    std::chrono::system_clock::time_point timestamp;
    EntityId source_id = 0;
    std::string source_name;
    EntityId target_id = 0;
    std::string target_name;
    std::int64_t mentions_transferred = 0;
    double confidence = 0.0;
    std::string method;
};

// EN: Parse the "YYYY-MM-DDTHH:MM:SS.mmmZ" form written by the logger. Throws std::invalid_argument.
// FR: Analyse la forme ISO8601 écrite par le logger. Lève std::invalid_argument.
std::chrono::system_clock::time_point parseISO8601(const std::string& text);

void to_json(nlohmann::json& j, const AuditEntry& entry);
void from_json(const nlohmann::json& j, AuditEntry& entry);

// EN: Serialize with invalid UTF-8 bytes replaced by U+FFFD. OCR names are not guaranteed valid.
// FR: Sérialise en remplaçant les octets UTF-8 invalides par U+FFFD.
std::string dumpJson(const nlohmann::json& json, int indent = -1);

// EN: Persistence target for the audit trail.
// FR: Destination de persistance de la piste d'audit.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    // EN: True if the sink rewrites the whole history on each persist (file), false if it
    //     only ever appends (table).
    // FR: Vrai si la destination réécrit tout l'historique (fichier), faux si elle ajoute seulement.
    virtual bool rewritesAll() const = 0;

    virtual bool persist(const std::vector<AuditEntry>& entries) = 0;
    virtual std::string name() const = 0;
};

// EN: Pretty-printed JSON array, written atomically (temp file then rename).
// FR: Tableau JSON indenté, écrit de façon atomique (fichier temporaire puis renommage).
class JsonFileAuditSink : public AuditSink {
public:
    explicit JsonFileAuditSink(std::string path);

    bool rewritesAll() const override { return true; }
    bool persist(const std::vector<AuditEntry>& entries) override;
    std::string name() const override { return "json:" + path_; }

private:
    std::string path_;
};

// EN: Append-only audit table in the archive database, created if missing.
// FR: Table d'audit en ajout seul dans la base de l'archive, créée si absente.
class SqliteAuditSink : public AuditSink {
public:
    SqliteAuditSink(Storage::Database& db, std::string table, std::string actor);

    bool rewritesAll() const override { return false; }
    bool persist(const std::vector<AuditEntry>& entries) override;
    std::string name() const override { return "table:" + table_; }

private:
    Storage::DbResult<void> ensureTable();

    Storage::Database& db_;
    std::string table_;
    std::string actor_;
};

// EN: Accumulates the audit entries of one run in memory and persists them through its sinks.
// FR: Accumule les entrées d'audit d'une exécution en mémoire et les persiste via ses destinations.
class AuditLogger {
public:
    AuditLogger() = default;

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    void addSink(std::unique_ptr<AuditSink> sink);
    size_t sinkCount() const { return sinks_.size(); }

    void append(AuditEntry entry);

    // EN: Seed with the entries of an interrupted run. `sink_offsets` maps an append-only sink
    //     name to the number of entries it already holds; unlisted sinks receive everything.
    // FR: Initialise avec les entrées d'une exécution interrompue. `sink_offsets` associe le nom
    //     d'une destination en ajout seul au nombre d'entrées qu'elle contient déjà.
    void restore(std::vector<AuditEntry> entries, const std::map<std::string, size_t>& sink_offsets = {});

    // EN: Entries persisted so far by each append-only sink, keyed by sink name.
    // FR: Entrées déjà persistées par chaque destination en ajout seul, par nom.
    std::map<std::string, size_t> appendOffsets() const;

    const std::vector<AuditEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    // EN: Persist to every sink. Returns false if any sink failed; the others still run.
    // FR: Persiste vers chaque destination. Retourne false si l'une a échoué.
    bool flush();

private:
    std::vector<AuditEntry> entries_;
    std::vector<std::unique_ptr<AuditSink>> sinks_;
    size_t offsetFor(const AuditSink& sink) const;

    std::map<const AuditSink*, size_t> persisted_;
    std::map<std::string, size_t> restored_offsets_;
};

} // namespace Consolidation
} // namespace ACE
