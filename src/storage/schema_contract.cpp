#include "storage/schema_contract.hpp"
#include "infrastructure/logging/logger.hpp"

#include <regex>
#include <stdexcept>

namespace ACE {
namespace Storage {

std::string referenceKindToString(ReferenceKind kind) {
    switch (kind) {
        case ReferenceKind::SIMPLE:    return "simple";
        case ReferenceKind::UNIQUE:    return "unique";
        case ReferenceKind::COMPOSITE: return "composite";
        case ReferenceKind::PAIR:      return "pair";
    }
    return "simple";
}

bool isValidIdentifier(const std::string& identifier) {
    static const std::regex pattern(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    return std::regex_match(identifier, pattern);
}

TableReference TableReference::parse(ReferenceKind kind, const std::string& raw) {
    size_t dot = raw.find('.');
    if (dot == std::string::npos) {
        throw std::invalid_argument("reference '" + raw + "' must be table.column");
    }

    TableReference ref;
    ref.kind = kind;
    ref.table = raw.substr(0, dot);
    std::string rest = raw.substr(dot + 1);

    size_t plus = rest.find('+');
    if (plus != std::string::npos) {
        ref.column = rest.substr(0, plus);
        ref.secondary = rest.substr(plus + 1);
    } else {
        ref.column = rest;
    }

    bool needs_secondary = kind == ReferenceKind::COMPOSITE || kind == ReferenceKind::PAIR;
    if (needs_secondary && ref.secondary.empty()) {
        throw std::invalid_argument("reference '" + raw + "' must be table.column+secondary");
    }
    if (!needs_secondary && !ref.secondary.empty()) {
        throw std::invalid_argument("reference '" + raw + "' takes no secondary column");
    }

    for (const auto* identifier : {&ref.table, &ref.column}) {
        if (!isValidIdentifier(*identifier)) {
            throw std::invalid_argument("invalid identifier in reference '" + raw + "'");
        }
    }
    if (needs_secondary && !isValidIdentifier(ref.secondary)) {
        throw std::invalid_argument("invalid identifier in reference '" + raw + "'");
    }
    return ref;
}

std::string TableReference::describe() const {
    std::string text = table + "." + column;
    if (!secondary.empty()) {
        text += "+" + secondary;
    }
    return text + " (" + referenceKindToString(kind) + ")";
}

SchemaContract SchemaContract::archiveDefault() {
    SchemaContract contract;
    contract.references = {
        {ReferenceKind::SIMPLE, "media_items", "entity_id", ""},
        {ReferenceKind::SIMPLE, "timeline_events", "entity_id", ""},
        {ReferenceKind::UNIQUE, "organizations", "entity_id", ""},
        {ReferenceKind::COMPOSITE, "entity_mentions", "entity_id", "document_id"},
        {ReferenceKind::COMPOSITE, "entity_evidence_types", "entity_id", "evidence_type_id"},
        {ReferenceKind::PAIR, "entity_relationships", "source_entity_id", "target_entity_id"},
    };

    PersonSubtype person;
    person.dependents = {
        {ReferenceKind::COMPOSITE, "entity_documents", "entity_id", "document_id"},
        {ReferenceKind::SIMPLE, "black_book_entries", "person_id", ""},
    };
    contract.person = person;
    return contract;
}

void SchemaContract::validateIdentifiers() const {
    auto check = [](const std::string& identifier, const char* what) {
        if (!isValidIdentifier(identifier)) {
            throw std::invalid_argument(std::string("invalid ") + what + " identifier '" + identifier + "'");
        }
    };
    auto check_optional = [&check](const std::string& identifier, const char* what) {
        if (!identifier.empty()) {
            check(identifier, what);
        }
    };

    check(entity_table, "entity table");
    check(id_column, "id column");
    check(name_column, "name column");
    check(mentions_column, "mentions column");
    check_optional(type_column, "type column");
    check_optional(aliases_column, "aliases column");
    check_optional(mention_table, "mention table");
    check_optional(mention_entity_column, "mention entity column");

    std::vector<TableReference> all = references;
    if (person) {
        check(person->table, "person table");
        check(person->id_column, "person id column");
        check(person->entity_column, "person entity column");
        all.insert(all.end(), person->dependents.begin(), person->dependents.end());
    }
    for (const auto& ref : all) {
        check(ref.table, "table");
        check(ref.column, "column");
        check_optional(ref.secondary, "secondary column");
    }
}

namespace {

// EN: True when every listed column exists on `table` (and the table exists).
// FR: Vrai si toutes les colonnes listées existent dans `table`.
DbResult<bool> hasColumns(Database& db, const std::string& table,
                          const std::vector<std::string>& columns) {
    auto exists = db.tableExists(table);
    if (!exists) return exists.error();
    if (!exists.value()) return false;
    for (const auto& column : columns) {
        if (column.empty()) continue;
        auto has = db.columnExists(table, column);
        if (!has) return has.error();
        if (!has.value()) return false;
    }
    return true;
}

DbResult<std::vector<TableReference>> keepPresent(Database& db, const std::vector<TableReference>& refs) {
    std::vector<TableReference> kept;
    for (const auto& ref : refs) {
        auto present = hasColumns(db, ref.table, {ref.column, ref.secondary});
        if (!present) return present.error();
        if (present.value()) {
            kept.push_back(ref);
        } else {
            LOG_WARN("schema", "Skipping reference absent from database: " + ref.describe());
        }
    }
    return kept;
}

} // namespace

DbResult<SchemaContract> SchemaContract::resolveAgainst(Database& db) const {
    SchemaContract resolved = *this;

    auto entity_ok = hasColumns(db, entity_table, {id_column, name_column, mentions_column});
    if (!entity_ok) return entity_ok.error();
    if (!entity_ok.value()) {
        return StorageError::notFound("entity table '" + entity_table + "' with columns " +
                                      id_column + ", " + name_column + ", " + mentions_column +
                                      " not found");
    }

    if (!type_column.empty()) {
        auto has = db.columnExists(entity_table, type_column);
        if (!has) return has.error();
        if (!has.value()) {
            LOG_WARN("schema", "Entity type column '" + type_column + "' absent; all entities share one type");
            resolved.type_column.clear();
        }
    }

    if (!aliases_column.empty()) {
        auto has = db.columnExists(entity_table, aliases_column);
        if (!has) return has.error();
        if (!has.value()) {
            LOG_DEBUG("schema", "Aliases column '" + aliases_column + "' absent; alias union disabled");
            resolved.aliases_column.clear();
        }
    }

    if (!mention_table.empty()) {
        auto has = hasColumns(db, mention_table, {mention_entity_column});
        if (!has) return has.error();
        if (!has.value()) {
            resolved.mention_table.clear();
        }
    }

    auto refs = keepPresent(db, references);
    if (!refs) return refs.error();
    resolved.references = std::move(refs).value();

    if (person) {
        auto has = hasColumns(db, person->table, {person->id_column, person->entity_column});
        if (!has) return has.error();
        if (!has.value()) {
            LOG_WARN("schema", "Person table '" + person->table + "' absent; person merge disabled");
            resolved.person.reset();
        } else {
            auto dependents = keepPresent(db, person->dependents);
            if (!dependents) return dependents.error();
            resolved.person->dependents = std::move(dependents).value();
        }
    }

    return resolved;
}

} // namespace Storage
} // namespace ACE
