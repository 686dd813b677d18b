#include "storage/entity_repository.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace ACE {

std::string entityTypeToString(EntityType type) {
    switch (type) {
        case EntityType::PERSON:       return "Person";
        case EntityType::ORGANIZATION: return "Organization";
        case EntityType::UNKNOWN:      return "Unknown";
    }
    return "Unknown";
}

std::optional<EntityType> parseEntityType(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "person") return EntityType::PERSON;
    if (lowered == "organization" || lowered == "organisation") return EntityType::ORGANIZATION;
    if (lowered == "unknown") return EntityType::UNKNOWN;
    return std::nullopt;
}

namespace Storage {

std::vector<std::string> parseAliases(const std::string& stored) {
    std::vector<std::string> aliases;
    if (stored.empty()) {
        return aliases;
    }

    nlohmann::json parsed = nlohmann::json::parse(stored, nullptr, false);
    if (parsed.is_array()) {
        for (const auto& item : parsed) {
            if (item.is_string()) {
                aliases.push_back(item.get<std::string>());
            }
        }
    } else {
        aliases.push_back(stored);
    }
    return aliases;
}

std::string serializeAliases(const std::vector<std::string>& aliases) {
    return nlohmann::json(aliases).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

EntityRepository::EntityRepository(Database& db, const SchemaContract& schema)
    : db_(db), schema_(schema) {}

std::string EntityRepository::selectColumns() const {
    std::string columns = schema_.id_column + ", " + schema_.name_column + ", " + schema_.mentions_column;
    columns += schema_.type_column.empty() ? ", NULL" : ", " + schema_.type_column;
    columns += schema_.aliases_column.empty() ? ", NULL" : ", " + schema_.aliases_column;
    return columns;
}

std::string EntityRepository::typeFilter(EntityType type) const {
    if (schema_.type_column.empty()) {
        return "1 = 1";
    }
    switch (type) {
        case EntityType::PERSON:
            return schema_.type_column + " = 'Person'";
        case EntityType::ORGANIZATION:
            return schema_.type_column + " = 'Organization'";
        case EntityType::UNKNOWN:
            return "(" + schema_.type_column + " IS NULL OR " + schema_.type_column +
                   " NOT IN ('Person', 'Organization'))";
    }
    return "1 = 1";
}

Entity EntityRepository::readRow(const Statement& stmt) const {
    Entity entity;
    entity.id = stmt.getInt64(0);
    entity.full_name = stmt.getText(1);
    entity.mentions = stmt.isNull(2) ? 0 : stmt.getInt64(2);
    if (!stmt.isNull(3)) {
        entity.entity_type = parseEntityType(stmt.getText(3)).value_or(EntityType::UNKNOWN);
    }
    if (!stmt.isNull(4)) {
        entity.aliases = parseAliases(stmt.getText(4));
    }
    return entity;
}

DbResult<std::vector<Entity>> EntityRepository::loadEntities(EntityType type) {
    auto stmtR = db_.prepare("SELECT " + selectColumns() + " FROM " + schema_.entity_table +
                             " WHERE " + typeFilter(type) + " AND " + schema_.name_column +
                             " IS NOT NULL ORDER BY " + schema_.id_column);
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();

    std::vector<Entity> entities;
    while (true) {
        auto step = stmt.step();
        if (!step) return step.error();
        if (!step.value()) break;
        Entity entity = readRow(stmt);
        if (schema_.type_column.empty()) {
            entity.entity_type = type;
        }
        entities.push_back(std::move(entity));
    }

    LOG_DEBUG("repository", "Loaded " + std::to_string(entities.size()) + " " +
              entityTypeToString(type) + " entities");
    return entities;
}

DbResult<std::optional<Entity>> EntityRepository::findById(EntityId id) {
    auto stmtR = db_.prepare("SELECT " + selectColumns() + " FROM " + schema_.entity_table +
                             " WHERE " + schema_.id_column + " = ?");
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();

    auto br = stmt.bind(1, id);
    if (!br) return br.error();

    auto step = stmt.step();
    if (!step) return step.error();
    if (!step.value()) {
        return std::optional<Entity>();
    }
    return std::optional<Entity>(readRow(stmt));
}

DbResult<std::int64_t> EntityRepository::countEntities(EntityType type) {
    auto stmtR = db_.prepare("SELECT COUNT(*) FROM " + schema_.entity_table + " WHERE " + typeFilter(type));
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();

    auto step = stmt.step();
    if (!step) return step.error();
    return stmt.getInt64(0);
}

DbResult<int> EntityRepository::recountMentions(EntityType type) {
    if (schema_.mention_table.empty()) {
        return StorageError::notFound("mention table not available for recount");
    }

    std::string sql = "UPDATE " + schema_.entity_table + " SET " + schema_.mentions_column +
                      " = (SELECT COUNT(*) FROM " + schema_.mention_table + " m WHERE m." +
                      schema_.mention_entity_column + " = " + schema_.entity_table + "." +
                      schema_.id_column + ") WHERE " + typeFilter(type);

    return db_.transaction([&]() -> DbResult<int> {
        auto stmtR = db_.prepare(sql);
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();
        return stmt.execute();
    });
}

} // namespace Storage
} // namespace ACE
