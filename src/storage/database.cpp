// EN: SQLite connection, statement and transaction wrappers.
// FR: Wrappers SQLite pour connexion, requête et transaction.

#include "storage/database.hpp"
#include "infrastructure/logging/logger.hpp"

#include <sqlite3.h>

#include <filesystem>

namespace ACE {
namespace Storage {

std::string mergeErrorToString(MergeError kind) {
    switch (kind) {
        case MergeError::CONSTRAINT_VIOLATION: return "constraint_violation";
        case MergeError::NOT_FOUND:            return "not_found";
        case MergeError::OTHER:                return "other";
    }
    return "other";
}

MergeError classifySqliteError(int extended_code) {
    switch (extended_code) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return MergeError::CONSTRAINT_VIOLATION;
        default:
            return MergeError::OTHER;
    }
}

// Statement implementation
Statement::Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

StorageError Statement::lastError(const std::string& context) const {
    int code = db_ ? sqlite3_extended_errcode(db_) : SQLITE_MISUSE;
    std::string message = db_ ? sqlite3_errmsg(db_) : "statement not prepared";
    return StorageError{classifySqliteError(code), code, context + ": " + message};
}

DbResult<void> Statement::bind(int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        return lastError("bind");
    }
    return {};
}

DbResult<void> Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        return lastError("bind");
    }
    return {};
}

DbResult<void> Statement::bind(int index, std::string_view value) {
    if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        return lastError("bind");
    }
    return {};
}

DbResult<void> Statement::bind(int index, std::nullptr_t) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        return lastError("bind");
    }
    return {};
}

DbResult<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return lastError("step");
}

DbResult<int> Statement::execute() {
    while (true) {
        auto stepped = step();
        if (!stepped) {
            return stepped.error();
        }
        if (!stepped.value()) {
            break;
        }
    }
    return sqlite3_changes(db_);
}

DbResult<void> Statement::reset() {
    sqlite3_reset(stmt_);
    if (sqlite3_clear_bindings(stmt_) != SQLITE_OK) {
        return lastError("reset");
    }
    return {};
}

std::int64_t Statement::getInt64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

// Database implementation
Database::~Database() {
    close();
}

StorageError Database::lastError(const std::string& context) const {
    if (!db_) {
        return StorageError::other(context + ": database not open", SQLITE_MISUSE);
    }
    int code = sqlite3_extended_errcode(db_);
    return StorageError{classifySqliteError(code), code, context + ": " + sqlite3_errmsg(db_)};
}

DbResult<void> Database::open(const std::string& path, const Options& options) {
    close();

    int flags = options.mode == OpenMode::READ_ONLY ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        StorageError error = StorageError::other(
            "cannot open database '" + path + "': " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)),
            rc);
        close();
        return error;
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, options.busy_timeout_ms);
    path_ = path;
    read_only_ = options.mode == OpenMode::READ_ONLY;

    // EN: Reading the schema confirms the file is a real SQLite database.
    // FR: Lire le schéma confirme que le fichier est une vraie base SQLite.
    auto schema = execute("SELECT count(*) FROM sqlite_master");
    if (!schema) {
        StorageError error = schema.error();
        close();
        return error;
    }

    auto fk = execute(options.foreign_keys ? "PRAGMA foreign_keys = ON" : "PRAGMA foreign_keys = OFF");
    if (!fk) {
        StorageError error = fk.error();
        close();
        return error;
    }

    LOG_DEBUG("storage", "Opened database " + path + (read_only_ ? " (read-only)" : ""));
    return {};
}

DbResult<void> Database::create(const std::string& path) {
    close();
    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        StorageError error = StorageError::other("cannot create database '" + path + "'", rc);
        close();
        return error;
    }
    sqlite3_extended_result_codes(db_, 1);
    path_ = path;
    read_only_ = false;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    read_only_ = false;
}

DbResult<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return lastError("execute");
    }
    char* error_message = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_message);
    if (rc != SQLITE_OK) {
        int code = sqlite3_extended_errcode(db_);
        std::string message = error_message ? error_message : sqlite3_errmsg(db_);
        sqlite3_free(error_message);
        return StorageError{classifySqliteError(code), code, "execute: " + message};
    }
    return {};
}

DbResult<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return lastError("prepare");
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return lastError("prepare '" + sql + "'");
    }
    return Statement(db_, stmt);
}

std::int64_t Database::lastInsertRowId() const {
    return db_ ? static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_)) : 0;
}

DbResult<bool> Database::tableExists(const std::string& table) {
    auto stmtR = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();
    auto br = stmt.bind(1, std::string_view(table));
    if (!br) return br.error();
    return stmt.step();
}

DbResult<bool> Database::columnExists(const std::string& table, const std::string& column) {
    auto stmtR = prepare("SELECT 1 FROM pragma_table_info(?) WHERE name = ?");
    if (!stmtR) return stmtR.error();
    auto stmt = std::move(stmtR).value();
    auto br = stmt.bind(1, std::string_view(table));
    if (!br) return br.error();
    br = stmt.bind(2, std::string_view(column));
    if (!br) return br.error();
    return stmt.step();
}

DbResult<void> Database::backupTo(const std::string& destination) {
    if (!db_) {
        return lastError("backup");
    }

    std::error_code ec;
    auto parent = std::filesystem::path(destination).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return StorageError::other("cannot create backup directory '" + parent.string() +
                                       "': " + ec.message());
        }
    }

    sqlite3* target = nullptr;
    int rc = sqlite3_open_v2(destination.c_str(), &target,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close_v2(target);
        return StorageError::other("cannot open backup file '" + destination + "'", rc);
    }

    sqlite3_backup* backup = sqlite3_backup_init(target, "main", db_, "main");
    if (!backup) {
        StorageError error = StorageError::other(
            std::string("backup init failed: ") + sqlite3_errmsg(target), sqlite3_extended_errcode(target));
        sqlite3_close_v2(target);
        return error;
    }

    rc = sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);
    int final_code = sqlite3_extended_errcode(target);
    sqlite3_close_v2(target);

    if (rc != SQLITE_DONE) {
        return StorageError::other("backup to '" + destination + "' failed: " + sqlite3_errstr(rc),
                                   final_code);
    }

    LOG_INFO("storage", "Database backup written to " + destination);
    return {};
}

// Transaction implementation
Transaction::Transaction(Database& db) : db_(db), begin_result_(db.execute("BEGIN IMMEDIATE")) {
    active_ = begin_result_.hasValue();
}

Transaction::~Transaction() {
    if (active_) {
        auto rolled_back = rollback();
        if (!rolled_back) {
            LOG_ERROR("storage", "Rollback failed: " + rolled_back.error().message);
        }
    }
}

DbResult<void> Transaction::commit() {
    if (!active_) {
        return StorageError::other("commit without an active transaction");
    }
    auto result = db_.execute("COMMIT");
    if (result) {
        active_ = false;
    }
    return result;
}

DbResult<void> Transaction::rollback() {
    if (!active_) {
        return {};
    }
    active_ = false;
    // EN: SQLite may already have rolled back on its own (e.g. SQLITE_FULL).
    // FR: SQLite peut déjà avoir annulé la transaction de lui-même.
    if (db_.handle() == nullptr || sqlite3_get_autocommit(db_.handle()) != 0) {
        return {};
    }
    return db_.execute("ROLLBACK");
}

} // namespace Storage
} // namespace ACE
