#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace ACE {
namespace Storage {

// EN: Merge-level error kinds, decoupled from SQLite result codes.
// FR: Catégories d'erreur de fusion, découplées des codes SQLite.
enum class MergeError {
    CONSTRAINT_VIOLATION,
    NOT_FOUND,
    OTHER
};

std::string mergeErrorToString(MergeError kind);

// EN: Error reported by the storage layer: kind, SQLite extended code and message.
// FR: Erreur remontée par la couche stockage : catégorie, code étendu SQLite et message.
struct StorageError {
    MergeError kind = MergeError::OTHER;
    int code = 0;
    std::string message;

    static StorageError notFound(const std::string& message) {
        return StorageError{MergeError::NOT_FOUND, 0, message};
    }
    static StorageError other(const std::string& message, int code = 0) {
        return StorageError{MergeError::OTHER, code, message};
    }
};

template<typename T>
using DbResult = Result<T, StorageError>;

// EN: Map a SQLite extended result code onto a merge error kind. Only UNIQUE and
//     PRIMARY KEY violations count as constraint violations.
// FR: Associe un code SQLite étendu à une catégorie d'erreur. Seules les violations
//     UNIQUE et PRIMARY KEY comptent comme violations de contrainte.
MergeError classifySqliteError(int extended_code);

// EN: Prepared statement owning its sqlite3_stmt handle. Bind indices are 1-based,
//     column indices 0-based.
// FR: Requête préparée propriétaire de son handle sqlite3_stmt.
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    DbResult<void> bind(int index, std::int64_t value);
    DbResult<void> bind(int index, double value);
    DbResult<void> bind(int index, std::string_view value);
    DbResult<void> bind(int index, std::nullptr_t);

    // EN: Advance one row; true while a row is available.
    // FR: Avance d'une ligne ; true tant qu'une ligne est disponible.
    DbResult<bool> step();

    // EN: Run to completion and return the number of rows changed.
    // FR: Exécute jusqu'au bout et retourne le nombre de lignes modifiées.
    DbResult<int> execute();

    DbResult<void> reset();

    std::int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getText(int column) const;
    bool isNull(int column) const;
    int columnCount() const;

private:
    StorageError lastError(const std::string& context) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// EN: SQLite connection wrapper (RAII).
// FR: Wrapper de connexion SQLite (RAII).
class Database {
public:
    enum class OpenMode {
        READ_WRITE,
        READ_ONLY
    };

    struct Options {
        OpenMode mode = OpenMode::READ_WRITE;
        bool foreign_keys = true;
        int busy_timeout_ms = 5000;
    };

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // EN: Open an existing database file. The file is never created.
    // FR: Ouvre un fichier de base existant. Le fichier n'est jamais créé.
    DbResult<void> open(const std::string& path, const Options& options);

    // EN: Open (creating if needed) a database, used by tests and the backup path.
    // FR: Ouvre (en créant si besoin) une base, utilisé par les tests et les sauvegardes.
    DbResult<void> create(const std::string& path);

    void close();
    bool isOpen() const { return db_ != nullptr; }
    bool isReadOnly() const { return read_only_; }
    const std::string& path() const { return path_; }

    DbResult<void> execute(const std::string& sql);
    DbResult<Statement> prepare(const std::string& sql);

    std::int64_t lastInsertRowId() const;

    DbResult<bool> tableExists(const std::string& table);
    DbResult<bool> columnExists(const std::string& table, const std::string& column);

    // EN: Copy the whole database into a new file via the online backup API.
    // FR: Copie toute la base dans un nouveau fichier via l'API de sauvegarde en ligne.
    DbResult<void> backupTo(const std::string& destination);

    // EN: Run a callable inside BEGIN IMMEDIATE / COMMIT, rolling back on error.
    // FR: Exécute un callable dans BEGIN IMMEDIATE / COMMIT, avec rollback en cas d'erreur.
    template<typename Fn>
    auto transaction(Fn&& fn) -> decltype(fn());

    sqlite3* handle() const { return db_; }

private:
    StorageError lastError(const std::string& context) const;

    sqlite3* db_ = nullptr;
    std::string path_;
    bool read_only_ = false;
};

// EN: RAII transaction guard: rolls back on destruction unless committed.
// FR: Garde de transaction RAII : rollback à la destruction sauf si validée.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // EN: Whether BEGIN succeeded; check before doing any work.
    // FR: Indique si BEGIN a réussi.
    const DbResult<void>& begun() const { return begin_result_; }

    DbResult<void> commit();
    DbResult<void> rollback();

private:
    Database& db_;
    DbResult<void> begin_result_;
    bool active_ = false;
};

template<typename Fn>
auto Database::transaction(Fn&& fn) -> decltype(fn()) {
    Transaction tx(*this);
    if (!tx.begun()) {
        return tx.begun().error();
    }
    auto result = fn();
    if (!result) {
        return result;
    }
    auto committed = tx.commit();
    if (!committed) {
        return committed.error();
    }
    return result;
}

} // namespace Storage
} // namespace ACE
