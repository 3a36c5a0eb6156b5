/**
 * @file sqlite_storage.cpp
 * @brief Implementation of SQLite-backed hive storage
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/sqlite_storage.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/utilities.hpp"

#include <sqlite3.h>
#include <filesystem>

namespace hivemind {

using namespace hivemind::utilities;

namespace {

// Finalizes a prepared statement on scope exit
struct StatementGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StatementGuard() {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    int size = sqlite3_column_bytes(stmt, column);
    if (!text) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

SqliteStorage::SqliteStorage(const std::string& database_path, const std::string& ns)
    : database_path_(database_path)
    , namespace_(ns)
    , db_connection_(nullptr)
{
    std::filesystem::path path(database_path_);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    // Open SQLite database
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw StorageError("failed to open hive database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);
    sqlite3_busy_timeout(db, 5000);

    // Initialize database schema
    try {
        initialize_database();
    } catch (const StorageError&) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw;
    }

    log_debug("SqliteStorage: Opened namespace '" + namespace_ + "' in " + database_path_);
}

SqliteStorage::~SqliteStorage() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteStorage::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");

    exec(R"(
        CREATE TABLE IF NOT EXISTS kv (
            ns TEXT NOT NULL,
            key TEXT NOT NULL,
            value TEXT NOT NULL,
            PRIMARY KEY (ns, key)
        ) WITHOUT ROWID;
    )");
}

void SqliteStorage::exec(const char* sql) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errmsg(db);
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        throw StorageError("sqlite: " + message);
    }
}

void SqliteStorage::fail(const std::string& context) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    std::string message = context + ": " + sqlite3_errmsg(db);
    log_error("SqliteStorage: " + message);
    throw StorageError("sqlite " + message);
}

// ============================================================================
// Key-Value Operations
// ============================================================================

std::optional<std::string> SqliteStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT value FROM kv WHERE ns = ? AND key = ?";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        fail("prepare get");
    }

    bind_text(guard.stmt, 1, namespace_);
    bind_text(guard.stmt, 2, key);

    int rc = sqlite3_step(guard.stmt);
    if (rc == SQLITE_ROW) {
        return column_text(guard.stmt, 0);
    }
    if (rc != SQLITE_DONE) {
        fail("get");
    }
    return std::nullopt;
}

void SqliteStorage::put(const std::string& key, const std::string& value) {
    put_batch({{key, value}});
}

void SqliteStorage::put_batch(const std::vector<StorageEntry>& entries) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (entries.empty()) {
        return;
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    exec("BEGIN IMMEDIATE");

    try {
        const char* sql = "INSERT OR REPLACE INTO kv (ns, key, value) VALUES (?, ?, ?)";

        StatementGuard guard;
        if (sqlite3_prepare_v2(db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
            fail("prepare put");
        }

        for (const auto& entry : entries) {
            bind_text(guard.stmt, 1, namespace_);
            bind_text(guard.stmt, 2, entry.first);
            bind_text(guard.stmt, 3, entry.second);

            if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
                fail("put");
            }

            sqlite3_reset(guard.stmt);
            sqlite3_clear_bindings(guard.stmt);
        }

        exec("COMMIT");

    } catch (const StorageError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

bool SqliteStorage::remove(const std::string& key) {
    return remove_batch({key}) > 0;
}

size_t SqliteStorage::remove_batch(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (keys.empty()) {
        return 0;
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    size_t removed = 0;

    exec("BEGIN IMMEDIATE");

    try {
        const char* sql = "DELETE FROM kv WHERE ns = ? AND key = ?";

        StatementGuard guard;
        if (sqlite3_prepare_v2(db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
            fail("prepare remove");
        }

        for (const auto& key : keys) {
            bind_text(guard.stmt, 1, namespace_);
            bind_text(guard.stmt, 2, key);

            if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
                fail("remove");
            }
            removed += static_cast<size_t>(sqlite3_changes(db));

            sqlite3_reset(guard.stmt);
            sqlite3_clear_bindings(guard.stmt);
        }

        exec("COMMIT");

    } catch (const StorageError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }

    return removed;
}

std::vector<StorageEntry> SqliteStorage::list(const ListOptions& options) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    // Prefix match uses substr so that no upper bound key has to be synthesized
    std::string sql = "SELECT key, value FROM kv WHERE ns = ?1";
    if (!options.prefix.empty()) {
        sql += " AND key >= ?2 AND substr(key, 1, length(?2)) = ?2";
    }
    if (!options.start_after.empty()) {
        sql += options.reverse ? " AND key < ?3" : " AND key > ?3";
    }
    sql += options.reverse ? " ORDER BY key DESC" : " ORDER BY key ASC";
    sql += " LIMIT ?4";

    StatementGuard guard;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        fail("prepare list");
    }

    bind_text(guard.stmt, 1, namespace_);
    if (!options.prefix.empty()) {
        bind_text(guard.stmt, 2, options.prefix);
    }
    if (!options.start_after.empty()) {
        bind_text(guard.stmt, 3, options.start_after);
    }
    sqlite3_bind_int64(guard.stmt, 4,
        options.limit == 0 ? -1 : static_cast<sqlite3_int64>(options.limit));

    std::vector<StorageEntry> result;

    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        result.emplace_back(column_text(guard.stmt, 0), column_text(guard.stmt, 1));
    }
    if (rc != SQLITE_DONE) {
        fail("list");
    }

    return result;
}

// ============================================================================
// Factory
// ============================================================================

StorageFactory SqliteStorage::factory(const std::string& database_path) {
    return [database_path](const std::string& hive_id) -> std::unique_ptr<HiveStorage> {
        return std::make_unique<SqliteStorage>(database_path, hive_id);
    };
}

} // namespace hivemind
