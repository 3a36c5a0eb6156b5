/**
 * @file sqlite_storage.hpp
 * @brief Durable HiveStorage on SQLite
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All hives share one database file; each SqliteStorage instance owns its
 * own connection and sees only the rows of its namespace (the hive id).
 */

#pragma once

#include "hivemind/storage.hpp"

#include <mutex>
#include <string>

namespace hivemind {

/**
 * @brief SqliteStorage - HiveStorage persisted in a shared SQLite file
 *
 * Schema: kv(ns, key, value) with primary key (ns, key). The database runs
 * in WAL mode with a busy timeout so several hive connections can write
 * the same file.
 */
class SqliteStorage : public HiveStorage {
public:
    /**
     * @brief Open (or create) the database and its schema
     * @param database_path Path to the SQLite file
     * @param ns Namespace for this instance, normally the hive id
     * @throws StorageError if the database cannot be opened or initialized
     */
    SqliteStorage(const std::string& database_path, const std::string& ns);

    ~SqliteStorage() override;

    // Disable copy and move
    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;
    SqliteStorage(SqliteStorage&&) = delete;
    SqliteStorage& operator=(SqliteStorage&&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    void put_batch(const std::vector<StorageEntry>& entries) override;
    bool remove(const std::string& key) override;
    size_t remove_batch(const std::vector<std::string>& keys) override;
    std::vector<StorageEntry> list(const ListOptions& options) override;

    /**
     * @brief Factory creating one SqliteStorage per hive on a shared file
     */
    static StorageFactory factory(const std::string& database_path);

private:
    void initialize_database();
    void exec(const char* sql);
    [[noreturn]] void fail(const std::string& context);

    std::string database_path_;
    std::string namespace_;
    void* db_connection_;           // sqlite3* (opaque to avoid header dependency)
    mutable std::mutex db_mutex_;
};

} // namespace hivemind
