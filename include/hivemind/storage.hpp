/**
 * @file storage.hpp
 * @brief Key-value storage abstraction backing a single hive
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Components (challenges, sessions, message log, peer cursors) only see
 * this interface. Keys are ordered bytewise; values are JSON text.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hivemind {

/// Key and value
using StorageEntry = std::pair<std::string, std::string>;

/**
 * @brief Range scan parameters
 */
struct ListOptions {
    std::string prefix;         ///< Only keys starting with this prefix
    std::string start_after;    ///< Exclusive bound in scan direction (empty = none)
    size_t limit = 0;           ///< Maximum entries (0 = unlimited)
    bool reverse = false;       ///< Descending key order
};

/**
 * @brief HiveStorage - Ordered key-value store for one hive
 *
 * Implementations must be safe to call from multiple threads, although
 * the owning HiveActor serializes all access in practice. Backend failures
 * throw StorageError.
 */
class HiveStorage {
public:
    virtual ~HiveStorage() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void put(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Write several entries atomically (all or none)
     */
    virtual void put_batch(const std::vector<StorageEntry>& entries) = 0;

    /**
     * @return true if the key existed
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @return Number of keys that existed
     */
    virtual size_t remove_batch(const std::vector<std::string>& keys) = 0;

    /**
     * @brief Ordered range scan
     */
    virtual std::vector<StorageEntry> list(const ListOptions& options) = 0;
};

/// Creates the storage for a hive id on first use
using StorageFactory = std::function<std::unique_ptr<HiveStorage>(const std::string& hive_id)>;

} // namespace hivemind
