/**
 * @file memory_storage.hpp
 * @brief In-process HiveStorage for single-instance deployments and tests
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "hivemind/storage.hpp"

#include <map>
#include <mutex>

namespace hivemind {

/**
 * @brief MemoryStorage - std::map backed HiveStorage
 *
 * Contents are lost when the process exits.
 */
class MemoryStorage : public HiveStorage {
public:
    MemoryStorage() = default;
    ~MemoryStorage() override = default;

    // Disable copy and move
    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;
    MemoryStorage(MemoryStorage&&) = delete;
    MemoryStorage& operator=(MemoryStorage&&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    void put_batch(const std::vector<StorageEntry>& entries) override;
    bool remove(const std::string& key) override;
    size_t remove_batch(const std::vector<std::string>& keys) override;
    std::vector<StorageEntry> list(const ListOptions& options) override;

    /**
     * @brief Number of stored keys
     */
    size_t size() const;

    /**
     * @brief Factory creating an independent MemoryStorage per hive
     */
    static StorageFactory factory();

private:
    std::map<std::string, std::string> entries_;
    mutable std::mutex mutex_;
};

} // namespace hivemind
