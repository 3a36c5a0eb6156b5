/**
 * @file message_store.hpp
 * @brief Append-only, uid-deduplicated message log of one hive
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Storage layout:
 * - msg:<12-digit id>                      message record
 * - uid:<uid>                              id (dedup index)
 * - ts:<15-digit createdAtMs>:<12-digit id> id (time index)
 * - meta:nextMessageId                     next id to assign
 */

#pragma once

#include "hivemind/hive_types.hpp"
#include "hivemind/storage.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hivemind {

/**
 * @brief MessageStore - Message log scoped to a single hive
 *
 * Id allocation and the uid check are performed under one lock and the
 * record, both indexes and the id counter are written in one atomic batch.
 */
class MessageStore {
public:
    /**
     * @param storage Hive storage (must outlive the store)
     * @param hive_id Hive this log belongs to
     */
    MessageStore(HiveStorage& storage, std::string hive_id);

    // Disable copy and move
    MessageStore(const MessageStore&) = delete;
    MessageStore& operator=(const MessageStore&) = delete;
    MessageStore(MessageStore&&) = delete;
    MessageStore& operator=(MessageStore&&) = delete;

    /**
     * @brief Insert a message unless its uid is already present
     * @param candidate Message; its id is ignored and assigned here
     * @return Stored message with its id, or std::nullopt if the uid exists
     * @throws ValidationError if uid is empty or the hive differs
     */
    std::optional<HiveMessage> append(const HiveMessage& candidate);

    /**
     * @brief Newest messages with id > since_id, returned oldest first
     *
     * When more than limit messages follow since_id, the most recent ones
     * are returned.
     *
     * @param hive_id Hive being read; any other hive yields nothing
     * @param since_id Exclusive lower id bound
     * @param limit Requested count, clamped to [1, MAX_MESSAGES_LIMIT]
     */
    std::vector<HiveMessage> read_since(const std::string& hive_id, int64_t since_id, size_t limit);

    /**
     * @brief Messages with createdAtMs >= since_ms, ordered by createdAtMs then id
     * @param hive_id Hive being read; any other hive yields nothing
     * @param since_ms Inclusive lower time bound
     * @param limit Requested count, clamped to [1, MAX_GOSSIP_BATCH]
     */
    std::vector<HiveMessage> read_since_time(const std::string& hive_id, int64_t since_ms, size_t limit);

    bool contains(const std::string& uid);

    std::optional<HiveMessage> get(int64_t id);

    /**
     * @brief Number of stored messages
     */
    size_t count();

    const std::string& hive_id() const { return hive_id_; }

private:
    static std::string message_key(int64_t id);
    static std::string time_key(int64_t created_at_ms, int64_t id);
    std::optional<HiveMessage> load(const std::string& key);

    HiveStorage& storage_;
    std::string hive_id_;
    std::mutex append_mutex_;
};

} // namespace hivemind
