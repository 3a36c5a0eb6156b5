/**
 * @file hive_types.hpp
 * @brief Hive records and their JSON representation
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Records held by a hive:
 * - Challenge (pending join)
 * - Session (bearer token binding)
 * - HiveMessage (entry in the hive's message log)
 *
 * The JSON form is used both for storage values and on the wire.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace hivemind {

/**
 * @brief Where a stored message was first accepted
 */
enum class MessageSource {
    LOCAL,   ///< Posted by an agent on this server
    GOSSIP   ///< Relayed from a peer
};

/**
 * @brief Pending join, single-use
 */
struct Challenge {
    std::string agent_id;
    std::string pubkey;         ///< Base58 Ed25519 public key
    std::string nonce;
    std::string hive_id;
    std::string expires_at;     ///< ISO timestamp, signed verbatim by the agent

    nlohmann::json to_json() const;
    static std::optional<Challenge> from_json(const nlohmann::json& j);
};

/**
 * @brief Authenticated agent session
 */
struct Session {
    std::string agent_id;
    std::string pubkey;
    std::string hive_id;
    int64_t expires_at_ms = 0;  ///< Epoch milliseconds

    nlohmann::json to_json() const;
    static std::optional<Session> from_json(const nlohmann::json& j);
};

/**
 * @brief Immutable entry in a hive's message log
 */
struct HiveMessage {
    int64_t id = 0;             ///< Per-hive monotonic id, assigned on insert
    std::string uid;            ///< Globally unique id, dedup key
    std::string ts;             ///< ISO timestamp
    int64_t created_at_ms = 0;  ///< Epoch milliseconds
    std::string agent_id;
    std::string hive_id;
    std::string content;
    std::string channel = "default";
    MessageSource source = MessageSource::LOCAL;

    /**
     * @brief Serialize with the wire field names
     *        (id, uid, ts, createdAtMs, agentId, hiveId, content, channel, source)
     */
    nlohmann::json to_json() const;

    /**
     * @brief Parse a stored record
     * @return Message, or std::nullopt if a field is missing or mistyped
     */
    static std::optional<HiveMessage> from_json(const nlohmann::json& j);
};

std::string message_source_to_string(MessageSource source);

std::optional<MessageSource> string_to_message_source(const std::string& str);

} // namespace hivemind
