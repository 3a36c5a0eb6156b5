/**
 * @file protocol.hpp
 * @brief Join message canonicalization and session token format
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <optional>
#include <string>

namespace hivemind {
namespace protocol {

/// Version tag, first line of every signed join message
constexpr const char* PROTOCOL_VERSION = "OPENCLAW_HIVEMIND_V1";

/**
 * @brief Fields covered by the agent's join signature
 */
struct JoinMessageFields {
    std::string agent_id;
    std::string pubkey;               ///< Base58 Ed25519 public key
    std::string nonce;
    std::string hive_id;
    std::string challenge_expires_at; ///< ISO timestamp exactly as issued
    std::string timestamp;            ///< Caller-supplied ISO timestamp
};

/**
 * @brief Build the canonical join message
 *
 * Newline-joined, order fixed: version, agent id, pubkey, nonce, hive id,
 * challenge expiry, timestamp. No trailing newline.
 */
std::string build_join_message(const JoinMessageFields& fields);

/**
 * @brief Mint a session token of the form "<hive_id>.<token_id>"
 */
std::string make_session_token(const std::string& hive_id, const std::string& token_id);

/**
 * @brief Recover the owning hive from a session token
 * @return Text before the last '.', or std::nullopt if the token has no hive prefix
 */
std::optional<std::string> hive_from_token(const std::string& token);

/**
 * @brief Extract the token from an "Authorization: Bearer <token>" value
 * @return Trimmed token, or std::nullopt for a missing or non-Bearer header
 */
std::optional<std::string> parse_bearer_token(const std::string& header_value);

} // namespace protocol
} // namespace hivemind
