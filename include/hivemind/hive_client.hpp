/**
 * @file hive_client.hpp
 * @brief Agent-side client for a Hivemind server
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Typical flow:
 * 1. request_challenge() with the agent's base58 public key
 * 2. join() signs the challenge and stores the session token
 * 3. post_message() / read_messages() with the bearer token
 */

#pragma once

#include "hivemind/agent_keys.hpp"
#include "hivemind/hive_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hivemind {

/**
 * @brief Failed request; status() is 0 for transport failures
 */
class HiveClientError : public std::runtime_error {
public:
    HiveClientError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

struct ChallengeResponse {
    std::string protocol_version;
    std::string nonce;
    std::string hive_id;
    std::string expires_at;
};

struct JoinResponse {
    std::string session_token;
    std::string expires_at;
    std::string agent_id;
    std::string hive_id;
};

/**
 * @brief Device attestation forwarded with a join
 */
struct DeviceProof {
    std::string public_key;     ///< Base64 Ed25519 public key
    std::string signature;      ///< Base64 signature over nonce
    std::string nonce;
    std::string signed_at;      ///< ISO timestamp
};

/**
 * @brief HiveClient - cpp-httplib client for the agent endpoints
 *
 * Not thread-safe; use one client per agent thread.
 */
class HiveClient {
public:
    /**
     * @param base_url Server base URL, e.g. "http://localhost:8787"
     * @param timeout Connect and read timeout
     */
    explicit HiveClient(std::string base_url,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10));

    /**
     * @brief GET /health
     */
    nlohmann::json health();

    /**
     * @brief POST /challenge
     * @param hive_id Hive to join; the server default when empty
     */
    ChallengeResponse request_challenge(
        const std::string& agent_id,
        const std::string& pubkey,
        const std::string& hive_id = ""
    );

    /**
     * @brief Sign the challenge and POST /join; keeps the session token
     */
    JoinResponse join(
        const std::string& agent_id,
        const AgentKeys& keys,
        const ChallengeResponse& challenge,
        const std::optional<DeviceProof>& device_proof = std::nullopt
    );

    /**
     * @brief POST /message with the current session
     * @return The stored message
     */
    HiveMessage post_message(const std::string& content, const std::string& channel = "");

    /**
     * @brief GET /messages with the current session
     */
    std::vector<HiveMessage> read_messages(int64_t since = 0, size_t limit = 50);

    /**
     * @brief GET /messages, returning the raw response body
     */
    nlohmann::json read_messages_json(int64_t since = 0, size_t limit = 50);

    const std::string& session_token() const { return session_token_; }

    void set_session_token(const std::string& token) { session_token_ = token; }

    const std::string& base_url() const { return base_url_; }

private:
    nlohmann::json get(const std::string& path, const std::vector<std::pair<std::string, std::string>>& params,
                       bool authenticated);
    nlohmann::json post(const std::string& path, const nlohmann::json& body, bool authenticated);

    std::string base_url_;
    std::string origin_;
    std::string base_path_;
    std::chrono::milliseconds timeout_;
    std::string session_token_;
};

} // namespace hivemind
