/**
 * @file join_authenticator.hpp
 * @brief Challenge-response join: signature check and session minting
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A join succeeds at most once per challenge. Checks, in order:
 * 1. Challenge exists for the nonce
 * 2. agent_id, pubkey, hive_id, expires_at match the challenge
 * 3. Challenge not expired (an expired challenge is deleted)
 * 4. Timestamp parses and lies within the clock skew bound
 * 5. Device proof, when required or when any device field is present
 * 6. Ed25519 signature over the canonical join message
 */

#pragma once

#include "hivemind/challenge_manager.hpp"
#include "hivemind/session_store.hpp"
#include "hivemind/utilities.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace hivemind {

/**
 * @brief Body of POST /join
 */
struct JoinRequest {
    std::string agent_id;
    std::string pubkey;
    std::string nonce;
    std::string signature;                  ///< Base64 detached signature
    std::string timestamp;                  ///< ISO timestamp
    std::optional<std::string> hive_id;     ///< Must equal the challenge's when present
    std::optional<std::string> expires_at;  ///< Must equal the challenge's when present

    // Device proof (empty = absent)
    std::string device_public_key;          ///< Base64 Ed25519 public key
    std::string device_signature;           ///< Base64 signature over device_nonce
    std::string device_nonce;
    std::string device_signed_at;           ///< ISO timestamp

    bool has_any_device_field() const;
    bool has_all_device_fields() const;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a join body
     * @return Request, or std::nullopt if a required field is missing or not a string
     */
    static std::optional<JoinRequest> from_json(const nlohmann::json& j);
};

/**
 * @brief Timing and device proof settings for joins
 */
struct JoinPolicy {
    std::chrono::milliseconds max_clock_skew;
    bool device_proof_required = false;
    std::chrono::milliseconds device_proof_ttl;
};

/**
 * @brief JoinAuthenticator - Turns a signed challenge into a session
 */
class JoinAuthenticator {
public:
    JoinAuthenticator(
        ChallengeManager& challenges,
        SessionStore& sessions,
        JoinPolicy policy,
        utilities::ClockFn clock = utilities::now_ms
    );

    // Disable copy and move
    JoinAuthenticator(const JoinAuthenticator&) = delete;
    JoinAuthenticator& operator=(const JoinAuthenticator&) = delete;
    JoinAuthenticator(JoinAuthenticator&&) = delete;
    JoinAuthenticator& operator=(JoinAuthenticator&&) = delete;

    /**
     * @brief Verify a join request and mint a session
     * @return Token and session
     * @throws ValidationError if the timestamp does not parse
     * @throws AuthenticationError for every other rejected check
     */
    IssuedSession join(const JoinRequest& request);

    /**
     * @brief Check a device proof on its own
     * @return true if signed_at is fresh and the signature verifies
     */
    bool verify_device_proof(const JoinRequest& request) const;

    const JoinPolicy& policy() const { return policy_; }

private:
    ChallengeManager& challenges_;
    SessionStore& sessions_;
    JoinPolicy policy_;
    utilities::ClockFn clock_;
};

} // namespace hivemind
