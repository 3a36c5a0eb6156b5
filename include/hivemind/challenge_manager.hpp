/**
 * @file challenge_manager.hpp
 * @brief Issues and tracks single-use join challenges
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - CSPRNG nonces (UUID v4)
 * - 2 minute default lifetime
 * - Opportunistic eviction of expired challenges on every issue
 */

#pragma once

#include "hivemind/hive_types.hpp"
#include "hivemind/storage.hpp"
#include "hivemind/utilities.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace hivemind {

/**
 * @brief ChallengeManager - Pending join challenges of one hive
 *
 * Challenges live under "challenge:<nonce>" in the hive's storage.
 */
class ChallengeManager {
public:
    /**
     * @param storage Hive storage (must outlive the manager)
     * @param ttl Challenge lifetime
     * @param clock Epoch millisecond source
     */
    ChallengeManager(
        HiveStorage& storage,
        std::chrono::milliseconds ttl,
        utilities::ClockFn clock = utilities::now_ms
    );

    // Disable copy and move
    ChallengeManager(const ChallengeManager&) = delete;
    ChallengeManager& operator=(const ChallengeManager&) = delete;
    ChallengeManager(ChallengeManager&&) = delete;
    ChallengeManager& operator=(ChallengeManager&&) = delete;

    /**
     * @brief Issue a fresh challenge
     * @param agent_id Requesting agent
     * @param pubkey Agent's base58 Ed25519 public key
     * @param hive_id Hive being joined
     * @return Stored challenge
     * @throws ValidationError on a missing field or malformed public key
     */
    Challenge issue(const std::string& agent_id, const std::string& pubkey, const std::string& hive_id);

    /**
     * @brief Look up a challenge by nonce (expired entries are still returned)
     */
    std::optional<Challenge> find(const std::string& nonce);

    /**
     * @brief Delete a challenge
     * @return true if it existed
     */
    bool consume(const std::string& nonce);

    /**
     * @brief Remove every challenge whose expiry has passed
     * @return Number removed
     */
    size_t evict_expired();

    /**
     * @brief Number of stored challenges, expired or not
     */
    size_t pending_count();

    /**
     * @brief True if the challenge expiry is before now (or unparseable)
     */
    bool is_expired(const Challenge& challenge) const;

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    static std::string challenge_key(const std::string& nonce);

    HiveStorage& storage_;
    std::chrono::milliseconds ttl_;
    utilities::ClockFn clock_;
};

} // namespace hivemind
