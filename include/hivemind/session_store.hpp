/**
 * @file session_store.hpp
 * @brief Bearer session tokens with lazy expiry
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
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
 * @brief Token minted by SessionStore::create
 */
struct IssuedSession {
    std::string token;
    Session session;
};

/**
 * @brief SessionStore - Authenticated sessions of one hive
 *
 * Sessions live under "session:<token>". There is no renewal. An expired
 * session is removed when it is next read or by evict_expired().
 */
class SessionStore {
public:
    SessionStore(
        HiveStorage& storage,
        std::chrono::milliseconds ttl,
        utilities::ClockFn clock = utilities::now_ms
    );

    // Disable copy and move
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;
    SessionStore(SessionStore&&) = delete;
    SessionStore& operator=(SessionStore&&) = delete;

    /**
     * @brief Mint a token of the form "<hive_id>.<uuid>" and record the session
     */
    IssuedSession create(const std::string& agent_id, const std::string& pubkey, const std::string& hive_id);

    /**
     * @brief Resolve a token
     * @return Session, or std::nullopt if unknown or expired (expired entries are deleted)
     */
    std::optional<Session> validate(const std::string& token);

    /**
     * @brief Remove every session whose expiry has passed
     * @return Number removed
     */
    size_t evict_expired();

    /**
     * @brief Delete a session
     * @return true if it existed
     */
    bool revoke(const std::string& token);

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    static std::string session_key(const std::string& token);

    HiveStorage& storage_;
    std::chrono::milliseconds ttl_;
    utilities::ClockFn clock_;
};

} // namespace hivemind
