/**
 * @file challenge_manager.cpp
 * @brief Implementation of join challenge issuing and eviction
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hivemind/challenge_manager.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/hive_crypto.hpp"

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {
const std::string CHALLENGE_PREFIX = "challenge:";
}

// ============================================================================
// Constructor
// ============================================================================

ChallengeManager::ChallengeManager(
    HiveStorage& storage,
    std::chrono::milliseconds ttl,
    ClockFn clock
)
    : storage_(storage)
    , ttl_(ttl)
    , clock_(std::move(clock))
{
}

std::string ChallengeManager::challenge_key(const std::string& nonce) {
    return CHALLENGE_PREFIX + nonce;
}

// ============================================================================
// Issue / Lookup
// ============================================================================

Challenge ChallengeManager::issue(
    const std::string& agent_id,
    const std::string& pubkey,
    const std::string& hive_id
) {
    if (agent_id.empty() || pubkey.empty()) {
        throw ValidationError("agent_id and pubkey are required");
    }

    if (!config::validate_identifier(agent_id)) {
        throw ValidationError("agent_id is not a valid identifier");
    }

    if (!HiveCrypto::is_valid_public_key(pubkey)) {
        throw ValidationError("pubkey is not a valid Ed25519 public key");
    }

    // Bound growth before adding another entry
    size_t evicted = evict_expired();
    if (evicted > 0) {
        log_debug("ChallengeManager: Evicted " + std::to_string(evicted) + " expired challenges");
    }

    Challenge challenge;
    challenge.agent_id = agent_id;
    challenge.pubkey = pubkey;
    challenge.nonce = HiveCrypto::generate_uuid();
    challenge.hive_id = hive_id;
    challenge.expires_at = format_timestamp_ms(clock_() + ttl_.count());

    storage_.put(challenge_key(challenge.nonce), challenge.to_json().dump());

    log_info("ChallengeManager: Issued challenge for agent '" + agent_id + "' in hive '" +
             hive_id + "'");

    return challenge;
}

std::optional<Challenge> ChallengeManager::find(const std::string& nonce) {
    if (nonce.empty()) {
        return std::nullopt;
    }

    auto raw = storage_.get(challenge_key(nonce));
    if (!raw) {
        return std::nullopt;
    }

    json parsed = json::parse(*raw, nullptr, false);
    if (parsed.is_discarded()) {
        log_warn("ChallengeManager: Dropping unreadable challenge record");
        storage_.remove(challenge_key(nonce));
        return std::nullopt;
    }

    return Challenge::from_json(parsed);
}

bool ChallengeManager::consume(const std::string& nonce) {
    return storage_.remove(challenge_key(nonce));
}

// ============================================================================
// Expiry
// ============================================================================

bool ChallengeManager::is_expired(const Challenge& challenge) const {
    auto expires_at = parse_timestamp_ms(challenge.expires_at);
    if (!expires_at) {
        return true;
    }
    return *expires_at < clock_();
}

size_t ChallengeManager::evict_expired() {
    ListOptions options;
    options.prefix = CHALLENGE_PREFIX;

    int64_t now = clock_();
    std::vector<std::string> expired;

    for (const auto& entry : storage_.list(options)) {
        json parsed = json::parse(entry.second, nullptr, false);
        auto challenge = parsed.is_discarded()
            ? std::nullopt
            : Challenge::from_json(parsed);

        if (!challenge) {
            expired.push_back(entry.first);
            continue;
        }

        auto expires_at = parse_timestamp_ms(challenge->expires_at);
        if (!expires_at || *expires_at <= now) {
            expired.push_back(entry.first);
        }
    }

    if (expired.empty()) {
        return 0;
    }

    return storage_.remove_batch(expired);
}

size_t ChallengeManager::pending_count() {
    ListOptions options;
    options.prefix = CHALLENGE_PREFIX;
    return storage_.list(options).size();
}

} // namespace hivemind
