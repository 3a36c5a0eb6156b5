/**
 * @file join_authenticator.cpp
 * @brief Implementation of the challenge-response join
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hivemind/join_authenticator.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/protocol.hpp"

#include <cstdlib>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {

// Non-empty string member, or empty when absent or of another type
std::string string_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        // Present but unusable; an empty value never matches a challenge
        return std::string();
    }
    return it->get<std::string>();
}

} // namespace

// ============================================================================
// JoinRequest
// ============================================================================

bool JoinRequest::has_any_device_field() const {
    return !device_public_key.empty() || !device_signature.empty() ||
           !device_nonce.empty() || !device_signed_at.empty();
}

bool JoinRequest::has_all_device_fields() const {
    return !device_public_key.empty() && !device_signature.empty() &&
           !device_nonce.empty() && !device_signed_at.empty();
}

json JoinRequest::to_json() const {
    json j;
    j["agent_id"] = agent_id;
    j["pubkey"] = pubkey;
    j["nonce"] = nonce;
    j["signature"] = signature;
    j["timestamp"] = timestamp;
    if (hive_id) {
        j["hive_id"] = *hive_id;
    }
    if (expires_at) {
        j["expires_at"] = *expires_at;
    }
    if (!device_public_key.empty()) {
        j["openclaw_device_public_key"] = device_public_key;
    }
    if (!device_signature.empty()) {
        j["openclaw_device_signature"] = device_signature;
    }
    if (!device_nonce.empty()) {
        j["openclaw_device_nonce"] = device_nonce;
    }
    if (!device_signed_at.empty()) {
        j["openclaw_device_signed_at"] = device_signed_at;
    }
    return j;
}

std::optional<JoinRequest> JoinRequest::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    JoinRequest request;
    request.agent_id = string_field(j, "agent_id");
    request.pubkey = string_field(j, "pubkey");
    request.nonce = string_field(j, "nonce");
    request.signature = string_field(j, "signature");
    request.timestamp = string_field(j, "timestamp");

    if (request.agent_id.empty() || request.pubkey.empty() || request.nonce.empty() ||
        request.signature.empty() || request.timestamp.empty()) {
        return std::nullopt;
    }

    request.hive_id = optional_string_field(j, "hive_id");
    request.expires_at = optional_string_field(j, "expires_at");

    request.device_public_key = string_field(j, "openclaw_device_public_key");
    request.device_signature = string_field(j, "openclaw_device_signature");
    request.device_nonce = string_field(j, "openclaw_device_nonce");
    request.device_signed_at = string_field(j, "openclaw_device_signed_at");

    return request;
}

// ============================================================================
// JoinAuthenticator
// ============================================================================

JoinAuthenticator::JoinAuthenticator(
    ChallengeManager& challenges,
    SessionStore& sessions,
    JoinPolicy policy,
    ClockFn clock
)
    : challenges_(challenges)
    , sessions_(sessions)
    , policy_(policy)
    , clock_(std::move(clock))
{
}

IssuedSession JoinAuthenticator::join(const JoinRequest& request) {
    auto challenge = challenges_.find(request.nonce);
    if (!challenge) {
        log_warn("JoinAuthenticator: Unknown nonce from agent '" + request.agent_id + "'");
        throw AuthenticationError("challenge not found or expired");
    }

    if (challenge->agent_id != request.agent_id || challenge->pubkey != request.pubkey) {
        log_warn("JoinAuthenticator: Challenge binding mismatch for agent '" + request.agent_id + "'");
        throw AuthenticationError("challenge does not match agent_id or pubkey");
    }

    if (request.hive_id && *request.hive_id != challenge->hive_id) {
        log_warn("JoinAuthenticator: hive_id mismatch for agent '" + request.agent_id + "'");
        throw AuthenticationError("hive_id mismatch");
    }

    if (request.expires_at && *request.expires_at != challenge->expires_at) {
        log_warn("JoinAuthenticator: expires_at mismatch for agent '" + request.agent_id + "'");
        throw AuthenticationError("expires_at mismatch");
    }

    if (challenges_.is_expired(*challenge)) {
        challenges_.consume(request.nonce);
        log_warn("JoinAuthenticator: Expired challenge for agent '" + request.agent_id + "'");
        throw AuthenticationError("challenge expired");
    }

    auto timestamp_ms = parse_timestamp_ms(request.timestamp);
    if (!timestamp_ms) {
        throw ValidationError("timestamp must be an ISO string");
    }

    int64_t now = clock_();
    if (std::llabs(now - *timestamp_ms) > policy_.max_clock_skew.count()) {
        log_warn("JoinAuthenticator: Clock skew exceeded for agent '" + request.agent_id + "'");
        throw AuthenticationError("timestamp outside allowed clock skew");
    }

    if (policy_.device_proof_required || request.has_any_device_field()) {
        if (!request.has_all_device_fields()) {
            log_warn("JoinAuthenticator: Incomplete device proof from agent '" + request.agent_id + "'");
            throw AuthenticationError("missing OpenClaw device proof fields");
        }

        if (!verify_device_proof(request)) {
            log_warn("JoinAuthenticator: Invalid device proof from agent '" + request.agent_id + "'");
            throw AuthenticationError("invalid OpenClaw device proof");
        }
    }

    // Signed fields come from the challenge, never from the request
    protocol::JoinMessageFields fields;
    fields.agent_id = challenge->agent_id;
    fields.pubkey = challenge->pubkey;
    fields.nonce = challenge->nonce;
    fields.hive_id = challenge->hive_id;
    fields.challenge_expires_at = challenge->expires_at;
    fields.timestamp = request.timestamp;

    std::string message = protocol::build_join_message(fields);

    if (!HiveCrypto::verify_message(message, request.signature, challenge->pubkey)) {
        log_warn("JoinAuthenticator: Invalid signature from agent '" + request.agent_id + "'");
        throw AuthenticationError("invalid signature");
    }

    // Single use
    challenges_.consume(request.nonce);

    IssuedSession issued = sessions_.create(challenge->agent_id, challenge->pubkey, challenge->hive_id);

    log_info("JoinAuthenticator: Agent '" + challenge->agent_id + "' joined hive '" +
             challenge->hive_id + "'");

    return issued;
}

bool JoinAuthenticator::verify_device_proof(const JoinRequest& request) const {
    auto signed_at = parse_timestamp_ms(request.device_signed_at);
    if (!signed_at) {
        return false;
    }

    if (std::llabs(clock_() - *signed_at) > policy_.device_proof_ttl.count()) {
        return false;
    }

    return HiveCrypto::verify_message_b64_key(
        request.device_nonce,
        request.device_signature,
        request.device_public_key
    );
}

} // namespace hivemind
