/**
 * @file hive_client.cpp
 * @brief Implementation of the agent-side Hivemind client
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/hive_client.hpp"
#include "hivemind/join_authenticator.hpp"
#include "hivemind/peer_client.hpp"
#include "hivemind/protocol.hpp"
#include "hivemind/utilities.hpp"

#include <httplib.h>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {

std::string string_member(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        throw HiveClientError(0, std::string("response is missing ") + name);
    }
    return it->get<std::string>();
}

// Decode a response body, turning error statuses into HiveClientError
json decode_response(const httplib::Result& res, const std::string& what) {
    if (!res) {
        throw HiveClientError(0, what + " failed: " + httplib::to_string(res.error()));
    }

    json body = json::parse(res->body, nullptr, false);

    if (res->status != 200) {
        std::string reason = "HTTP " + std::to_string(res->status);
        if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
            reason = body["error"].get<std::string>();
        }
        throw HiveClientError(res->status, what + " rejected: " + reason);
    }

    if (body.is_discarded() || !body.is_object()) {
        throw HiveClientError(res->status, what + " returned a malformed body");
    }

    return body;
}

} // namespace

HiveClient::HiveClient(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url))
    , timeout_(timeout)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }

    PeerEndpoint endpoint = parse_peer_url(base_url_);
    origin_ = endpoint.origin;
    base_path_ = endpoint.base_path;
}

// ============================================================================
// Endpoints
// ============================================================================

json HiveClient::health() {
    return get("/health", {}, false);
}

ChallengeResponse HiveClient::request_challenge(
    const std::string& agent_id,
    const std::string& pubkey,
    const std::string& hive_id
) {
    json body = {
        {"agent_id", agent_id},
        {"pubkey", pubkey}
    };
    if (!hive_id.empty()) {
        body["hive_id"] = hive_id;
    }

    json response = post("/challenge", body, false);

    ChallengeResponse challenge;
    challenge.protocol_version = string_member(response, "protocol_version");
    challenge.nonce = string_member(response, "nonce");
    challenge.hive_id = string_member(response, "hive_id");
    challenge.expires_at = string_member(response, "expires_at");
    return challenge;
}

JoinResponse HiveClient::join(
    const std::string& agent_id,
    const AgentKeys& keys,
    const ChallengeResponse& challenge,
    const std::optional<DeviceProof>& device_proof
) {
    JoinRequest request;
    request.agent_id = agent_id;
    request.pubkey = keys.public_key_b58();
    request.nonce = challenge.nonce;
    request.timestamp = format_timestamp_ms(now_ms());
    request.hive_id = challenge.hive_id;
    request.expires_at = challenge.expires_at;

    protocol::JoinMessageFields fields;
    fields.agent_id = request.agent_id;
    fields.pubkey = request.pubkey;
    fields.nonce = request.nonce;
    fields.hive_id = challenge.hive_id;
    fields.challenge_expires_at = challenge.expires_at;
    fields.timestamp = request.timestamp;
    request.signature = keys.sign_join(fields);

    if (device_proof) {
        request.device_public_key = device_proof->public_key;
        request.device_signature = device_proof->signature;
        request.device_nonce = device_proof->nonce;
        request.device_signed_at = device_proof->signed_at;
    }

    json response = post("/join", request.to_json(), false);

    JoinResponse joined;
    joined.session_token = string_member(response, "session_token");
    joined.expires_at = string_member(response, "expires_at");
    joined.agent_id = string_member(response, "agent_id");
    joined.hive_id = string_member(response, "hive_id");

    session_token_ = joined.session_token;
    log_info("HiveClient: Joined hive '" + joined.hive_id + "' as '" + joined.agent_id +
             "' (token " + redact(joined.session_token) + ")");
    return joined;
}

HiveMessage HiveClient::post_message(const std::string& content, const std::string& channel) {
    json body = {{"content", content}};
    if (!channel.empty()) {
        body["channel"] = channel;
    }

    json response = post("/message", body, true);

    auto message = response.find("message");
    if (message == response.end()) {
        throw HiveClientError(200, "message response has no message");
    }

    auto parsed = HiveMessage::from_json(*message);
    if (!parsed) {
        throw HiveClientError(200, "message response is malformed");
    }
    return *parsed;
}

std::vector<HiveMessage> HiveClient::read_messages(int64_t since, size_t limit) {
    json response = read_messages_json(since, limit);

    std::vector<HiveMessage> messages;
    auto array = response.find("messages");
    if (array == response.end() || !array->is_array()) {
        throw HiveClientError(200, "messages response has no messages array");
    }

    for (const auto& entry : *array) {
        auto parsed = HiveMessage::from_json(entry);
        if (parsed) {
            messages.push_back(*parsed);
        }
    }
    return messages;
}

json HiveClient::read_messages_json(int64_t since, size_t limit) {
    return get("/messages", {{"since", std::to_string(since)}, {"limit", std::to_string(limit)}}, true);
}

// ============================================================================
// Transport
// ============================================================================

json HiveClient::get(
    const std::string& path,
    const std::vector<std::pair<std::string, std::string>>& params,
    bool authenticated
) {
    httplib::Client client(origin_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);

    httplib::Headers headers;
    if (authenticated) {
        headers.emplace("Authorization", "Bearer " + session_token_);
    }

    httplib::Params query;
    for (const auto& param : params) {
        query.emplace(param.first, param.second);
    }

    return decode_response(client.Get(base_path_ + path, query, headers), "GET " + path);
}

json HiveClient::post(const std::string& path, const json& body, bool authenticated) {
    httplib::Client client(origin_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);

    httplib::Headers headers;
    if (authenticated) {
        headers.emplace("Authorization", "Bearer " + session_token_);
    }

    return decode_response(
        client.Post(base_path_ + path, headers, body.dump(), "application/json"),
        "POST " + path
    );
}

} // namespace hivemind
