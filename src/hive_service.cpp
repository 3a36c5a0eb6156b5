/**
 * @file hive_service.cpp
 * @brief Implementation of the Hivemind HTTP API handlers
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/hive_service.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/gossip_engine.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/protocol.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {

const char* const MISSING_SESSION = "missing or expired session";

// Decimal integer covering the whole string
std::optional<int64_t> parse_integer(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int64_t value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t query_integer(const ApiRequest& request, const std::string& name, int64_t fallback) {
    auto raw = request.query_param(name);
    if (!raw) {
        return fallback;
    }
    auto value = parse_integer(*raw);
    return value ? *value : fallback;
}

// Parsed JSON object, or an empty object for a missing/malformed body
json parse_body(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return json::object();
    }
    return parsed;
}

std::string string_field(const json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

json messages_to_json(const std::vector<HiveMessage>& messages) {
    json array = json::array();
    for (const auto& message : messages) {
        array.push_back(message.to_json());
    }
    return array;
}

void require_valid_hive(const std::string& hive_id) {
    if (!config::validate_identifier(hive_id)) {
        throw ValidationError("hive_id is not a valid identifier");
    }
}

} // namespace

// ============================================================================
// ApiRequest
// ============================================================================

std::string ApiRequest::header(const std::string& name) const {
    auto it = headers.find(to_lowercase(name));
    return it == headers.end() ? std::string() : it->second;
}

std::optional<std::string> ApiRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// HiveService
// ============================================================================

HiveService::HiveService(HiveRegistry& registry, ClockFn clock)
    : registry_(registry)
    , config_(registry.config())
    , clock_(std::move(clock))
{
}

ApiResponse HiveService::handle(const ApiRequest& request) {
    try {
        return dispatch(request);
    } catch (const HiveError& e) {
        if (e.status() >= 500) {
            log_error("HiveService: " + request.method + " " + request.path + " failed: " + e.what());
        } else {
            log_debug("HiveService: " + request.method + " " + request.path + " rejected (" +
                      std::to_string(e.status()) + "): " + e.what());
        }
        return ApiResponse{e.status(), json{{"error", e.what()}}};
    } catch (const json::exception& e) {
        log_warn("HiveService: Malformed JSON in " + request.path + ": " + e.what());
        return ApiResponse{400, json{{"error", "invalid JSON body"}}};
    } catch (const std::exception& e) {
        log_error("HiveService: Unhandled error in " + request.method + " " + request.path + ": " + e.what());
        return ApiResponse{500, json{{"error", "internal error"}}};
    }
}

ApiResponse HiveService::dispatch(const ApiRequest& request) {
    const std::string& path = request.path;
    const bool is_get = request.method == "GET";
    const bool is_post = request.method == "POST";

    if (starts_with(path, "/gossip")) {
        require_gossip_secret(request);

        if (is_get && path == "/gossip/messages") {
            return handle_gossip_messages(request);
        }
        if (is_post && path == "/gossip/push") {
            return handle_gossip_push(request);
        }
        throw NotFoundError();
    }

    if (is_get && path == "/health") {
        return handle_health();
    }
    if (is_get && path == "/protocol") {
        return handle_protocol();
    }
    if (is_post && path == "/challenge") {
        return handle_challenge(request);
    }
    if (is_post && path == "/join") {
        return handle_join(request);
    }
    if (is_post && path == "/message") {
        return handle_post_message(request);
    }
    if (is_get && path == "/messages") {
        return handle_read_messages(request);
    }

    throw NotFoundError();
}

// ============================================================================
// Public endpoints
// ============================================================================

ApiResponse HiveService::handle_health() {
    return ApiResponse{200, json{
        {"status", "ok"},
        {"protocol", protocol::PROTOCOL_VERSION},
        {"hive_id", config_.default_hive_id}
    }};
}

ApiResponse HiveService::handle_protocol() {
    return ApiResponse{200, json{
        {"protocol_version", protocol::PROTOCOL_VERSION},
        {"hive_id", config_.default_hive_id},
        {"challenge_ttl_ms", config_.challenge_ttl.count()},
        {"session_ttl_ms", config_.session_ttl.count()},
        {"max_clock_skew_ms", config_.max_clock_skew.count()}
    }};
}

ApiResponse HiveService::handle_challenge(const ApiRequest& request) {
    json body = parse_body(request.body);

    std::string agent_id = string_field(body, "agent_id");
    std::string pubkey = string_field(body, "pubkey");
    if (agent_id.empty() || pubkey.empty()) {
        throw ValidationError("agent_id and pubkey are required");
    }

    std::string hive_id = body_hive_id(body);
    require_valid_hive(hive_id);
    auto actor = registry_.get_or_create(hive_id);

    Challenge challenge = actor->execute([&](HiveContext& ctx) {
        return ctx.challenges.issue(agent_id, pubkey, hive_id);
    });

    return ApiResponse{200, json{
        {"protocol_version", protocol::PROTOCOL_VERSION},
        {"nonce", challenge.nonce},
        {"hive_id", challenge.hive_id},
        {"expires_at", challenge.expires_at}
    }};
}

ApiResponse HiveService::handle_join(const ApiRequest& request) {
    json body = parse_body(request.body);

    auto join_request = JoinRequest::from_json(body);
    if (!join_request) {
        throw ValidationError("agent_id, pubkey, nonce, signature, timestamp are required");
    }

    std::string hive_id = body_hive_id(body);
    require_valid_hive(hive_id);

    // A hive that was never created cannot hold the challenge
    auto actor = registry_.find(hive_id);
    if (!actor) {
        log_warn("HiveService: Join for unknown hive '" + hive_id + "' from agent '" +
                 join_request->agent_id + "'");
        throw AuthenticationError("challenge not found or expired");
    }

    IssuedSession issued = actor->execute([&](HiveContext& ctx) {
        return ctx.authenticator.join(*join_request);
    });

    return ApiResponse{200, json{
        {"session_token", issued.token},
        {"expires_at", format_timestamp_ms(issued.session.expires_at_ms)},
        {"agent_id", issued.session.agent_id},
        {"hive_id", issued.session.hive_id}
    }};
}

// ============================================================================
// Session endpoints
// ============================================================================

std::pair<std::string, std::shared_ptr<HiveActor>> HiveService::session_actor(const ApiRequest& request) {
    auto token = protocol::parse_bearer_token(request.header("authorization"));
    if (!token) {
        throw AuthenticationError(MISSING_SESSION);
    }

    auto hive_id = protocol::hive_from_token(*token);
    if (!hive_id) {
        throw AuthenticationError(MISSING_SESSION);
    }

    auto actor = registry_.find(*hive_id);
    if (!actor) {
        throw AuthenticationError(MISSING_SESSION);
    }

    return {*token, actor};
}

ApiResponse HiveService::handle_post_message(const ApiRequest& request) {
    auto routed = session_actor(request);
    const std::string& token = routed.first;
    auto actor = routed.second;
    json body = parse_body(request.body);

    HiveMessage stored = actor->execute([&](HiveContext& ctx) {
        auto session = ctx.sessions.validate(token);
        if (!session) {
            throw AuthenticationError(MISSING_SESSION);
        }

        std::string content = string_field(body, "content");
        if (content.empty()) {
            throw ValidationError("content is required");
        }

        std::string channel = string_field(body, "channel");
        int64_t now = clock_();

        HiveMessage candidate;
        candidate.uid = HiveCrypto::generate_uuid();
        candidate.ts = format_timestamp_ms(now);
        candidate.created_at_ms = now;
        candidate.agent_id = session->agent_id;
        candidate.hive_id = session->hive_id;
        candidate.content = content;
        candidate.channel = channel.empty() ? "default" : channel;
        candidate.source = MessageSource::LOCAL;

        auto appended = ctx.messages.append(candidate);
        if (!appended) {
            throw StorageError("failed to store message");
        }
        return *appended;
    });

    log_info("HiveService: Agent '" + stored.agent_id + "' posted message " +
             std::to_string(stored.id) + " to hive '" + stored.hive_id + "'");

    return ApiResponse{200, json{
        {"accepted", true},
        {"message", stored.to_json()}
    }};
}

ApiResponse HiveService::handle_read_messages(const ApiRequest& request) {
    auto routed = session_actor(request);
    const std::string& token = routed.first;
    auto actor = routed.second;

    int64_t since = std::max<int64_t>(query_integer(request, "since", 0), 0);
    int64_t limit = query_integer(request, "limit", static_cast<int64_t>(config::DEFAULT_MESSAGES_LIMIT));
    limit = std::clamp<int64_t>(limit, 1, static_cast<int64_t>(config::MAX_MESSAGES_LIMIT));

    return actor->execute([&](HiveContext& ctx) {
        auto session = ctx.sessions.validate(token);
        if (!session) {
            throw AuthenticationError(MISSING_SESSION);
        }

        auto messages = ctx.messages.read_since(session->hive_id, since, static_cast<size_t>(limit));
        return ApiResponse{200, json{
            {"hive_id", session->hive_id},
            {"messages", messages_to_json(messages)}
        }};
    });
}

// ============================================================================
// Gossip endpoints
// ============================================================================

void HiveService::require_gossip_secret(const ApiRequest& request) const {
    if (config_.gossip_secret.empty()) {
        return;
    }

    if (!HiveCrypto::constant_time_equals(request.header(config::GOSSIP_HEADER), config_.gossip_secret)) {
        log_warn("HiveService: Rejected gossip request to " + request.path + " with invalid token");
        throw AuthenticationError("invalid gossip token");
    }
}

ApiResponse HiveService::handle_gossip_messages(const ApiRequest& request) {
    auto requested = request.query_param("hive_id");
    std::string hive_id = (requested && !requested->empty()) ? *requested : config_.default_hive_id;
    require_valid_hive(hive_id);

    int64_t since_ms = std::max<int64_t>(query_integer(request, "since_ms", 0), 0);
    int64_t limit = query_integer(request, "limit", static_cast<int64_t>(config::MAX_GOSSIP_BATCH));
    limit = std::clamp<int64_t>(limit, 1, static_cast<int64_t>(config::MAX_GOSSIP_BATCH));

    json messages = json::array();
    auto actor = registry_.find(hive_id);
    if (actor) {
        messages = actor->execute([&](HiveContext& ctx) {
            return messages_to_json(ctx.messages.read_since_time(hive_id, since_ms, static_cast<size_t>(limit)));
        });
    }

    return ApiResponse{200, json{
        {"hive_id", hive_id},
        {"server_time_ms", clock_()},
        {"messages", messages}
    }};
}

ApiResponse HiveService::handle_gossip_push(const ApiRequest& request) {
    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw ValidationError("invalid JSON body");
    }

    std::string hive_id = body_hive_id(body);
    require_valid_hive(hive_id);

    auto records = body.find("messages");
    if (records == body.end() || !records->is_array()) {
        return ApiResponse{200, json{{"accepted", 0}, {"skipped", 0}}};
    }

    auto actor = registry_.get_or_create(hive_id);
    IngestResult result = actor->execute([&](HiveContext& ctx) {
        return ingest_gossip_batch(ctx.messages, *records, ctx.hive_id, clock_());
    });

    log_info("HiveService: Gossip push to hive '" + hive_id + "': " +
             std::to_string(result.accepted) + " accepted, " +
             std::to_string(result.skipped) + " skipped");

    return ApiResponse{200, json{
        {"accepted", result.accepted},
        {"skipped", result.skipped}
    }};
}

std::string HiveService::body_hive_id(const json& body) const {
    std::string hive_id = string_field(body, "hive_id");
    return hive_id.empty() ? config_.default_hive_id : hive_id;
}

} // namespace hivemind
