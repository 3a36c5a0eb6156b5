/**
 * @file hive_types.cpp
 * @brief Implementation of hive record serialization
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hivemind/hive_types.hpp"

using json = nlohmann::json;

namespace hivemind {

// ============================================================================
// Message Source String Conversion
// ============================================================================

std::string message_source_to_string(MessageSource source) {
    switch (source) {
        case MessageSource::LOCAL: return "local";
        case MessageSource::GOSSIP: return "gossip";
        default: return "local";
    }
}

std::optional<MessageSource> string_to_message_source(const std::string& str) {
    if (str == "local") return MessageSource::LOCAL;
    if (str == "gossip") return MessageSource::GOSSIP;
    return std::nullopt;
}

// ============================================================================
// Challenge
// ============================================================================

json Challenge::to_json() const {
    json j;
    j["agentId"] = agent_id;
    j["pubkey"] = pubkey;
    j["nonce"] = nonce;
    j["hiveId"] = hive_id;
    j["expiresAt"] = expires_at;
    return j;
}

std::optional<Challenge> Challenge::from_json(const json& j) {
    try {
        Challenge challenge;
        challenge.agent_id = j.at("agentId").get<std::string>();
        challenge.pubkey = j.at("pubkey").get<std::string>();
        challenge.nonce = j.at("nonce").get<std::string>();
        challenge.hive_id = j.at("hiveId").get<std::string>();
        challenge.expires_at = j.at("expiresAt").get<std::string>();
        return challenge;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Session
// ============================================================================

json Session::to_json() const {
    json j;
    j["agentId"] = agent_id;
    j["pubkey"] = pubkey;
    j["hiveId"] = hive_id;
    j["expiresAt"] = expires_at_ms;
    return j;
}

std::optional<Session> Session::from_json(const json& j) {
    try {
        Session session;
        session.agent_id = j.at("agentId").get<std::string>();
        session.pubkey = j.at("pubkey").get<std::string>();
        session.hive_id = j.at("hiveId").get<std::string>();
        session.expires_at_ms = j.at("expiresAt").get<int64_t>();
        return session;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HiveMessage
// ============================================================================

json HiveMessage::to_json() const {
    json j;
    j["id"] = id;
    j["uid"] = uid;
    j["ts"] = ts;
    j["createdAtMs"] = created_at_ms;
    j["agentId"] = agent_id;
    j["hiveId"] = hive_id;
    j["content"] = content;
    j["channel"] = channel;
    j["source"] = message_source_to_string(source);
    return j;
}

std::optional<HiveMessage> HiveMessage::from_json(const json& j) {
    try {
        HiveMessage message;
        message.id = j.at("id").get<int64_t>();
        message.uid = j.at("uid").get<std::string>();
        message.ts = j.at("ts").get<std::string>();
        message.created_at_ms = j.at("createdAtMs").get<int64_t>();
        message.agent_id = j.at("agentId").get<std::string>();
        message.hive_id = j.at("hiveId").get<std::string>();
        message.content = j.at("content").get<std::string>();
        message.channel = j.value("channel", std::string("default"));

        auto source = string_to_message_source(j.value("source", std::string("local")));
        if (!source) {
            return std::nullopt;
        }
        message.source = *source;

        return message;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace hivemind
