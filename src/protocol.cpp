/**
 * @file protocol.cpp
 * @brief Implementation of join message canonicalization and token helpers
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/protocol.hpp"
#include "hivemind/utilities.hpp"

namespace hivemind {
namespace protocol {

std::string build_join_message(const JoinMessageFields& fields) {
    std::string message;
    message.reserve(256);

    message += PROTOCOL_VERSION;
    message += '\n';
    message += fields.agent_id;
    message += '\n';
    message += fields.pubkey;
    message += '\n';
    message += fields.nonce;
    message += '\n';
    message += fields.hive_id;
    message += '\n';
    message += fields.challenge_expires_at;
    message += '\n';
    message += fields.timestamp;

    return message;
}

std::string make_session_token(const std::string& hive_id, const std::string& token_id) {
    return hive_id + "." + token_id;
}

std::optional<std::string> hive_from_token(const std::string& token) {
    size_t dot = token.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == token.size()) {
        return std::nullopt;
    }
    return token.substr(0, dot);
}

std::optional<std::string> parse_bearer_token(const std::string& header_value) {
    std::string value = utilities::trim_string(header_value);

    size_t space = value.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }

    if (value.substr(0, space) != "Bearer") {
        return std::nullopt;
    }

    std::string token = utilities::trim_string(value.substr(space + 1));
    if (token.empty()) {
        return std::nullopt;
    }

    return token;
}

} // namespace protocol
} // namespace hivemind
