/**
 * @file agent_keys.cpp
 * @brief Implementation of agent key file handling
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/agent_keys.hpp"
#include "hivemind/utilities.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

AgentKeys::AgentKeys(const SignatureKeyPair& keypair)
    : keypair_(keypair)
{
}

AgentKeys::~AgentKeys() {
    HiveCrypto::secure_zero(keypair_.secret_key.data(), keypair_.secret_key.size());
}

AgentKeys AgentKeys::generate() {
    return AgentKeys(HiveCrypto::generate_signature_keypair());
}

std::optional<AgentKeys> AgentKeys::load(const std::filesystem::path& path) {
    auto content = read_file(path.string());
    if (!content) {
        return std::nullopt;
    }

    json parsed = json::parse(*content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array() || parsed.size() != crypto_sign_SECRETKEYBYTES) {
        log_warn("AgentKeys: Key file " + path.string() + " is not a " +
                 std::to_string(crypto_sign_SECRETKEYBYTES) + "-byte array");
        return std::nullopt;
    }

    std::vector<uint8_t> secret;
    secret.reserve(crypto_sign_SECRETKEYBYTES);
    for (const auto& value : parsed) {
        if (!value.is_number_unsigned() || value.get<unsigned>() > 255) {
            log_warn("AgentKeys: Key file " + path.string() + " contains a non-byte value");
            return std::nullopt;
        }
        secret.push_back(static_cast<uint8_t>(value.get<unsigned>()));
    }

    auto keypair = HiveCrypto::keypair_from_secret_key(secret);
    HiveCrypto::secure_zero(secret.data(), secret.size());
    if (!keypair) {
        return std::nullopt;
    }

    AgentKeys keys(*keypair);
    HiveCrypto::secure_zero(keypair->secret_key.data(), keypair->secret_key.size());
    return keys;
}

AgentKeys AgentKeys::load_or_generate(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        auto keys = load(path);
        if (!keys) {
            throw std::runtime_error("invalid agent key file: " + path.string());
        }
        return *keys;
    }

    AgentKeys keys = generate();
    if (!keys.save(path)) {
        throw std::runtime_error("cannot write agent key file: " + path.string());
    }

    log_info("AgentKeys: Generated new agent key " + keys.public_key_b58() + " at " + path.string());
    return keys;
}

bool AgentKeys::save(const std::filesystem::path& path) const {
    try {
        if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
            std::filesystem::create_directories(path.parent_path());
        }

        json bytes = json::array();
        for (uint8_t b : keypair_.secret_key) {
            bytes.push_back(b);
        }

        if (!write_file(path.string(), bytes.dump())) {
            return false;
        }

        // Set restrictive permissions (owner read/write only)
#ifndef _WIN32
        std::filesystem::permissions(path,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace);
#endif

        return true;

    } catch (const std::exception& e) {
        log_error("AgentKeys: Failed to save " + path.string() + ": " + e.what());
        return false;
    }
}

std::string AgentKeys::public_key_b58() const {
    return HiveCrypto::bytes_to_base58(
        std::vector<uint8_t>(keypair_.public_key.begin(), keypair_.public_key.end())
    );
}

std::string AgentKeys::sign(const std::string& message) const {
    return HiveCrypto::sign_text_b64(message, keypair_.secret_key);
}

std::string AgentKeys::sign_join(const protocol::JoinMessageFields& fields) const {
    return sign(protocol::build_join_message(fields));
}

} // namespace hivemind
