/**
 * @file agent_keys.hpp
 * @brief Agent Ed25519 identity stored as a JSON key file
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The key file holds the 64-byte Ed25519 secret key (seed followed by the
 * public key) as a JSON array of byte values, the format written by the
 * agent wallet tooling.
 */

#pragma once

#include "hivemind/hive_crypto.hpp"
#include "hivemind/protocol.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hivemind {

/**
 * @brief AgentKeys - Signing identity of one agent
 */
class AgentKeys {
public:
    /**
     * @brief Generate a fresh key pair
     */
    static AgentKeys generate();

    /**
     * @brief Load a key file
     * @param path JSON array of 64 byte values
     * @return Keys, or std::nullopt if the file is missing or malformed
     */
    static std::optional<AgentKeys> load(const std::filesystem::path& path);

    /**
     * @brief Load a key file, generating and saving one if it does not exist
     * @throws std::runtime_error if an existing file is malformed or the new one cannot be written
     */
    static AgentKeys load_or_generate(const std::filesystem::path& path);

    ~AgentKeys();

    AgentKeys(const AgentKeys&) = default;
    AgentKeys& operator=(const AgentKeys&) = default;

    /**
     * @brief Write the key file (owner read/write only)
     * @return true on success
     */
    bool save(const std::filesystem::path& path) const;

    /**
     * @brief Base58 public key, as sent in the pubkey field
     */
    std::string public_key_b58() const;

    /**
     * @brief Base64 signature over UTF-8 text
     */
    std::string sign(const std::string& message) const;

    /**
     * @brief Sign the canonical join message
     */
    std::string sign_join(const protocol::JoinMessageFields& fields) const;

    const SignatureKeyPair& keypair() const { return keypair_; }

private:
    explicit AgentKeys(const SignatureKeyPair& keypair);

    SignatureKeyPair keypair_;
};

} // namespace hivemind
