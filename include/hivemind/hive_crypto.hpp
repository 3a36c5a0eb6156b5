/**
 * @file hive_crypto.hpp
 * @brief Cryptographic primitives for Hivemind agents and servers
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 detached signatures, public key validation, base58 and
 * base64 codecs, and CSPRNG helpers on top of libsodium.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace hivemind {

/**
 * @brief Ed25519 signature key pair
 */
struct SignatureKeyPair {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief HiveCrypto - Signature verification and encoding helpers
 *
 * Stateless, thread-safe wrappers around libsodium. Every verification
 * entry point accepts attacker-controlled text and reports failure by
 * returning false; none of them throw.
 */
class HiveCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 signature key pair
     * @return SignatureKeyPair with public and secret keys
     */
    static SignatureKeyPair generate_signature_keypair();

    /**
     * @brief Rebuild a key pair from a 64-byte Ed25519 secret key
     * @param secret_key Secret key bytes (seed followed by public key)
     * @return Key pair, or std::nullopt if the length is wrong
     */
    static std::optional<SignatureKeyPair> keypair_from_secret_key(
        const std::vector<uint8_t>& secret_key
    );

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Detached signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 detached signature over raw bytes
     * @param message Original message
     * @param signature Signature to verify (must be 64 bytes)
     * @param public_key Public key of signer (must be 32 bytes)
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const std::vector<uint8_t>& public_key
    );

    /**
     * @brief Verify a base64 signature over UTF-8 text against a base58 key
     *
     * This is the agent join check: the key is the agent's base58 public
     * key and the signature is base64 encoded.
     *
     * @param message Message text (signed as its UTF-8 bytes)
     * @param signature_b64 Base64-encoded detached signature
     * @param public_key_b58 Base58-encoded Ed25519 public key
     * @return true if valid, false on any decoding, length or signature failure
     */
    static bool verify_message(
        const std::string& message,
        const std::string& signature_b64,
        const std::string& public_key_b58
    );

    /**
     * @brief Verify a base64 signature over UTF-8 text against a base64 key
     *
     * Used for device proofs, where the device key travels as base64.
     */
    static bool verify_message_b64_key(
        const std::string& message,
        const std::string& signature_b64,
        const std::string& public_key_b64
    );

    /**
     * @brief Check that a string is a base58 Ed25519 public key
     * @param public_key_b58 Candidate key
     * @return true if it decodes to exactly 32 bytes
     */
    static bool is_valid_public_key(const std::string& public_key_b58);

    /**
     * @brief Sign UTF-8 text and return the base64 signature
     */
    static std::string sign_text_b64(
        const std::string& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate an RFC 4122 version 4 UUID from the CSPRNG
     * @return Lowercase UUID string (e.g. "550e8400-e29b-41d4-a716-446655440000")
     */
    static std::string generate_uuid();

    /**
     * @brief Constant-time comparison of two strings (prevents timing attacks)
     */
    static bool constant_time_equals(const std::string& a, const std::string& b);

    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert base64 string to bytes
     * @param base64 Base64 string (standard alphabet, padded)
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Encode bytes with the Bitcoin base58 alphabet
     */
    static std::string bytes_to_base58(const std::vector<uint8_t>& bytes);

    /**
     * @brief Decode a Bitcoin-alphabet base58 string
     * @param base58 Encoded text
     * @return Decoded bytes, or std::nullopt on an invalid character
     */
    static std::optional<std::vector<uint8_t>> base58_to_bytes(const std::string& base58);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     * @param data Pointer to memory to zero
     * @param size Size of memory region
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace hivemind
