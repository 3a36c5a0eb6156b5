/**
 * @file hive_crypto.cpp
 * @brief Implementation of Hivemind cryptographic primitives
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: Detached signatures (agent join, device proof)
 * - Base58: Agent public key encoding
 * - libsodium: CSPRNG, base64, constant-time compare
 */

#include "hivemind/hive_crypto.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace hivemind {

namespace {

const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_digit(char c) {
    const char* pos = std::find(BASE58_ALPHABET, BASE58_ALPHABET + 58, c);
    if (pos == BASE58_ALPHABET + 58) {
        return -1;
    }
    return static_cast<int>(pos - BASE58_ALPHABET);
}

std::vector<uint8_t> text_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

// ============================================================================
// Initialization
// ============================================================================

bool HiveCrypto::initialize() {
    // Safe to call multiple times
    return sodium_init() >= 0;
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair HiveCrypto::generate_signature_keypair() {
    SignatureKeyPair keypair;
    crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

std::optional<SignatureKeyPair> HiveCrypto::keypair_from_secret_key(
    const std::vector<uint8_t>& secret_key
) {
    if (secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        return std::nullopt;
    }

    SignatureKeyPair keypair;
    std::copy(secret_key.begin(), secret_key.end(), keypair.secret_key.begin());

    // The public half is embedded in the secret key
    if (crypto_sign_ed25519_sk_to_pk(keypair.public_key.data(), keypair.secret_key.data()) != 0) {
        return std::nullopt;
    }

    return keypair;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> HiveCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);
    return signature;
}

bool HiveCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& public_key
) {
    // Exact lengths only; anything else is a malformed input, not an error
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }
    if (public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }

    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );

    return result == 0;
}

bool HiveCrypto::verify_message(
    const std::string& message,
    const std::string& signature_b64,
    const std::string& public_key_b58
) {
    auto signature = base64_to_bytes(signature_b64);
    if (!signature) {
        return false;
    }

    auto public_key = base58_to_bytes(public_key_b58);
    if (!public_key) {
        return false;
    }

    return verify_signature(text_bytes(message), *signature, *public_key);
}

bool HiveCrypto::verify_message_b64_key(
    const std::string& message,
    const std::string& signature_b64,
    const std::string& public_key_b64
) {
    auto signature = base64_to_bytes(signature_b64);
    auto public_key = base64_to_bytes(public_key_b64);
    if (!signature || !public_key) {
        return false;
    }

    return verify_signature(text_bytes(message), *signature, *public_key);
}

bool HiveCrypto::is_valid_public_key(const std::string& public_key_b58) {
    if (public_key_b58.empty()) {
        return false;
    }

    auto bytes = base58_to_bytes(public_key_b58);
    return bytes && bytes->size() == crypto_sign_PUBLICKEYBYTES;
}

std::string HiveCrypto::sign_text_b64(
    const std::string& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    return bytes_to_base64(sign_message(text_bytes(message), secret_key));
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string HiveCrypto::generate_uuid() {
    std::array<uint8_t, 16> data;
    randombytes_buf(data.data(), data.size());

    // Set version (4) and variant bits according to RFC 4122
    data[6] = static_cast<uint8_t>((data[6] & 0x0F) | 0x40);
    data[8] = static_cast<uint8_t>((data[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < data.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << "-";
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

bool HiveCrypto::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string HiveCrypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> HiveCrypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    // Trailing garbage after a valid prefix is rejected too
    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::string HiveCrypto::bytes_to_base58(const std::vector<uint8_t>& bytes) {
    size_t leading_zeros = 0;
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Base-256 to base-58 conversion, little-endian digit buffer
    std::vector<uint8_t> digits;
    digits.reserve(bytes.size() * 138 / 100 + 1);

    for (size_t i = leading_zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        for (auto& digit : digits) {
            carry += digit << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }

    return result;
}

std::optional<std::vector<uint8_t>> HiveCrypto::base58_to_bytes(const std::string& base58) {
    size_t leading_ones = 0;
    while (leading_ones < base58.size() && base58[leading_ones] == '1') {
        ++leading_ones;
    }

    // Base-58 to base-256 conversion, little-endian byte buffer
    std::vector<uint8_t> bytes;
    bytes.reserve(base58.size() * 733 / 1000 + 1);

    for (size_t i = leading_ones; i < base58.size(); ++i) {
        int carry = base58_digit(base58[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        for (auto& byte : bytes) {
            carry += byte * 58;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(leading_ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

void HiveCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace hivemind
