/**
 * @file hive_config.cpp
 * @brief Implementation of runtime configuration and identifier validation
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hivemind/hive_config.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/utilities.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace hivemind {

using namespace hivemind::utilities;

namespace {

// Integer environment variable, falling back to the default when unset or malformed
int64_t env_int(const std::string& name, int64_t default_value) {
    std::string raw = trim_string(get_env(name));
    if (raw.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        int64_t value = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        log_warn("HiveConfig: Ignoring invalid " + name + "='" + raw + "', using " +
                 std::to_string(default_value));
        return default_value;
    }
}

std::chrono::milliseconds env_ms(const std::string& name, std::chrono::milliseconds default_value) {
    return std::chrono::milliseconds(env_int(name, default_value.count()));
}

} // namespace

// ============================================================================
// Identifier Validation
// ============================================================================

namespace config {

bool validate_identifier(const std::string& identifier, size_t max_length) {
    // Check length
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Printable ASCII only, no whitespace; '.' separates hive and token id
    for (char c : identifier) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc >= 0x7F) {
            return false;
        }
    }

    return true;
}

} // namespace config

// ============================================================================
// HiveConfig
// ============================================================================

HiveConfig HiveConfig::from_environment() {
    HiveConfig cfg;

    cfg.host = get_env("HIVEMIND_HOST", config::DEFAULT_HOST);

    int64_t port = env_int("HIVEMIND_PORT", config::DEFAULT_PORT);
    if (port < 0 || port > 65535) {
        log_warn("HiveConfig: HIVEMIND_PORT out of range, using " +
                 std::to_string(config::DEFAULT_PORT));
        port = config::DEFAULT_PORT;
    }
    cfg.port = static_cast<uint16_t>(port);

    std::string hive_id = trim_string(get_env("HIVE_ID"));
    if (!hive_id.empty()) {
        cfg.default_hive_id = hive_id;
    }

    cfg.peers = parse_peers(get_env("HIVEMIND_PEERS"));
    cfg.gossip_secret = get_env("HIVEMIND_GOSSIP_TOKEN");

    cfg.gossip_interval = std::max(
        env_ms("HIVEMIND_GOSSIP_INTERVAL_MS", config::GOSSIP_INTERVAL),
        std::chrono::milliseconds(config::MIN_GOSSIP_INTERVAL)
    );
    cfg.gossip_timeout = env_ms("HIVEMIND_GOSSIP_TIMEOUT_MS", config::GOSSIP_TIMEOUT);

    cfg.device_proof_required = to_lowercase(trim_string(
        get_env("OPENCLAW_DEVICE_PROOF_REQUIRED", "false"))) == "true";
    cfg.device_proof_ttl = env_ms("OPENCLAW_DEVICE_PROOF_TTL_MS", config::DEVICE_PROOF_TTL);

    cfg.challenge_ttl = env_ms("HIVEMIND_CHALLENGE_TTL_MS", config::CHALLENGE_TTL);
    cfg.session_ttl = env_ms("HIVEMIND_SESSION_TTL_MS", config::SESSION_TTL);
    cfg.max_clock_skew = env_ms("HIVEMIND_MAX_CLOCK_SKEW_MS", config::MAX_CLOCK_SKEW);

    std::string storage = to_lowercase(trim_string(get_env("HIVEMIND_STORAGE", "memory")));
    if (storage == "sqlite") {
        cfg.storage = StorageBackend::SQLITE;
    } else {
        if (storage != "memory") {
            log_warn("HiveConfig: Unknown HIVEMIND_STORAGE '" + storage + "', using memory");
        }
        cfg.storage = StorageBackend::MEMORY;
    }

    std::string data_dir = get_env("HIVEMIND_DATA_DIR");
    if (!data_dir.empty()) {
        cfg.data_dir = data_dir;
    }

    int64_t threads = env_int("HIVEMIND_WORKER_THREADS", 0);
    cfg.worker_threads = threads > 0 ? static_cast<size_t>(threads) : 0;

    cfg.log_level = get_env("HIVEMIND_LOG_LEVEL", "info");
    cfg.log_file = get_env("HIVEMIND_LOG_FILE");

    return cfg;
}

void HiveConfig::validate() const {
    if (host.empty()) {
        throw ValidationError("host must not be empty");
    }
    if (!config::validate_identifier(default_hive_id)) {
        throw ValidationError("invalid default hive id: " + default_hive_id);
    }
    if (challenge_ttl.count() <= 0) {
        throw ValidationError("challenge TTL must be positive");
    }
    if (session_ttl.count() <= 0) {
        throw ValidationError("session TTL must be positive");
    }
    if (max_clock_skew.count() < 0) {
        throw ValidationError("max clock skew must not be negative");
    }
    if (device_proof_ttl.count() <= 0) {
        throw ValidationError("device proof TTL must be positive");
    }
    if (gossip_interval < config::MIN_GOSSIP_INTERVAL) {
        throw ValidationError("gossip interval must be at least " +
                              std::to_string(config::MIN_GOSSIP_INTERVAL.count()) + " ms");
    }
    if (gossip_timeout.count() <= 0) {
        throw ValidationError("gossip timeout must be positive");
    }
    if (!parse_log_level(log_level)) {
        throw ValidationError("unknown log level: " + log_level);
    }
    for (const auto& peer : peers) {
        if (!starts_with(peer, "http://") && !starts_with(peer, "https://")) {
            throw ValidationError("peer URL must start with http:// or https://: " + peer);
        }
    }
}

std::vector<std::string> HiveConfig::parse_peers(const std::string& peer_list) {
    std::vector<std::string> result;

    for (const auto& entry : split_string(peer_list, ',')) {
        std::string peer = trim_string(entry);
        while (!peer.empty() && peer.back() == '/') {
            peer.pop_back();
        }
        if (!peer.empty()) {
            result.push_back(peer);
        }
    }

    return result;
}

std::filesystem::path HiveConfig::database_path() const {
    return data_dir / "hivemind.db";
}

} // namespace hivemind
