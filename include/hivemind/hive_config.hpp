/**
 * @file hive_config.hpp
 * @brief Protocol limits, timing defaults and runtime configuration
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hivemind {
namespace config {

// ============================================================================
// Authentication Timing
// ============================================================================

/// Lifetime of an issued challenge
constexpr auto CHALLENGE_TTL = std::chrono::minutes(2);

/// Lifetime of a session token
constexpr auto SESSION_TTL = std::chrono::hours(24);

/// Maximum distance between a join timestamp and the server clock
constexpr auto MAX_CLOCK_SKEW = std::chrono::minutes(2);

/// Freshness window for device proofs
constexpr auto DEVICE_PROOF_TTL = std::chrono::minutes(5);

// ============================================================================
// Message Limits
// ============================================================================

/// Default page size for /messages
constexpr size_t DEFAULT_MESSAGES_LIMIT = 50;

/// Hard ceiling for /messages
constexpr size_t MAX_MESSAGES_LIMIT = 200;

/// Default and maximum batch size on the gossip feed
constexpr size_t MAX_GOSSIP_BATCH = 500;

/// Digits used for message ids in storage keys
constexpr size_t MESSAGE_KEY_WIDTH = 12;

/// Digits used for createdAtMs in storage keys
constexpr size_t TIME_KEY_WIDTH = 15;

/// Largest createdAtMs that fits TIME_KEY_WIDTH
constexpr int64_t MAX_MESSAGE_TIME_MS = 999999999999999LL;

/// Maximum identifier length (agent ID, hive ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 128;

/// Maximum request body accepted by the HTTP server (1MB)
constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

// ============================================================================
// Gossip
// ============================================================================

/// Default poll interval
constexpr auto GOSSIP_INTERVAL = std::chrono::milliseconds(5000);

/// Poll interval floor
constexpr auto MIN_GOSSIP_INTERVAL = std::chrono::milliseconds(1000);

/// Per-peer HTTP timeout
constexpr auto GOSSIP_TIMEOUT = std::chrono::milliseconds(3000);

/// Header carrying the shared gossip secret
constexpr const char* GOSSIP_HEADER = "x-hivemind-gossip";

// ============================================================================
// Network
// ============================================================================

constexpr const char* DEFAULT_HOST = "0.0.0.0";

constexpr uint16_t DEFAULT_PORT = 8787;

constexpr const char* DEFAULT_HIVE_ID = "openclaw-devnet";

/**
 * @brief Validate identifier (non-empty, bounded, printable, no whitespace)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

} // namespace config

/**
 * @brief Storage backend selection
 */
enum class StorageBackend {
    MEMORY,
    SQLITE
};

/**
 * @brief Runtime configuration of a Hivemind server
 *
 * Defaults mirror the constants in hivemind::config. from_environment()
 * reads the HIVEMIND_*, HIVE_ID and OPENCLAW_DEVICE_* variables.
 */
struct HiveConfig {
    std::string host = config::DEFAULT_HOST;
    uint16_t port = config::DEFAULT_PORT;
    std::string default_hive_id = config::DEFAULT_HIVE_ID;

    std::vector<std::string> peers;
    std::string gossip_secret;
    std::chrono::milliseconds gossip_interval = config::GOSSIP_INTERVAL;
    std::chrono::milliseconds gossip_timeout = config::GOSSIP_TIMEOUT;

    bool device_proof_required = false;
    std::chrono::milliseconds device_proof_ttl = config::DEVICE_PROOF_TTL;

    std::chrono::milliseconds challenge_ttl = config::CHALLENGE_TTL;
    std::chrono::milliseconds session_ttl = config::SESSION_TTL;
    std::chrono::milliseconds max_clock_skew = config::MAX_CLOCK_SKEW;

    StorageBackend storage = StorageBackend::MEMORY;
    std::filesystem::path data_dir = "./data";

    size_t worker_threads = 0;  ///< 0 selects hardware concurrency

    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Build configuration from the process environment
     *
     * Unparseable numbers fall back to their defaults with a warning. The
     * gossip interval is raised to the 1 second floor.
     */
    static HiveConfig from_environment();

    /**
     * @brief Reject out-of-range values
     * @throws ValidationError describing the first invalid field
     */
    void validate() const;

    /**
     * @brief Normalize a comma-separated peer list
     *
     * Entries are trimmed, empty entries dropped, trailing slashes removed.
     */
    static std::vector<std::string> parse_peers(const std::string& peer_list);

    /**
     * @brief Path of the SQLite database under data_dir
     */
    std::filesystem::path database_path() const;
};

} // namespace hivemind
