/**
 * @file gossip_engine.hpp
 * @brief Best-effort anti-entropy between Hivemind servers
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * On every tick each configured peer is polled for every local hive:
 * - fetch the peer's feed since the stored cursor (outside the hive actor)
 * - append each record through the hive's MessageStore (uid dedup)
 * - advance the cursor to the newest record now present locally
 *
 * Peer failures are logged and counted, never propagated.
 */

#pragma once

#include "hivemind/hive_registry.hpp"
#include "hivemind/message_store.hpp"
#include "hivemind/peer_client.hpp"
#include "hivemind/utilities.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hivemind {

// ============================================================================
// Record Ingestion (shared by pull and push)
// ============================================================================

/**
 * @brief Outcome of ingesting a batch of gossip records
 */
struct IngestResult {
    size_t accepted = 0;            ///< Newly stored
    size_t skipped = 0;             ///< Malformed, foreign hive or duplicate
    int64_t max_accepted_ms = -1;   ///< Newest createdAtMs among newly stored records
    int64_t max_batch_ms = -1;      ///< Newest createdAtMs among well-formed records
};

/**
 * @brief Validate and normalize one incoming record
 *
 * Requires non-empty string uid, agentId, hiveId and content, and hiveId
 * equal to hive_id. ts is derived from createdAtMs when missing and
 * createdAtMs from ts when missing; with neither, now_ms is used. Channel
 * defaults to "default"; source is always gossip.
 *
 * @return Candidate message, or std::nullopt if the record is malformed
 */
std::optional<HiveMessage> normalize_gossip_record(
    const nlohmann::json& record,
    const std::string& hive_id,
    int64_t now_ms
);

/**
 * @brief Append every well-formed record of a batch
 * @param store Message log of the receiving hive
 * @param records JSON array (anything else counts as an empty batch)
 * @param hive_id Receiving hive
 * @param now_ms Current time for records without timestamps
 */
IngestResult ingest_gossip_batch(
    MessageStore& store,
    const nlohmann::json& records,
    const std::string& hive_id,
    int64_t now_ms
);

// ============================================================================
// Gossip Engine
// ============================================================================

/**
 * @brief Result of one poll cycle
 */
struct GossipCycleReport {
    size_t peers_polled = 0;
    size_t peers_failed = 0;
    size_t accepted = 0;
    size_t skipped = 0;
};

/**
 * @brief Cumulative gossip counters
 */
struct GossipStats {
    uint64_t peer_polls = 0;
    uint64_t peer_failures = 0;
    uint64_t accepted = 0;
    uint64_t skipped = 0;
    uint64_t ticks = 0;
};

/**
 * @brief GossipEngine - Timer-driven peer polling
 *
 * Runs on its own io_context and threads, independent of request handling.
 * A peer whose previous poll is still running is skipped for that tick.
 */
class GossipEngine {
public:
    /**
     * @param registry Hives to synchronize (every hive present at poll time)
     * @param peers Peer base URLs
     * @param client Transport used to fetch peer feeds
     * @param interval Tick interval (raised to the 1 second floor)
     * @param clock Epoch millisecond source
     */
    GossipEngine(
        HiveRegistry& registry,
        std::vector<std::string> peers,
        std::shared_ptr<PeerClient> client,
        std::chrono::milliseconds interval,
        utilities::ClockFn clock = utilities::now_ms
    );

    ~GossipEngine();

    // Disable copy and move
    GossipEngine(const GossipEngine&) = delete;
    GossipEngine& operator=(const GossipEngine&) = delete;
    GossipEngine(GossipEngine&&) = delete;
    GossipEngine& operator=(GossipEngine&&) = delete;

    /**
     * @brief Start the background timer
     * @return false if already running or no peers are configured
     */
    bool start();

    /**
     * @brief Stop the timer and wait for in-flight polls to finish
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Poll every peer once, synchronously
     */
    GossipCycleReport run_cycle();

    /**
     * @brief Poll one peer for every local hive, synchronously
     */
    GossipCycleReport poll_peer(const std::string& peer);

    GossipStats get_stats() const;

    const std::vector<std::string>& peers() const { return peers_; }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    void schedule_tick();
    void on_tick(const asio::error_code& error);
    void record(const GossipCycleReport& report);

    HiveRegistry& registry_;
    std::vector<std::string> peers_;
    std::shared_ptr<PeerClient> client_;
    std::chrono::milliseconds interval_;
    utilities::ClockFn clock_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    asio::steady_timer timer_;
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> running_;

    std::set<std::string> in_flight_;
    std::mutex in_flight_mutex_;

    GossipStats stats_;
    mutable std::mutex stats_mutex_;
};

} // namespace hivemind
