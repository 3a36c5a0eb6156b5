/**
 * @file hive_node.hpp
 * @brief Hivemind server orchestrator - wires every component together
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * HiveNode owns:
 * - The actor executor (asio io_context and worker threads)
 * - The hive registry and its storage backend
 * - The HTTP service and listener
 * - The gossip engine (when peers are configured)
 */

#pragma once

#include "hivemind/gossip_engine.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/hive_registry.hpp"
#include "hivemind/hive_server.hpp"
#include "hivemind/hive_service.hpp"
#include "hivemind/peer_client.hpp"
#include "hivemind/utilities.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace hivemind {

/**
 * @brief HiveNode statistics
 */
struct HiveNodeStats {
    size_t hives = 0;                   ///< Hives with an actor
    bool gossip_enabled = false;        ///< Whether the gossip engine runs
    GossipStats gossip;                 ///< Cumulative gossip counters
    uint64_t uptime_seconds = 0;        ///< Time since start()
};

/**
 * @brief HiveNode - Complete Hivemind server
 */
class HiveNode {
public:
    /**
     * @param config Server configuration (validated in start())
     * @param peer_client Gossip transport; nullptr selects HTTP
     * @param clock Epoch millisecond source
     */
    explicit HiveNode(
        HiveConfig config,
        std::shared_ptr<PeerClient> peer_client = nullptr,
        utilities::ClockFn clock = utilities::now_ms
    );

    ~HiveNode();

    // Disable copy and move
    HiveNode(const HiveNode&) = delete;
    HiveNode& operator=(const HiveNode&) = delete;
    HiveNode(HiveNode&&) = delete;
    HiveNode& operator=(HiveNode&&) = delete;

    /**
     * @brief Initialize subsystems and start serving
     * @return true on success
     */
    bool start();

    /**
     * @brief Stop serving, gossip and worker threads
     */
    void stop();

    /**
     * @brief Block until stop() is called, evicting expired challenges and sessions periodically
     */
    void run();

    bool is_running() const;

    /**
     * @brief Port the HTTP listener is bound to (0 before start)
     */
    uint16_t port() const;

    const HiveConfig& config() const { return config_; }

    /// Valid after start()
    HiveRegistry& registry();

    /// nullptr when no peers are configured or before start()
    GossipEngine* gossip();

    HiveNodeStats get_stats() const;

    void print_status() const;

private:
    bool initialize_subsystems();
    StorageFactory make_storage_factory() const;
    void evict_expired();

    HiveConfig config_;
    std::shared_ptr<PeerClient> peer_client_;
    utilities::ClockFn clock_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> worker_threads_;

    std::unique_ptr<HiveRegistry> registry_;
    std::unique_ptr<HiveService> service_;
    std::unique_ptr<HiveServer> server_;
    std::unique_ptr<GossipEngine> gossip_;

    std::atomic<bool> running_;
    std::chrono::steady_clock::time_point start_time_;

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool maintenance_active_;   ///< Guarded by run_mutex_
};

} // namespace hivemind
