/**
 * @file hive_node.cpp
 * @brief Implementation of the Hivemind server orchestrator
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/hive_node.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/memory_storage.hpp"
#include "hivemind/protocol.hpp"
#include "hivemind/sqlite_storage.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace hivemind {

using namespace hivemind::utilities;

namespace {

// Interval between maintenance passes in run()
constexpr auto MAINTENANCE_INTERVAL = std::chrono::seconds(30);

} // namespace

HiveNode::HiveNode(HiveConfig config, std::shared_ptr<PeerClient> peer_client, ClockFn clock)
    : config_(std::move(config))
    , peer_client_(std::move(peer_client))
    , clock_(std::move(clock))
    , running_(false)
    , maintenance_active_(false)
{
}

HiveNode::~HiveNode() {
    if (running_) {
        stop();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool HiveNode::start() {
    if (running_) {
        log_warn("HiveNode: Already running");
        return false;
    }

    auto level = parse_log_level(config_.log_level);
    initialize_logging(config_.log_file, level ? *level : LogLevel::INFO);

    log_info("HiveNode: Starting " + std::string(protocol::PROTOCOL_VERSION) + " server...");

    try {
        config_.validate();

        if (!HiveCrypto::initialize()) {
            log_error("HiveNode: Failed to initialize libsodium");
            return false;
        }

        // Worker threads for hive actors
        io_context_.restart();
        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            io_context_.get_executor()
        );

        size_t num_threads = config_.worker_threads;
        if (num_threads == 0) {
            num_threads = std::max(2u, std::thread::hardware_concurrency());
        }

        for (size_t i = 0; i < num_threads; ++i) {
            worker_threads_.emplace_back([this]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    log_error("HiveNode: Worker thread exception: " + std::string(e.what()));
                }
            });
        }

        if (!initialize_subsystems()) {
            log_error("HiveNode: Failed to initialize subsystems");
            running_ = true;
            stop();
            return false;
        }

        start_time_ = std::chrono::steady_clock::now();
        running_ = true;

        log_info("HiveNode: Started with " + std::to_string(num_threads) + " worker threads on port " +
                 std::to_string(server_->port()));
        return true;

    } catch (const std::exception& e) {
        log_error("HiveNode: Exception during start: " + std::string(e.what()));
        running_ = true;
        stop();
        return false;
    }
}

bool HiveNode::initialize_subsystems() {
    registry_ = std::make_unique<HiveRegistry>(config_, make_storage_factory(), io_context_, clock_);

    // The default hive always exists so gossip covers it from the first tick
    registry_->get_or_create(config_.default_hive_id);

    service_ = std::make_unique<HiveService>(*registry_, clock_);

    size_t handler_threads = std::max<size_t>(worker_threads_.size(), 4);
    server_ = std::make_unique<HiveServer>(*service_, config_.host, config_.port, handler_threads);
    if (!server_->start()) {
        return false;
    }

    if (!config_.peers.empty()) {
        auto client = peer_client_;
        if (!client) {
            client = std::make_shared<HttpPeerClient>(config_.gossip_secret, config_.gossip_timeout);
        }
        gossip_ = std::make_unique<GossipEngine>(
            *registry_,
            config_.peers,
            client,
            config_.gossip_interval,
            clock_
        );
        gossip_->start();
    } else {
        log_info("HiveNode: No gossip peers configured");
    }

    return true;
}

StorageFactory HiveNode::make_storage_factory() const {
    if (config_.storage == StorageBackend::SQLITE) {
        log_info("HiveNode: Using SQLite storage at " + config_.database_path().string());
        return SqliteStorage::factory(config_.database_path().string());
    }

    log_info("HiveNode: Using in-memory storage");
    return MemoryStorage::factory();
}

void HiveNode::stop() {
    if (!running_) {
        log_warn("HiveNode: Not running");
        return;
    }

    log_info("HiveNode: Stopping...");
    {
        // A maintenance pass in run() still needs the actors, so let it finish
        std::unique_lock<std::mutex> lock(run_mutex_);
        running_ = false;
        run_cv_.notify_all();
        run_cv_.wait(lock, [this]() { return !maintenance_active_; });
    }

    try {
        if (gossip_) {
            gossip_->stop();
        }

        // No new requests reach the actors once the listener is down
        if (server_) {
            server_->stop();
        }

        work_guard_.reset();
        io_context_.stop();

        for (auto& thread : worker_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        worker_threads_.clear();

        log_info("HiveNode: Stopped successfully");

    } catch (const std::exception& e) {
        log_error("HiveNode: Exception during stop: " + std::string(e.what()));
    }
}

void HiveNode::run() {
    if (!running_) {
        log_error("HiveNode: Cannot run - not started");
        return;
    }

    log_info("HiveNode: Entering main loop (Ctrl+C to stop)");

    std::unique_lock<std::mutex> lock(run_mutex_);
    while (running_) {
        run_cv_.wait_for(lock, MAINTENANCE_INTERVAL, [this]() { return !running_; });
        if (!running_) {
            break;
        }

        maintenance_active_ = true;
        lock.unlock();
        try {
            evict_expired();
        } catch (const std::exception& e) {
            log_error("HiveNode: Exception in main loop: " + std::string(e.what()));
        }
        lock.lock();
        maintenance_active_ = false;
        run_cv_.notify_all();
    }

    log_info("HiveNode: Exited main loop");
}

bool HiveNode::is_running() const {
    return running_;
}

uint16_t HiveNode::port() const {
    return server_ ? server_->port() : 0;
}

HiveRegistry& HiveNode::registry() {
    if (!registry_) {
        throw std::logic_error("HiveNode: registry requested before start");
    }
    return *registry_;
}

GossipEngine* HiveNode::gossip() {
    return gossip_.get();
}

// ============================================================================
// Maintenance and status
// ============================================================================

void HiveNode::evict_expired() {
    size_t challenges = 0;
    size_t sessions = 0;
    for (const auto& actor : registry_->actors()) {
        auto evicted = actor->execute([](HiveContext& ctx) {
            return std::make_pair(ctx.challenges.evict_expired(), ctx.sessions.evict_expired());
        });
        challenges += evicted.first;
        sessions += evicted.second;
    }

    if (challenges > 0 || sessions > 0) {
        log_info("HiveNode: Evicted " + std::to_string(challenges) + " expired challenges and " +
                 std::to_string(sessions) + " expired sessions");
    }
}

HiveNodeStats HiveNode::get_stats() const {
    HiveNodeStats stats;
    stats.hives = registry_ ? registry_->size() : 0;
    stats.gossip_enabled = gossip_ && gossip_->is_running();
    if (gossip_) {
        stats.gossip = gossip_->get_stats();
    }
    if (running_) {
        stats.uptime_seconds = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count());
    }
    return stats;
}

void HiveNode::print_status() const {
    auto stats = get_stats();

    std::cout << "\n=== Hivemind Server Status ===\n";
    std::cout << "Protocol: " << protocol::PROTOCOL_VERSION << "\n";
    std::cout << "Listening: " << config_.host << ":" << port() << "\n";
    std::cout << "Default hive: " << config_.default_hive_id << "\n";
    std::cout << "Hives: " << stats.hives << "\n";
    std::cout << "Gossip: " << (stats.gossip_enabled ? "enabled" : "disabled")
              << " (" << config_.peers.size() << " peers)\n";
    if (stats.gossip_enabled) {
        std::cout << "Gossip polls: " << stats.gossip.peer_polls
                  << " (failed " << stats.gossip.peer_failures << ")\n";
        std::cout << "Gossip accepted/skipped: " << stats.gossip.accepted
                  << "/" << stats.gossip.skipped << "\n";
    }
    std::cout << "Uptime: " << stats.uptime_seconds << "s\n";
    std::cout << "==============================\n\n";
}

} // namespace hivemind
