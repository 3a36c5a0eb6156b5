/**
 * @file main.cpp
 * @brief hivemind-server daemon entry point
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Configuration comes from the environment (see HiveConfig::from_environment).
 * SIGINT or SIGTERM triggers a graceful shutdown.
 */

#include "hivemind/errors.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/hive_node.hpp"
#include "hivemind/utilities.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

using namespace hivemind;
using namespace hivemind::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int) {
    g_shutdown = true;
}

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--help]\n\n";
    std::cout << "Environment:\n";
    std::cout << "  HIVEMIND_HOST, HIVEMIND_PORT        Listen address (default 0.0.0.0:8787)\n";
    std::cout << "  HIVE_ID                             Default hive (default openclaw-devnet)\n";
    std::cout << "  HIVEMIND_PEERS                      Comma-separated peer base URLs\n";
    std::cout << "  HIVEMIND_GOSSIP_TOKEN               Shared gossip secret\n";
    std::cout << "  HIVEMIND_GOSSIP_INTERVAL_MS         Gossip poll interval (min 1000)\n";
    std::cout << "  HIVEMIND_GOSSIP_TIMEOUT_MS          Per-peer HTTP timeout\n";
    std::cout << "  HIVEMIND_CHALLENGE_TTL_MS           Challenge lifetime\n";
    std::cout << "  HIVEMIND_SESSION_TTL_MS             Session lifetime\n";
    std::cout << "  HIVEMIND_MAX_CLOCK_SKEW_MS          Join timestamp skew bound\n";
    std::cout << "  OPENCLAW_DEVICE_PROOF_REQUIRED      Require device proofs on join\n";
    std::cout << "  OPENCLAW_DEVICE_PROOF_TTL_MS        Device proof freshness window\n";
    std::cout << "  HIVEMIND_STORAGE                    memory | sqlite\n";
    std::cout << "  HIVEMIND_DATA_DIR                   SQLite data directory\n";
    std::cout << "  HIVEMIND_WORKER_THREADS             Actor worker threads\n";
    std::cout << "  HIVEMIND_LOG_LEVEL, HIVEMIND_LOG_FILE\n\n";
}

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return 0;
    }

    HiveConfig config;
    try {
        config = HiveConfig::from_environment();
        config.validate();
    } catch (const ValidationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    HiveNode node(config);
    if (!node.start()) {
        std::cerr << "Failed to start Hivemind server\n";
        return 1;
    }

    node.print_status();

    std::thread maintenance([&node]() { node.run(); });

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log_info("Received shutdown signal");
    node.stop();

    if (maintenance.joinable()) {
        maintenance.join();
    }

    node.print_status();
    return 0;
}
