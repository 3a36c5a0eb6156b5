/**
 * @file hive_server.hpp
 * @brief HTTP listener that feeds requests into HiveService
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "hivemind/hive_service.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace hivemind {

/**
 * @brief HiveServer - cpp-httplib server bound to one address
 *
 * Every method and path is forwarded to HiveService; responses are
 * serialized as JSON.
 */
class HiveServer {
public:
    /**
     * @param service Request handlers
     * @param host Bind address
     * @param port Listen port (0 selects an ephemeral port)
     * @param handler_threads Number of HTTP handler threads
     */
    HiveServer(HiveService& service, std::string host, uint16_t port, size_t handler_threads);

    ~HiveServer();

    // Disable copy and move
    HiveServer(const HiveServer&) = delete;
    HiveServer& operator=(const HiveServer&) = delete;
    HiveServer(HiveServer&&) = delete;
    HiveServer& operator=(HiveServer&&) = delete;

    /**
     * @brief Bind and start accepting connections in the background
     * @return true if listening, false if the address could not be bound
     */
    bool start();

    void stop();

    bool is_running() const;

    /**
     * @brief Port actually bound (resolves an ephemeral port after start)
     */
    uint16_t port() const { return bound_port_; }

    const std::string& host() const { return host_; }

private:
    class HttpServerImpl;

    void register_routes();

    HiveService& service_;
    std::string host_;
    uint16_t requested_port_;
    uint16_t bound_port_;
    size_t handler_threads_;

    std::unique_ptr<HttpServerImpl> http_server_;
    std::thread listen_thread_;
    std::atomic<bool> running_;
};

} // namespace hivemind
