/**
 * @file hive_server.cpp
 * @brief Implementation of the cpp-httplib listener
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/hive_server.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/utilities.hpp"

#include <httplib.h>

#include <algorithm>

namespace hivemind {

using namespace hivemind::utilities;

// Keeps httplib out of the public header
class HiveServer::HttpServerImpl {
public:
    httplib::Server server;
};

namespace {

ApiRequest to_api_request(const httplib::Request& req) {
    ApiRequest request;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;

    for (const auto& param : req.params) {
        // First occurrence wins for repeated query keys
        request.query.emplace(param.first, param.second);
    }
    for (const auto& header : req.headers) {
        request.headers.emplace(to_lowercase(header.first), header.second);
    }

    return request;
}

} // namespace

HiveServer::HiveServer(HiveService& service, std::string host, uint16_t port, size_t handler_threads)
    : service_(service)
    , host_(std::move(host))
    , requested_port_(port)
    , bound_port_(0)
    , handler_threads_(std::max<size_t>(handler_threads, 1))
    , http_server_(std::make_unique<HttpServerImpl>())
    , running_(false)
{
    register_routes();
}

HiveServer::~HiveServer() {
    stop();
}

void HiveServer::register_routes() {
    auto& server = http_server_->server;

    server.set_payload_max_length(config::MAX_BODY_SIZE);

    size_t threads = handler_threads_;
    server.new_task_queue = [threads]() { return new httplib::ThreadPool(threads); };

    auto forward = [this](const httplib::Request& req, httplib::Response& res) {
        ApiResponse response = service_.handle(to_api_request(req));
        res.status = response.status;
        res.set_content(response.body.dump(2), "application/json");
    };

    server.Get(".*", forward);
    server.Post(".*", forward);
    server.Put(".*", forward);
    server.Patch(".*", forward);
    server.Delete(".*", forward);
    server.Options(".*", forward);

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string reason = "unknown";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        } catch (const std::exception& e) {
            reason = e.what();
        }
        log_error("HiveServer: Handler failure on " + req.path + ": " + reason);
        res.status = 500;
        res.set_content(R"({"error": "internal error"})", "application/json");
    });
}

bool HiveServer::start() {
    if (running_) {
        log_warn("HiveServer: Already running");
        return false;
    }

    auto& server = http_server_->server;

    if (requested_port_ == 0) {
        int port = server.bind_to_any_port(host_);
        if (port <= 0) {
            log_error("HiveServer: Failed to bind ephemeral port on " + host_);
            return false;
        }
        bound_port_ = static_cast<uint16_t>(port);
    } else {
        if (!server.bind_to_port(host_, requested_port_)) {
            log_error("HiveServer: Failed to bind " + host_ + ":" + std::to_string(requested_port_));
            return false;
        }
        bound_port_ = requested_port_;
    }

    running_ = true;
    listen_thread_ = std::thread([this]() {
        if (!http_server_->server.listen_after_bind()) {
            log_error("HiveServer: Listener exited with an error");
        }
        running_ = false;
    });

    http_server_->server.wait_until_ready();

    log_info("HiveServer: Listening on " + host_ + ":" + std::to_string(bound_port_));
    return true;
}

void HiveServer::stop() {
    if (!listen_thread_.joinable()) {
        return;
    }

    log_info("HiveServer: Stopping...");
    http_server_->server.stop();
    listen_thread_.join();
    running_ = false;

    log_info("HiveServer: Stopped");
}

bool HiveServer::is_running() const {
    return running_;
}

} // namespace hivemind
