/**
 * @file hive_service.hpp
 * @brief HTTP API of a Hivemind server, independent of the transport
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Routes each request to the owning hive actor:
 * - /challenge, /join, /gossip/push by body hive_id
 * - /gossip/messages by query hive_id
 * - /message, /messages by the hive prefix of the bearer token
 * - everything else by the default hive
 */

#pragma once

#include "hivemind/hive_registry.hpp"
#include "hivemind/utilities.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace hivemind {

/**
 * @brief Transport-neutral HTTP request
 */
struct ApiRequest {
    std::string method;                             ///< "GET", "POST", ...
    std::string path;                               ///< Path without query string
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;     ///< Keys in lowercase
    std::string body;

    /**
     * @brief Header value by case-insensitive name, empty if absent
     */
    std::string header(const std::string& name) const;

    std::optional<std::string> query_param(const std::string& name) const;
};

/**
 * @brief JSON response with status code
 */
struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief HiveService - Request handlers for every endpoint
 *
 * handle() never throws. HiveError becomes its mapped status with an
 * {"error": message} body; any other exception becomes a logged 500.
 */
class HiveService {
public:
    /**
     * @param registry Hive actors (configuration is taken from it)
     * @param clock Epoch millisecond source for message timestamps
     */
    explicit HiveService(HiveRegistry& registry, utilities::ClockFn clock = utilities::now_ms);

    // Disable copy and move
    HiveService(const HiveService&) = delete;
    HiveService& operator=(const HiveService&) = delete;
    HiveService(HiveService&&) = delete;
    HiveService& operator=(HiveService&&) = delete;

    ApiResponse handle(const ApiRequest& request);

private:
    ApiResponse dispatch(const ApiRequest& request);

    ApiResponse handle_health();
    ApiResponse handle_protocol();
    ApiResponse handle_challenge(const ApiRequest& request);
    ApiResponse handle_join(const ApiRequest& request);
    ApiResponse handle_post_message(const ApiRequest& request);
    ApiResponse handle_read_messages(const ApiRequest& request);
    ApiResponse handle_gossip_messages(const ApiRequest& request);
    ApiResponse handle_gossip_push(const ApiRequest& request);

    /**
     * @throws AuthenticationError if a gossip secret is configured and the
     *         request does not carry it
     */
    void require_gossip_secret(const ApiRequest& request) const;

    /**
     * @brief Actor owning the hive named by a bearer token
     * @throws AuthenticationError if the token is missing or names no known hive
     */
    std::pair<std::string, std::shared_ptr<HiveActor>> session_actor(const ApiRequest& request);

    /**
     * @brief Hive named in a request body field, or the default hive
     */
    std::string body_hive_id(const nlohmann::json& body) const;

    HiveRegistry& registry_;
    const HiveConfig& config_;
    utilities::ClockFn clock_;
};

} // namespace hivemind
