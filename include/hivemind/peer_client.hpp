/**
 * @file peer_client.hpp
 * @brief Fetches a peer server's gossip feed
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace hivemind {

/**
 * @brief Peer unreachable, non-success status or malformed payload
 */
class PeerError : public std::runtime_error {
public:
    explicit PeerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief PeerClient - Source of gossip records from another server
 */
class PeerClient {
public:
    virtual ~PeerClient() = default;

    /**
     * @brief GET <peer>/gossip/messages?hive_id=&since_ms=
     * @param peer Peer base URL without trailing slash
     * @param hive_id Hive to pull
     * @param since_ms Inclusive createdAtMs lower bound
     * @return The "messages" array of the response
     * @throws PeerError on any transport, status or payload failure
     */
    virtual nlohmann::json fetch_messages(
        const std::string& peer,
        const std::string& hive_id,
        int64_t since_ms
    ) = 0;
};

/**
 * @brief Components of a peer base URL
 */
struct PeerEndpoint {
    std::string origin;     ///< scheme://host[:port]
    std::string base_path;  ///< Path prefix without trailing slash, may be empty
};

/**
 * @brief Split a base URL into origin and path prefix
 * @throws PeerError if the URL has no scheme or host
 */
PeerEndpoint parse_peer_url(const std::string& url);

/**
 * @brief HttpPeerClient - PeerClient over cpp-httplib
 *
 * Sends the shared gossip secret header when one is configured. Connect,
 * read and write are each bounded by the timeout.
 */
class HttpPeerClient : public PeerClient {
public:
    HttpPeerClient(std::string gossip_secret, std::chrono::milliseconds timeout);

    nlohmann::json fetch_messages(
        const std::string& peer,
        const std::string& hive_id,
        int64_t since_ms
    ) override;

private:
    std::string gossip_secret_;
    std::chrono::milliseconds timeout_;
};

} // namespace hivemind
