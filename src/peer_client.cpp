/**
 * @file peer_client.cpp
 * @brief Implementation of the HTTP gossip peer client
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/peer_client.hpp"
#include "hivemind/hive_config.hpp"

#include <httplib.h>

using json = nlohmann::json;

namespace hivemind {

PeerEndpoint parse_peer_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw PeerError("peer URL has no scheme: " + url);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);

    PeerEndpoint endpoint;
    endpoint.origin = url.substr(0, path_start);
    if (path_start != std::string::npos) {
        endpoint.base_path = url.substr(path_start);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    if (endpoint.origin.size() <= host_start) {
        throw PeerError("peer URL has no host: " + url);
    }

    return endpoint;
}

HttpPeerClient::HttpPeerClient(std::string gossip_secret, std::chrono::milliseconds timeout)
    : gossip_secret_(std::move(gossip_secret))
    , timeout_(timeout)
{
}

json HttpPeerClient::fetch_messages(
    const std::string& peer,
    const std::string& hive_id,
    int64_t since_ms
) {
    PeerEndpoint endpoint = parse_peer_url(peer);

    httplib::Client client(endpoint.origin);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);
    client.set_write_timeout(timeout_);

    httplib::Headers headers;
    if (!gossip_secret_.empty()) {
        headers.emplace(config::GOSSIP_HEADER, gossip_secret_);
    }

    httplib::Params params;
    params.emplace("hive_id", hive_id);
    params.emplace("since_ms", std::to_string(since_ms));

    auto res = client.Get(endpoint.base_path + "/gossip/messages", params, headers);
    if (!res) {
        throw PeerError("peer " + peer + " unreachable: " + httplib::to_string(res.error()));
    }

    if (res->status != 200) {
        throw PeerError("peer " + peer + " answered HTTP " + std::to_string(res->status));
    }

    json payload = json::parse(res->body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw PeerError("peer " + peer + " sent a malformed payload");
    }

    auto messages = payload.find("messages");
    if (messages == payload.end() || !messages->is_array()) {
        throw PeerError("peer " + peer + " sent no messages array");
    }

    return *messages;
}

} // namespace hivemind
