/**
 * @file peer_cursors.cpp
 * @brief Implementation of gossip peer cursors
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/peer_cursors.hpp"
#include "hivemind/utilities.hpp"

namespace hivemind {

PeerCursors::PeerCursors(HiveStorage& storage)
    : storage_(storage)
{
}

std::string PeerCursors::cursor_key(const std::string& peer) {
    return "peer:" + peer + ":cursor";
}

int64_t PeerCursors::get(const std::string& peer) {
    auto raw = storage_.get(cursor_key(peer));
    if (!raw) {
        return 0;
    }

    try {
        return std::stoll(*raw);
    } catch (const std::exception&) {
        utilities::log_warn("PeerCursors: Resetting unreadable cursor for " + peer);
        return 0;
    }
}

bool PeerCursors::advance(const std::string& peer, int64_t created_at_ms) {
    if (created_at_ms <= get(peer)) {
        return false;
    }

    storage_.put(cursor_key(peer), std::to_string(created_at_ms));
    return true;
}

} // namespace hivemind
