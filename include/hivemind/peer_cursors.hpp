/**
 * @file peer_cursors.hpp
 * @brief Per-peer gossip high-water marks of one hive
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "hivemind/storage.hpp"

#include <cstdint>
#include <string>

namespace hivemind {

/**
 * @brief PeerCursors - How far each peer's feed has been consumed
 *
 * Stored under "peer:<peer url>:cursor" as createdAtMs. Cursors never move
 * backwards.
 */
class PeerCursors {
public:
    explicit PeerCursors(HiveStorage& storage);

    /**
     * @return Stored cursor, 0 when the peer has never been polled
     */
    int64_t get(const std::string& peer);

    /**
     * @brief Raise the cursor to created_at_ms if that is ahead of it
     * @return true if the cursor moved
     */
    bool advance(const std::string& peer, int64_t created_at_ms);

private:
    static std::string cursor_key(const std::string& peer);

    HiveStorage& storage_;
};

} // namespace hivemind
