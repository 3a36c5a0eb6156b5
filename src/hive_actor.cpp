/**
 * @file hive_actor.cpp
 * @brief Implementation of the per-hive actor
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/hive_actor.hpp"

namespace hivemind {

using namespace hivemind::utilities;

namespace {

std::unique_ptr<HiveStorage> require_storage(std::unique_ptr<HiveStorage> storage) {
    if (!storage) {
        throw std::invalid_argument("HiveContext requires storage");
    }
    return storage;
}

} // namespace

// ============================================================================
// HiveContext
// ============================================================================

HiveContext::HiveContext(
    std::string id,
    std::unique_ptr<HiveStorage> hive_storage,
    const HiveConfig& config,
    ClockFn clock
)
    : hive_id(std::move(id))
    , storage(require_storage(std::move(hive_storage)))
    , challenges(*storage, config.challenge_ttl, clock)
    , sessions(*storage, config.session_ttl, clock)
    , authenticator(
        challenges,
        sessions,
        JoinPolicy{config.max_clock_skew, config.device_proof_required, config.device_proof_ttl},
        clock)
    , messages(*storage, hive_id)
    , cursors(*storage)
{
}

// ============================================================================
// HiveActor
// ============================================================================

HiveActor::HiveActor(
    const std::string& hive_id,
    std::unique_ptr<HiveStorage> storage,
    const HiveConfig& config,
    asio::io_context& io_context,
    ClockFn clock
)
    : io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , context_(hive_id, std::move(storage), config, std::move(clock))
{
    log_info("HiveActor: Created actor for hive '" + hive_id + "'");
}

void HiveActor::post(std::function<void(HiveContext&)> task) {
    asio::post(strand_, [this, task = std::move(task)]() {
        try {
            task(context_);
        } catch (const std::exception& e) {
            log_error("HiveActor: Task failed in hive '" + context_.hive_id + "': " + e.what());
        }
    });
}

} // namespace hivemind
