/**
 * @file hive_registry.hpp
 * @brief Maps hive ids to their actors, creating actors on first use
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "hivemind/hive_actor.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/storage.hpp"
#include "hivemind/utilities.hpp"

#include <asio.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hivemind {

/**
 * @brief HiveRegistry - Routing table from hive id to HiveActor
 *
 * Thread-safe. Actors are never removed while the registry lives.
 */
class HiveRegistry {
public:
    /**
     * @param config Configuration shared by every hive (copied)
     * @param storage_factory Creates the storage of a new hive
     * @param io_context Executor the actors' strands run on
     * @param clock Epoch millisecond source handed to every actor
     */
    HiveRegistry(
        const HiveConfig& config,
        StorageFactory storage_factory,
        asio::io_context& io_context,
        utilities::ClockFn clock = utilities::now_ms
    );

    // Disable copy and move
    HiveRegistry(const HiveRegistry&) = delete;
    HiveRegistry& operator=(const HiveRegistry&) = delete;
    HiveRegistry(HiveRegistry&&) = delete;
    HiveRegistry& operator=(HiveRegistry&&) = delete;

    /**
     * @brief Actor for a hive, created if needed
     * @throws ValidationError if hive_id is not a valid identifier
     */
    std::shared_ptr<HiveActor> get_or_create(const std::string& hive_id);

    /**
     * @return Actor, or nullptr if the hive has not been seen
     */
    std::shared_ptr<HiveActor> find(const std::string& hive_id) const;

    /**
     * @brief Snapshot of all actors, ordered by hive id
     */
    std::vector<std::shared_ptr<HiveActor>> actors() const;

    size_t size() const;

    const HiveConfig& config() const { return config_; }

private:
    HiveConfig config_;
    StorageFactory storage_factory_;
    asio::io_context& io_context_;
    utilities::ClockFn clock_;

    std::map<std::string, std::shared_ptr<HiveActor>> actors_;
    mutable std::mutex mutex_;
};

} // namespace hivemind
