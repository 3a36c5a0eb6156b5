/**
 * @file hive_registry.cpp
 * @brief Implementation of hive routing table
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/hive_registry.hpp"
#include "hivemind/errors.hpp"

namespace hivemind {

using namespace hivemind::utilities;

HiveRegistry::HiveRegistry(
    const HiveConfig& config,
    StorageFactory storage_factory,
    asio::io_context& io_context,
    ClockFn clock
)
    : config_(config)
    , storage_factory_(std::move(storage_factory))
    , io_context_(io_context)
    , clock_(std::move(clock))
{
    if (!storage_factory_) {
        throw std::invalid_argument("HiveRegistry requires a storage factory");
    }
}

std::shared_ptr<HiveActor> HiveRegistry::get_or_create(const std::string& hive_id) {
    if (!config::validate_identifier(hive_id)) {
        throw ValidationError("hive_id is not a valid identifier");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = actors_.find(hive_id);
    if (it != actors_.end()) {
        return it->second;
    }

    auto actor = std::make_shared<HiveActor>(
        hive_id,
        storage_factory_(hive_id),
        config_,
        io_context_,
        clock_
    );
    actors_.emplace(hive_id, actor);

    return actor;
}

std::shared_ptr<HiveActor> HiveRegistry::find(const std::string& hive_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = actors_.find(hive_id);
    return it == actors_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<HiveActor>> HiveRegistry::actors() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<HiveActor>> result;
    result.reserve(actors_.size());
    for (const auto& entry : actors_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t HiveRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actors_.size();
}

} // namespace hivemind
