/**
 * @file memory_storage.cpp
 * @brief Implementation of in-process HiveStorage
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/memory_storage.hpp"
#include "hivemind/utilities.hpp"

namespace hivemind {

std::optional<std::string> MemoryStorage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
}

void MemoryStorage::put_batch(const std::vector<StorageEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Map insertion does not fail part way except on allocation failure
    for (const auto& entry : entries) {
        entries_[entry.first] = entry.second;
    }
}

bool MemoryStorage::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

size_t MemoryStorage::remove_batch(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (const auto& key : keys) {
        removed += entries_.erase(key);
    }
    return removed;
}

std::vector<StorageEntry> MemoryStorage::list(const ListOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<StorageEntry> result;
    auto in_range = [&options](const std::string& key) {
        return utilities::starts_with(key, options.prefix);
    };
    auto full = [&options, &result]() {
        return options.limit != 0 && result.size() >= options.limit;
    };

    if (!options.reverse) {
        auto it = (options.start_after.empty() || options.start_after < options.prefix)
            ? entries_.lower_bound(options.prefix)
            : entries_.upper_bound(options.start_after);

        for (; it != entries_.end() && in_range(it->first) && !full(); ++it) {
            result.push_back(*it);
        }
    } else {
        // First key past the prefix range, or past start_after
        auto it = entries_.end();
        if (!options.start_after.empty()) {
            it = entries_.lower_bound(options.start_after);
        } else if (!options.prefix.empty()) {
            it = entries_.lower_bound(options.prefix);
            while (it != entries_.end() && in_range(it->first)) {
                ++it;
            }
        }

        while (it != entries_.begin() && !full()) {
            --it;
            if (!in_range(it->first)) {
                if (it->first < options.prefix) {
                    break;
                }
                continue;
            }
            result.push_back(*it);
        }
    }

    return result;
}

size_t MemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

StorageFactory MemoryStorage::factory() {
    return [](const std::string&) -> std::unique_ptr<HiveStorage> {
        return std::make_unique<MemoryStorage>();
    };
}

} // namespace hivemind
