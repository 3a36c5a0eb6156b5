/**
 * @file message_store.cpp
 * @brief Implementation of the per-hive message log
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/message_store.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/utilities.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {

const std::string MESSAGE_PREFIX = "msg:";
const std::string UID_PREFIX = "uid:";
const std::string TIME_PREFIX = "ts:";
const std::string NEXT_ID_KEY = "meta:nextMessageId";

// Largest id that still fits the fixed key width
constexpr int64_t MAX_KEY_ID = 999999999999LL;

size_t clamp_limit(size_t limit, size_t ceiling) {
    return std::min(std::max<size_t>(limit, 1), ceiling);
}

} // namespace

MessageStore::MessageStore(HiveStorage& storage, std::string hive_id)
    : storage_(storage)
    , hive_id_(std::move(hive_id))
{
}

std::string MessageStore::message_key(int64_t id) {
    return MESSAGE_PREFIX + pad_number(id, config::MESSAGE_KEY_WIDTH);
}

std::string MessageStore::time_key(int64_t created_at_ms, int64_t id) {
    return TIME_PREFIX + pad_number(created_at_ms, config::TIME_KEY_WIDTH) + ":" +
           pad_number(id, config::MESSAGE_KEY_WIDTH);
}

std::optional<HiveMessage> MessageStore::load(const std::string& key) {
    auto raw = storage_.get(key);
    if (!raw) {
        return std::nullopt;
    }

    json parsed = json::parse(*raw, nullptr, false);
    if (parsed.is_discarded()) {
        log_error("MessageStore: Unreadable record at " + key);
        return std::nullopt;
    }

    return HiveMessage::from_json(parsed);
}

// ============================================================================
// Append
// ============================================================================

std::optional<HiveMessage> MessageStore::append(const HiveMessage& candidate) {
    if (candidate.uid.empty()) {
        throw ValidationError("message uid is required");
    }
    if (candidate.hive_id != hive_id_) {
        throw ValidationError("message belongs to hive '" + candidate.hive_id + "'");
    }
    if (candidate.created_at_ms < 0 || candidate.created_at_ms > config::MAX_MESSAGE_TIME_MS) {
        throw ValidationError("message createdAtMs out of range");
    }

    std::lock_guard<std::mutex> lock(append_mutex_);

    std::string uid_key = UID_PREFIX + candidate.uid;
    if (storage_.get(uid_key)) {
        return std::nullopt;
    }

    int64_t id = 1;
    if (auto raw = storage_.get(NEXT_ID_KEY)) {
        try {
            id = std::stoll(*raw);
        } catch (const std::exception&) {
            throw StorageError("corrupt message id counter");
        }
    }
    if (id > MAX_KEY_ID) {
        throw StorageError("message id space exhausted");
    }

    HiveMessage message = candidate;
    message.id = id;

    std::string id_text = std::to_string(id);
    storage_.put_batch({
        {message_key(id), message.to_json().dump()},
        {uid_key, id_text},
        {time_key(message.created_at_ms, id), id_text},
        {NEXT_ID_KEY, std::to_string(id + 1)}
    });

    log_debug("MessageStore: Stored message " + id_text + " (" +
              message_source_to_string(message.source) + ") in hive '" + hive_id_ + "'");

    return message;
}

// ============================================================================
// Reads
// ============================================================================

std::vector<HiveMessage> MessageStore::read_since(const std::string& hive_id, int64_t since_id, size_t limit) {
    std::vector<HiveMessage> messages;
    if (hive_id != hive_id_) {
        return messages;
    }

    // Newest records first, stopping at the cursor
    ListOptions options;
    options.prefix = MESSAGE_PREFIX;
    options.limit = clamp_limit(limit, config::MAX_MESSAGES_LIMIT);
    options.reverse = true;

    for (const auto& entry : storage_.list(options)) {
        json parsed = json::parse(entry.second, nullptr, false);
        if (parsed.is_discarded()) {
            continue;
        }
        auto message = HiveMessage::from_json(parsed);
        if (!message || message->hive_id != hive_id_) {
            continue;
        }
        if (message->id <= since_id) {
            break;
        }
        messages.push_back(std::move(*message));
    }

    std::reverse(messages.begin(), messages.end());
    return messages;
}

std::vector<HiveMessage> MessageStore::read_since_time(const std::string& hive_id, int64_t since_ms, size_t limit) {
    std::vector<HiveMessage> messages;
    if (hive_id != hive_id_) {
        return messages;
    }

    ListOptions options;
    options.prefix = TIME_PREFIX;
    options.limit = clamp_limit(limit, config::MAX_GOSSIP_BATCH);
    if (since_ms > 0) {
        // Sorts before every key of since_ms itself
        options.start_after = TIME_PREFIX +
            pad_number(std::min(since_ms, config::MAX_MESSAGE_TIME_MS), config::TIME_KEY_WIDTH) + ":";
    }

    for (const auto& entry : storage_.list(options)) {
        int64_t id = 0;
        try {
            id = std::stoll(entry.second);
        } catch (const std::exception&) {
            continue;
        }

        auto message = load(message_key(id));
        if (message && message->created_at_ms >= since_ms && message->hive_id == hive_id_) {
            messages.push_back(std::move(*message));
        }
    }

    return messages;
}

bool MessageStore::contains(const std::string& uid) {
    return storage_.get(UID_PREFIX + uid).has_value();
}

std::optional<HiveMessage> MessageStore::get(int64_t id) {
    if (id <= 0 || id > MAX_KEY_ID) {
        return std::nullopt;
    }
    return load(message_key(id));
}

size_t MessageStore::count() {
    ListOptions options;
    options.prefix = MESSAGE_PREFIX;
    return storage_.list(options).size();
}

} // namespace hivemind
