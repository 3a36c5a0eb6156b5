/**
 * @file session_store.cpp
 * @brief Implementation of bearer session tokens
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "hivemind/session_store.hpp"
#include "hivemind/hive_crypto.hpp"
#include "hivemind/protocol.hpp"

#include <vector>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {

const std::string SESSION_PREFIX = "session:";

} // namespace

SessionStore::SessionStore(
    HiveStorage& storage,
    std::chrono::milliseconds ttl,
    ClockFn clock
)
    : storage_(storage)
    , ttl_(ttl)
    , clock_(std::move(clock))
{
}

std::string SessionStore::session_key(const std::string& token) {
    return SESSION_PREFIX + token;
}

IssuedSession SessionStore::create(
    const std::string& agent_id,
    const std::string& pubkey,
    const std::string& hive_id
) {
    IssuedSession issued;
    issued.token = protocol::make_session_token(hive_id, HiveCrypto::generate_uuid());
    issued.session.agent_id = agent_id;
    issued.session.pubkey = pubkey;
    issued.session.hive_id = hive_id;
    issued.session.expires_at_ms = clock_() + ttl_.count();

    storage_.put(session_key(issued.token), issued.session.to_json().dump());

    return issued;
}

std::optional<Session> SessionStore::validate(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }

    auto raw = storage_.get(session_key(token));
    if (!raw) {
        return std::nullopt;
    }

    json parsed = json::parse(*raw, nullptr, false);
    auto session = parsed.is_discarded() ? std::nullopt : Session::from_json(parsed);

    if (!session || session->expires_at_ms < clock_()) {
        storage_.remove(session_key(token));
        log_debug("SessionStore: Evicted expired session " + redact(token));
        return std::nullopt;
    }

    return session;
}

size_t SessionStore::evict_expired() {
    ListOptions options;
    options.prefix = SESSION_PREFIX;

    int64_t now = clock_();
    std::vector<std::string> expired;

    for (const auto& entry : storage_.list(options)) {
        json parsed = json::parse(entry.second, nullptr, false);
        auto session = parsed.is_discarded() ? std::nullopt : Session::from_json(parsed);

        if (!session || session->expires_at_ms < now) {
            expired.push_back(entry.first);
        }
    }

    if (expired.empty()) {
        return 0;
    }

    return storage_.remove_batch(expired);
}

bool SessionStore::revoke(const std::string& token) {
    return storage_.remove(session_key(token));
}

} // namespace hivemind
