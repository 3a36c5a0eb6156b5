/**
 * @file gossip_engine.cpp
 * @brief Implementation of gossip ingestion and peer polling
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "hivemind/gossip_engine.hpp"
#include "hivemind/errors.hpp"
#include "hivemind/hive_config.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace hivemind {

using namespace hivemind::utilities;

namespace {

// Non-empty string member, or empty
std::string required_string(const json& record, const char* name) {
    auto it = record.find(name);
    if (it == record.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

std::optional<int64_t> numeric_ms(const json& record, const char* name) {
    auto it = record.find(name);
    if (it == record.end() || !it->is_number()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(config::MAX_MESSAGE_TIME_MS)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    double value = it->get<double>();
    if (!std::isfinite(value) || value < 0.0 || value > static_cast<double>(config::MAX_MESSAGE_TIME_MS)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

} // namespace

// ============================================================================
// Record Ingestion
// ============================================================================

std::optional<HiveMessage> normalize_gossip_record(
    const json& record,
    const std::string& hive_id,
    int64_t now_ms
) {
    if (!record.is_object()) {
        return std::nullopt;
    }

    HiveMessage message;
    message.uid = required_string(record, "uid");
    message.agent_id = required_string(record, "agentId");
    message.hive_id = required_string(record, "hiveId");
    message.content = required_string(record, "content");

    if (message.uid.empty() || message.agent_id.empty() ||
        message.hive_id.empty() || message.content.empty()) {
        return std::nullopt;
    }

    if (message.hive_id != hive_id) {
        return std::nullopt;
    }

    auto created_at = numeric_ms(record, "createdAtMs");
    std::string ts = required_string(record, "ts");

    if (created_at && !ts.empty()) {
        message.created_at_ms = *created_at;
        message.ts = ts;
    } else if (created_at) {
        message.created_at_ms = *created_at;
        message.ts = format_timestamp_ms(*created_at);
    } else if (!ts.empty()) {
        auto parsed = parse_timestamp_ms(ts);
        if (!parsed) {
            return std::nullopt;
        }
        message.created_at_ms = *parsed;
        message.ts = ts;
    } else {
        message.created_at_ms = now_ms;
        message.ts = format_timestamp_ms(now_ms);
    }

    if (message.created_at_ms < 0) {
        return std::nullopt;
    }

    std::string channel = required_string(record, "channel");
    message.channel = channel.empty() ? "default" : channel;
    message.source = MessageSource::GOSSIP;

    return message;
}

IngestResult ingest_gossip_batch(
    MessageStore& store,
    const json& records,
    const std::string& hive_id,
    int64_t now_ms
) {
    IngestResult result;
    if (!records.is_array()) {
        return result;
    }

    for (const auto& record : records) {
        auto candidate = normalize_gossip_record(record, hive_id, now_ms);
        if (!candidate) {
            result.skipped++;
            continue;
        }

        std::optional<HiveMessage> stored;
        try {
            stored = store.append(*candidate);
        } catch (const ValidationError& e) {
            log_debug("GossipEngine: Dropping record " + candidate->uid + ": " + e.what());
            result.skipped++;
            continue;
        }

        if (stored) {
            result.accepted++;
            result.max_accepted_ms = std::max(result.max_accepted_ms, candidate->created_at_ms);
        } else {
            result.skipped++;
        }
        result.max_batch_ms = std::max(result.max_batch_ms, candidate->created_at_ms);
    }

    return result;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

GossipEngine::GossipEngine(
    HiveRegistry& registry,
    std::vector<std::string> peers,
    std::shared_ptr<PeerClient> client,
    std::chrono::milliseconds interval,
    ClockFn clock
)
    : registry_(registry)
    , peers_(std::move(peers))
    , client_(std::move(client))
    , interval_(std::max(interval, std::chrono::milliseconds(config::MIN_GOSSIP_INTERVAL)))
    , clock_(std::move(clock))
    , timer_(io_context_)
    , running_(false)
{
    if (!client_) {
        throw std::invalid_argument("GossipEngine requires a peer client");
    }
}

GossipEngine::~GossipEngine() {
    if (running_) {
        stop();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool GossipEngine::start() {
    if (running_) {
        log_warn("GossipEngine: Already running");
        return false;
    }

    if (peers_.empty()) {
        log_info("GossipEngine: No peers configured, gossip disabled");
        return false;
    }

    io_context_.restart();
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    // One thread per peer plus one so the timer never waits behind a slow peer
    size_t num_threads = peers_.size() + 1;
    for (size_t i = 0; i < num_threads; ++i) {
        worker_threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("GossipEngine: Worker thread exception: " + std::string(e.what()));
            }
        });
    }

    running_ = true;
    asio::post(io_context_, [this]() { schedule_tick(); });

    log_info("GossipEngine: Polling " + std::to_string(peers_.size()) + " peers every " +
             std::to_string(interval_.count()) + " ms");
    return true;
}

void GossipEngine::stop() {
    if (!running_) {
        return;
    }

    log_info("GossipEngine: Stopping...");
    running_ = false;

    asio::post(io_context_, [this]() { timer_.cancel(); });

    work_guard_.reset();
    io_context_.stop();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.clear();
    }

    log_info("GossipEngine: Stopped");
}

bool GossipEngine::is_running() const {
    return running_;
}

// ============================================================================
// Scheduling
// ============================================================================

void GossipEngine::schedule_tick() {
    if (!running_) {
        return;
    }

    timer_.expires_after(interval_);
    timer_.async_wait([this](const asio::error_code& error) { on_tick(error); });
}

void GossipEngine::on_tick(const asio::error_code& error) {
    if (error == asio::error::operation_aborted || !running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.ticks++;
    }

    for (const auto& peer : peers_) {
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            if (!in_flight_.insert(peer).second) {
                log_debug("GossipEngine: Peer " + peer + " still in flight, skipping tick");
                continue;
            }
        }

        asio::post(io_context_, [this, peer]() {
            try {
                poll_peer(peer);
            } catch (const std::exception& e) {
                log_error("GossipEngine: Poll of " + peer + " failed: " + e.what());
            }

            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            in_flight_.erase(peer);
        });
    }

    schedule_tick();
}

// ============================================================================
// Polling
// ============================================================================

GossipCycleReport GossipEngine::run_cycle() {
    GossipCycleReport total;

    for (const auto& peer : peers_) {
        GossipCycleReport report = poll_peer(peer);
        total.peers_polled += report.peers_polled;
        total.peers_failed += report.peers_failed;
        total.accepted += report.accepted;
        total.skipped += report.skipped;
    }

    return total;
}

GossipCycleReport GossipEngine::poll_peer(const std::string& peer) {
    GossipCycleReport report;
    report.peers_polled = 1;
    bool failed = false;

    for (const auto& actor : registry_.actors()) {
        const std::string& hive_id = actor->hive_id();

        try {
            int64_t since_ms = actor->execute([&peer](HiveContext& ctx) {
                return ctx.cursors.get(peer);
            });

            // Network call happens outside the hive's strand
            json records = client_->fetch_messages(peer, hive_id, since_ms);

            IngestResult result = actor->execute([&](HiveContext& ctx) {
                IngestResult ingest = ingest_gossip_batch(ctx.messages, records, ctx.hive_id, clock_());

                // Duplicates may be our own messages echoed back with our clock,
                // so only accepted records move the cursor. A full page of
                // duplicates would otherwise be fetched again on every tick.
                int64_t next_ms = ingest.max_accepted_ms;
                if (records.is_array() && records.size() >= config::MAX_GOSSIP_BATCH) {
                    next_ms = std::max(next_ms, ingest.max_batch_ms);
                }
                if (next_ms > since_ms) {
                    ctx.cursors.advance(peer, next_ms);
                }
                return ingest;
            });

            report.accepted += result.accepted;
            report.skipped += result.skipped;

            if (result.accepted > 0) {
                log_info("GossipEngine: Accepted " + std::to_string(result.accepted) +
                         " messages for hive '" + hive_id + "' from " + peer);
            } else {
                log_debug("GossipEngine: Nothing new for hive '" + hive_id + "' from " + peer);
            }

        } catch (const std::exception& e) {
            failed = true;
            log_warn("GossipEngine: Peer " + peer + " failed for hive '" + hive_id + "': " + e.what());
        }
    }

    report.peers_failed = failed ? 1 : 0;
    record(report);
    return report;
}

void GossipEngine::record(const GossipCycleReport& report) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.peer_polls += report.peers_polled;
    stats_.peer_failures += report.peers_failed;
    stats_.accepted += report.accepted;
    stats_.skipped += report.skipped;
}

GossipStats GossipEngine::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace hivemind
