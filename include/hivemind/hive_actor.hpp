/**
 * @file hive_actor.hpp
 * @brief Single-writer execution context for one hive
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every read or write of a hive's state runs as a task on that hive's asio
 * strand. Tasks for one hive never overlap; different hives run in
 * parallel on the shared io_context worker threads.
 */

#pragma once

#include "hivemind/challenge_manager.hpp"
#include "hivemind/hive_config.hpp"
#include "hivemind/join_authenticator.hpp"
#include "hivemind/message_store.hpp"
#include "hivemind/peer_cursors.hpp"
#include "hivemind/session_store.hpp"
#include "hivemind/storage.hpp"
#include "hivemind/utilities.hpp"

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace hivemind {

/**
 * @brief State owned by one hive actor
 *
 * Components hold references into storage, so storage is declared first.
 */
struct HiveContext {
    HiveContext(
        std::string hive_id,
        std::unique_ptr<HiveStorage> storage,
        const HiveConfig& config,
        utilities::ClockFn clock
    );

    // Disable copy and move
    HiveContext(const HiveContext&) = delete;
    HiveContext& operator=(const HiveContext&) = delete;

    std::string hive_id;
    std::unique_ptr<HiveStorage> storage;
    ChallengeManager challenges;
    SessionStore sessions;
    JoinAuthenticator authenticator;
    MessageStore messages;
    PeerCursors cursors;
};

/**
 * @brief HiveActor - Serializes all work on one hive
 */
class HiveActor {
public:
    HiveActor(
        const std::string& hive_id,
        std::unique_ptr<HiveStorage> storage,
        const HiveConfig& config,
        asio::io_context& io_context,
        utilities::ClockFn clock = utilities::now_ms
    );

    // Disable copy and move
    HiveActor(const HiveActor&) = delete;
    HiveActor& operator=(const HiveActor&) = delete;
    HiveActor(HiveActor&&) = delete;
    HiveActor& operator=(HiveActor&&) = delete;

    /**
     * @brief Run a task on the hive's strand and wait for its result
     *
     * Exceptions thrown by the task are rethrown to the caller. Called from
     * within a task of the same actor, the task runs inline.
     *
     * @param task Callable taking HiveContext&
     * @return Whatever the task returns
     * @throws std::runtime_error if the io_context is stopped before the task runs
     */
    template <typename Task>
    auto execute(Task&& task) -> std::invoke_result_t<Task&, HiveContext&> {
        using Result = std::invoke_result_t<Task&, HiveContext&>;

        if (strand_.running_in_this_thread()) {
            return task(context_);
        }

        if (io_context_.stopped()) {
            throw std::runtime_error("hive actor '" + context_.hive_id + "' is stopped");
        }

        auto packaged = std::make_shared<std::packaged_task<Result()>>(
            [this, fn = std::forward<Task>(task)]() mutable { return fn(context_); }
        );
        auto result = packaged->get_future();

        asio::post(strand_, [packaged]() { (*packaged)(); });

        // A task queued behind io_context::stop() never runs
        while (result.wait_for(STOP_POLL_INTERVAL) != std::future_status::ready) {
            if (io_context_.stopped()) {
                throw std::runtime_error("hive actor '" + context_.hive_id + "' stopped before the task ran");
            }
        }

        return result.get();
    }

    /**
     * @brief Queue a task on the hive's strand without waiting
     *
     * Exceptions are logged and dropped.
     */
    void post(std::function<void(HiveContext&)> task);

    const std::string& hive_id() const { return context_.hive_id; }

private:
    static constexpr std::chrono::milliseconds STOP_POLL_INTERVAL{50};

    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    HiveContext context_;
};

} // namespace hivemind
