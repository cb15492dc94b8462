/**
 * @file transfer_control.h
 * @brief Control signal channel and state machine of one transfer
 *
 * The caller thread issues pause/resume/cancel; the worker consults the
 * channel between chunks. All state changes go through one mutex and are
 * validated against the transition table:
 *
 * | From                    | Event            | To         |
 * |-------------------------|------------------|------------|
 * | idle                    | start()          | running    |
 * | idle                    | already complete | completed  |
 * | running                 | pause()          | paused     |
 * | paused                  | resume()         | running    |
 * | running, paused         | cancel()         | cancelling |
 * | cancelling              | chunk boundary   | cancelled  |
 * | running                 | stream exhausted | completed  |
 * | any non-terminal        | error            | failed     |
 */

#ifndef RTRANSFER_CORE_TRANSFER_CONTROL_H
#define RTRANSFER_CORE_TRANSFER_CONTROL_H

#include "transfer_types.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace rtransfer {

/**
 * @brief What the worker should do after a chunk boundary check
 */
enum class boundary_action {
    proceed,  ///< Read and write the next chunk
    stop      ///< Cancellation requested; close the file and finish
};

/**
 * @brief Check if a caller- or worker-initiated transition is allowed
 */
[[nodiscard]] auto is_valid_transition(transfer_state from, transfer_state to) noexcept -> bool;

class transfer_control {
public:
    using transition_listener = std::function<void(transfer_state from, transfer_state to)>;

    explicit transfer_control(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds{100});

    transfer_control(const transfer_control&) = delete;
    auto operator=(const transfer_control&) -> transfer_control& = delete;

    /**
     * @brief Observe every state change (called with the lock released)
     */
    void set_transition_listener(transition_listener listener);

    // Caller side

    [[nodiscard]] auto start() -> result<void>;
    [[nodiscard]] auto pause() -> result<void>;
    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Request cancellation; the flag is never cleared
     *
     * Repeated calls while cancelling succeed without effect.
     */
    [[nodiscard]] auto cancel() -> result<void>;

    // Worker side

    /**
     * @brief Gate between two chunks
     *
     * Blocks on the condition variable while paused, waking at least once
     * per poll interval. Returns stop once cancellation was requested.
     */
    [[nodiscard]] auto at_chunk_boundary() -> boundary_action;

    /**
     * @brief Stream exhausted: running becomes completed
     *
     * Waits out a pause first. If cancellation arrived meanwhile, the
     * session ends cancelled instead.
     * @return The terminal state reached
     */
    auto complete() -> transfer_state;

    /**
     * @brief Idle session whose destination already holds the resource
     */
    [[nodiscard]] auto complete_without_transfer() -> result<void>;

    /**
     * @brief Cancelling becomes cancelled after the file was closed
     */
    auto mark_cancelled() -> result<void>;

    /**
     * @brief Any non-terminal state becomes failed
     * @return false when the session was already terminal
     */
    auto fail(error reason) -> bool;

    // Observation

    [[nodiscard]] auto state() const -> transfer_state;
    [[nodiscard]] auto failure() const -> std::optional<error>;
    [[nodiscard]] auto is_cancel_requested() const noexcept -> bool;
    [[nodiscard]] auto is_pause_requested() const -> bool;

    /**
     * @brief Block until a terminal state is reached
     */
    auto wait_terminal() const -> transfer_state;

    /**
     * @brief Block until a terminal state or the timeout
     * @return The terminal state, or nullopt on timeout
     */
    [[nodiscard]] auto wait_terminal_for(std::chrono::milliseconds timeout) const
        -> std::optional<transfer_state>;

    [[nodiscard]] auto poll_interval() const noexcept -> std::chrono::milliseconds {
        return poll_interval_;
    }

private:
    auto transition(std::unique_lock<std::mutex>& lock, transfer_state to) -> result<void>;

    std::chrono::milliseconds poll_interval_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    transfer_state state_ = transfer_state::idle;
    std::optional<error> failure_;
    std::atomic<bool> cancel_requested_{false};
    transition_listener listener_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_TRANSFER_CONTROL_H
