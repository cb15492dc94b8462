/**
 * @file transfer_control.cpp
 * @brief Implementation of the control signal channel
 */

#include "rtransfer/core/transfer_control.h"

#include <string>
#include <utility>

namespace rtransfer {

auto is_valid_transition(transfer_state from, transfer_state to) noexcept -> bool {
    if (is_terminal(from)) {
        return false;
    }

    if (to == transfer_state::failed) {
        return true;
    }

    switch (from) {
        case transfer_state::idle:
            return to == transfer_state::running ||
                   to == transfer_state::completed;
        case transfer_state::running:
            return to == transfer_state::paused ||
                   to == transfer_state::cancelling ||
                   to == transfer_state::completed;
        case transfer_state::paused:
            return to == transfer_state::running ||
                   to == transfer_state::cancelling;
        case transfer_state::cancelling:
            return to == transfer_state::cancelled;
        default:
            return false;
    }
}

transfer_control::transfer_control(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval.count() > 0 ? poll_interval
                                               : std::chrono::milliseconds{100}) {}

void transfer_control::set_transition_listener(transition_listener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

auto transfer_control::transition(std::unique_lock<std::mutex>& lock, transfer_state to)
    -> result<void> {
    auto from = state_;
    if (!is_valid_transition(from, to)) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("Cannot move from ") + to_string(from) + " to " + to_string(to)}};
    }

    state_ = to;
    cv_.notify_all();

    auto listener = listener_;
    if (listener) {
        lock.unlock();
        listener(from, to);
        lock.lock();
    }
    return {};
}

// ============================================================================
// Caller side
// ============================================================================

auto transfer_control::start() -> result<void> {
    std::unique_lock lock(mutex_);
    return transition(lock, transfer_state::running);
}

auto transfer_control::pause() -> result<void> {
    std::unique_lock lock(mutex_);
    if (state_ != transfer_state::running) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("Cannot pause transfer in current state: ") + to_string(state_)}};
    }
    return transition(lock, transfer_state::paused);
}

auto transfer_control::resume() -> result<void> {
    std::unique_lock lock(mutex_);
    if (state_ != transfer_state::paused) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("Cannot resume transfer in current state: ") + to_string(state_)}};
    }
    return transition(lock, transfer_state::running);
}

auto transfer_control::cancel() -> result<void> {
    std::unique_lock lock(mutex_);
    if (state_ == transfer_state::cancelling) {
        return {};
    }
    if (state_ != transfer_state::running && state_ != transfer_state::paused) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("Cannot cancel transfer in current state: ") + to_string(state_)}};
    }
    cancel_requested_.store(true);
    return transition(lock, transfer_state::cancelling);
}

// ============================================================================
// Worker side
// ============================================================================

auto transfer_control::at_chunk_boundary() -> boundary_action {
    std::unique_lock lock(mutex_);
    while (state_ == transfer_state::paused && !cancel_requested_.load()) {
        cv_.wait_for(lock, poll_interval_);
    }
    return cancel_requested_.load() ? boundary_action::stop : boundary_action::proceed;
}

auto transfer_control::complete() -> transfer_state {
    std::unique_lock lock(mutex_);
    while (state_ == transfer_state::paused && !cancel_requested_.load()) {
        cv_.wait_for(lock, poll_interval_);
    }

    if (state_ == transfer_state::cancelling) {
        (void)transition(lock, transfer_state::cancelled);
    } else if (state_ == transfer_state::running) {
        (void)transition(lock, transfer_state::completed);
    }
    return state_;
}

auto transfer_control::complete_without_transfer() -> result<void> {
    std::unique_lock lock(mutex_);
    if (state_ != transfer_state::idle) {
        return unexpected{error{error_code::invalid_state_transition,
            std::string("Session already started: ") + to_string(state_)}};
    }
    return transition(lock, transfer_state::completed);
}

auto transfer_control::mark_cancelled() -> result<void> {
    std::unique_lock lock(mutex_);
    return transition(lock, transfer_state::cancelled);
}

auto transfer_control::fail(error reason) -> bool {
    std::unique_lock lock(mutex_);
    if (is_terminal(state_)) {
        return false;
    }
    failure_ = std::move(reason);
    return transition(lock, transfer_state::failed).has_value();
}

// ============================================================================
// Observation
// ============================================================================

auto transfer_control::state() const -> transfer_state {
    std::lock_guard lock(mutex_);
    return state_;
}

auto transfer_control::failure() const -> std::optional<error> {
    std::lock_guard lock(mutex_);
    return failure_;
}

auto transfer_control::is_cancel_requested() const noexcept -> bool {
    return cancel_requested_.load();
}

auto transfer_control::is_pause_requested() const -> bool {
    std::lock_guard lock(mutex_);
    return state_ == transfer_state::paused;
}

auto transfer_control::wait_terminal() const -> transfer_state {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return is_terminal(state_); });
    return state_;
}

auto transfer_control::wait_terminal_for(std::chrono::milliseconds timeout) const
    -> std::optional<transfer_state> {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return is_terminal(state_); })) {
        return std::nullopt;
    }
    return state_;
}

}  // namespace rtransfer
