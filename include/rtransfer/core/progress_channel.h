/**
 * @file progress_channel.h
 * @brief Single-slot latest-value channel between a worker and its observers
 */

#ifndef RTRANSFER_CORE_PROGRESS_CHANNEL_H
#define RTRANSFER_CORE_PROGRESS_CHANNEL_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace rtransfer {

/**
 * @brief Overwrite-on-publish slot holding the most recent value
 *
 * The publisher never blocks on readers beyond the short slot lock, and
 * intermediate values may be dropped. Each publish bumps a sequence
 * number so readers can tell whether anything new arrived.
 */
template <typename T>
class progress_channel {
public:
    progress_channel() = default;

    progress_channel(const progress_channel&) = delete;
    auto operator=(const progress_channel&) -> progress_channel& = delete;

    void publish(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = std::move(value);
        ++sequence_;
    }

    [[nodiscard]] auto latest() const -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        return slot_;
    }

    [[nodiscard]] auto sequence() const -> uint64_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return sequence_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_.reset();
        sequence_ = 0;
    }

private:
    mutable std::mutex mutex_;
    std::optional<T> slot_;
    uint64_t sequence_ = 0;
};

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_PROGRESS_CHANNEL_H
