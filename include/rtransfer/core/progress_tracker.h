/**
 * @file progress_tracker.h
 * @brief Per-session throughput, ETA and percentage accumulator
 */

#ifndef RTRANSFER_CORE_PROGRESS_TRACKER_H
#define RTRANSFER_CORE_PROGRESS_TRACKER_H

#include "transfer_types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rtransfer {

/**
 * @brief Computes progress samples from cumulative byte counts
 *
 * One tracker belongs to one session run and is only touched by the worker
 * that owns the transfer. Speed is measured over the interval since the
 * previous observation. An interval of zero or less keeps the previous
 * speed.
 *
 * @code
 * progress_tracker tracker(1000, 0, clock::now());
 * auto sample = tracker.observe(100, clock::now());
 * if (sample.percent) { ... }
 * @endcode
 */
class progress_tracker {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @param total_bytes Declared total, 0 when unknown
     * @param baseline_bytes Bytes already present before this run
     * @param start Time of the baseline observation
     */
    progress_tracker(uint64_t total_bytes, uint64_t baseline_bytes,
                     clock::time_point start);

    /**
     * @brief Record a new cumulative byte count and produce a sample
     */
    auto observe(uint64_t cumulative_bytes, clock::time_point now) -> progress_sample;

    /**
     * @brief Raise the declared total (media sources refine estimates)
     */
    void set_total(uint64_t total_bytes) noexcept { total_bytes_ = total_bytes; }

    [[nodiscard]] auto total() const noexcept -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto last() const noexcept -> const progress_sample& { return last_; }
    [[nodiscard]] auto baseline() const noexcept -> uint64_t { return baseline_; }

    /**
     * @brief Mean speed since the tracker was created
     */
    [[nodiscard]] auto average_speed(clock::time_point now) const -> double;

private:
    uint64_t total_bytes_;
    uint64_t baseline_;
    clock::time_point start_;
    uint64_t prev_bytes_;
    clock::time_point prev_time_;
    double speed_ = 0.0;
    progress_sample last_;
};

/**
 * @brief Human readable byte size ("1.50 MB")
 */
[[nodiscard]] auto format_bytes(double bytes) -> std::string;

/**
 * @brief Human readable ETA ("1h 2m 3s", "4m 5s", "6s", "N/A")
 */
[[nodiscard]] auto format_eta(std::optional<double> seconds) -> std::string;

/**
 * @brief One-line progress description for terminals and logs
 *
 * With a known total: "42.0% | 420.00 B / 1000.00 B | 10.00 B/s | ETA: 58s".
 * Without one: "420.00 B downloaded | 10.00 B/s".
 */
[[nodiscard]] auto format_progress_line(const progress_sample& sample) -> std::string;

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_PROGRESS_TRACKER_H
