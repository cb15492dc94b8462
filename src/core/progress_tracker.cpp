/**
 * @file progress_tracker.cpp
 * @brief Implementation of the per-session progress accumulator
 */

#include "rtransfer/core/progress_tracker.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace rtransfer {

progress_tracker::progress_tracker(uint64_t total_bytes, uint64_t baseline_bytes,
                                   clock::time_point start)
    : total_bytes_(total_bytes),
      baseline_(baseline_bytes),
      start_(start),
      prev_bytes_(baseline_bytes),
      prev_time_(start) {
    last_.bytes_transferred = baseline_bytes;
    last_.total_bytes = total_bytes;
    last_.timestamp = start;
    if (total_bytes > 0) {
        last_.percent = static_cast<double>(baseline_bytes) /
                        static_cast<double>(total_bytes) * 100.0;
    }
}

auto progress_tracker::observe(uint64_t cumulative_bytes, clock::time_point now)
    -> progress_sample {
    auto interval = std::chrono::duration<double>(now - prev_time_).count();
    if (interval > 0.0) {
        auto delta = cumulative_bytes >= prev_bytes_ ? cumulative_bytes - prev_bytes_ : 0;
        speed_ = static_cast<double>(delta) / interval;
        prev_bytes_ = cumulative_bytes;
        prev_time_ = now;
    } else {
        // Keep accumulating into the current interval.
        if (cumulative_bytes < prev_bytes_) {
            prev_bytes_ = cumulative_bytes;
        }
    }

    progress_sample sample;
    sample.bytes_transferred = cumulative_bytes;
    sample.total_bytes = total_bytes_;
    sample.speed_bps = speed_;
    sample.timestamp = now;

    if (total_bytes_ > 0) {
        sample.percent = static_cast<double>(cumulative_bytes) /
                         static_cast<double>(total_bytes_) * 100.0;
        if (speed_ > 0.0) {
            auto remaining = cumulative_bytes < total_bytes_
                                 ? total_bytes_ - cumulative_bytes
                                 : uint64_t{0};
            sample.eta_seconds = static_cast<double>(remaining) / speed_;
        }
    }

    last_ = sample;
    return sample;
}

auto progress_tracker::average_speed(clock::time_point now) const -> double {
    auto elapsed = std::chrono::duration<double>(now - start_).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    auto moved = last_.bytes_transferred >= baseline_
                     ? last_.bytes_transferred - baseline_
                     : uint64_t{0};
    return static_cast<double>(moved) / elapsed;
}

// ============================================================================
// Display helpers
// ============================================================================

auto format_bytes(double bytes) -> std::string {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    constexpr std::size_t unit_count = sizeof(units) / sizeof(units[0]);

    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < unit_count) {
        bytes /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << bytes << " " << units[unit];
    return oss.str();
}

auto format_eta(std::optional<double> seconds) -> std::string {
    if (!seconds || *seconds < 0.0 || !std::isfinite(*seconds)) {
        return "N/A";
    }

    auto total = static_cast<uint64_t>(*seconds);
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto secs = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m " << secs << "s";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

auto format_progress_line(const progress_sample& sample) -> std::string {
    std::ostringstream oss;
    auto speed = format_bytes(sample.speed_bps) + "/s";

    if (sample.percent) {
        oss << std::fixed << std::setprecision(1) << *sample.percent << "% | "
            << format_bytes(static_cast<double>(sample.bytes_transferred)) << " / "
            << format_bytes(static_cast<double>(sample.total_bytes)) << " | "
            << speed << " | ETA: " << format_eta(sample.eta_seconds);
    } else {
        oss << format_bytes(static_cast<double>(sample.bytes_transferred))
            << " downloaded | " << speed;
    }
    return oss.str();
}

}  // namespace rtransfer
