/**
 * @file engine_config.h
 * @brief Configuration shared by all sessions of a transfer engine
 */

#ifndef RTRANSFER_SESSION_ENGINE_CONFIG_H
#define RTRANSFER_SESSION_ENGINE_CONFIG_H

#include "rtransfer/core/transfer_types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace rtransfer {

/**
 * @brief Progress observer called from worker threads
 */
using session_progress_callback =
    std::function<void(const session_id&, const progress_sample&)>;

struct engine_config {
    static constexpr uint64_t default_max_declared_size = 10ULL * 1024 * 1024 * 1024;

    /// Largest accepted declared size; nullopt disables the check
    std::optional<uint64_t> max_declared_size = default_max_declared_size;

    /// Upper bound of one pause wait before the flag is re-checked
    std::chrono::milliseconds pause_poll_interval{100};

    /// Default for requests created through transfer_engine::make_request
    bool resume_by_default = true;

    /// Fail plain transfers whose content type is text/html
    bool reject_webpages = true;

    /// Format selector used when a media request has no quality
    std::string default_media_format = "best";

    /// Output name template for media transfers without a destination
    std::string media_output_template = "%(title)s.%(ext)s";

    /// Directory for inferred destinations
    std::filesystem::path download_directory = ".";

    session_progress_callback progress_callback;
};

}  // namespace rtransfer

#endif  // RTRANSFER_SESSION_ENGINE_CONFIG_H
