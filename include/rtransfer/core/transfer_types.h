/**
 * @file transfer_types.h
 * @brief Request, state and outcome types shared by the transfer core
 */

#ifndef RTRANSFER_CORE_TRANSFER_TYPES_H
#define RTRANSFER_CORE_TRANSFER_TYPES_H

#include "types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rtransfer {

/**
 * @brief How the remote resource is obtained
 */
enum class transfer_mode {
    plain_file,    ///< Direct byte stream over the streaming fetch capability
    media_stream   ///< Delegated to the media source capability
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) -> const char* {
    switch (mode) {
        case transfer_mode::plain_file: return "plain_file";
        case transfer_mode::media_stream: return "media_stream";
        default: return "unknown";
    }
}

/**
 * @brief One transfer request; immutable once a session starts
 */
struct transfer_request {
    std::string url;
    std::optional<std::filesystem::path> destination;
    bool resume_allowed = true;
    transfer_mode mode = transfer_mode::plain_file;
    std::string quality;  ///< Media format selector, ignored in plain mode
};

/**
 * @brief Lifecycle state of a transfer session
 */
enum class transfer_state {
    idle,
    running,
    paused,
    cancelling,
    completed,
    cancelled,
    failed
};

[[nodiscard]] constexpr auto to_string(transfer_state state) -> const char* {
    switch (state) {
        case transfer_state::idle: return "idle";
        case transfer_state::running: return "running";
        case transfer_state::paused: return "paused";
        case transfer_state::cancelling: return "cancelling";
        case transfer_state::completed: return "completed";
        case transfer_state::cancelled: return "cancelled";
        case transfer_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(transfer_state state) noexcept -> bool {
    return state == transfer_state::completed ||
           state == transfer_state::cancelled ||
           state == transfer_state::failed;
}

/**
 * @brief Open mode for the destination file
 */
enum class write_mode {
    truncate,
    append
};

[[nodiscard]] constexpr auto to_string(write_mode mode) -> const char* {
    switch (mode) {
        case write_mode::truncate: return "truncate";
        case write_mode::append: return "append";
        default: return "unknown";
    }
}

/**
 * @brief Open-ended byte range request starting at @c offset
 */
struct byte_range {
    uint64_t offset = 0;

    [[nodiscard]] auto to_header() const -> std::string {
        return "bytes=" + std::to_string(offset) + "-";
    }
};

/**
 * @brief Where writing starts and how the destination is opened
 *
 * offset > 0 always pairs with append, offset == 0 with truncate.
 */
struct resume_decision {
    uint64_t offset = 0;
    write_mode mode = write_mode::truncate;
    std::optional<byte_range> range;

    [[nodiscard]] static auto fresh() -> resume_decision {
        return resume_decision{};
    }

    [[nodiscard]] static auto append_from(uint64_t offset) -> resume_decision {
        return resume_decision{offset, write_mode::append, byte_range{offset}};
    }

    [[nodiscard]] auto is_resume() const noexcept -> bool {
        return range.has_value();
    }
};

/**
 * @brief Kind of response a streaming fetch produced
 */
enum class fetch_status {
    full,     ///< Whole resource from byte 0 (HTTP 200)
    partial,  ///< Requested range only (HTTP 206)
    error     ///< Anything else
};

[[nodiscard]] constexpr auto to_string(fetch_status status) -> const char* {
    switch (status) {
        case fetch_status::full: return "full";
        case fetch_status::partial: return "partial";
        case fetch_status::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Snapshot of transfer progress
 */
struct progress_sample {
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;          ///< 0 when the total is unknown
    double speed_bps = 0.0;            ///< Over the latest observation interval
    std::optional<double> eta_seconds; ///< Unset when total unknown or speed zero
    std::optional<double> percent;     ///< Unset when total unknown
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] auto total_known() const noexcept -> bool {
        return total_bytes > 0;
    }
};

/**
 * @brief Final result of a transfer session
 */
struct transfer_outcome {
    transfer_state state = transfer_state::idle;
    std::optional<error> failure;
    std::filesystem::path final_path;
    uint64_t bytes_transferred = 0;
    bool already_complete = false;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return state == transfer_state::completed;
    }
};

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_TRANSFER_TYPES_H
