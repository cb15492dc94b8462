/**
 * @file types.h
 * @brief Core type definitions for rtransfer
 */

#ifndef RTRANSFER_CORE_TYPES_H
#define RTRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace rtransfer {

/**
 * @brief Error codes for transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Input validation errors
 * - -120 to -139: Resume negotiation errors
 * - -140 to -159: Local I/O errors
 * - -160 to -179: Transport errors
 * - -180 to -199: Control (usage) errors
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // Input validation errors (-100 to -119)
    invalid_url = -100,
    url_unreachable = -101,
    file_too_large = -102,
    webpage_content = -103,
    invalid_request = -104,
    invalid_configuration = -105,

    // Resume errors (-120 to -139)
    range_not_honored = -120,
    unexpected_partial_content = -121,
    range_mismatch = -122,

    // I/O errors (-140 to -159)
    file_open_error = -140,
    file_write_error = -141,
    file_read_error = -142,
    destination_conflict = -143,
    empty_download = -144,

    // Transport errors (-160 to -179)
    connection_failed = -160,
    transport_error = -161,
    http_error = -162,
    length_mismatch = -163,
    stream_overflow = -164,
    media_source_error = -165,

    // Control errors (-180 to -199)
    invalid_state_transition = -180,
    transfer_cancelled = -181,
    session_not_started = -182,
    wait_timeout = -183,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_available = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_url:
            return "invalid URL";
        case error_code::url_unreachable:
            return "URL is not reachable";
        case error_code::file_too_large:
            return "declared size exceeds the configured limit";
        case error_code::webpage_content:
            return "URL points to a webpage, not a downloadable file";
        case error_code::invalid_request:
            return "invalid transfer request";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::range_not_honored:
            return "server ignored the range request";
        case error_code::unexpected_partial_content:
            return "partial content received without a range request";
        case error_code::range_mismatch:
            return "partial content does not start at the requested offset";
        case error_code::file_open_error:
            return "cannot open destination file";
        case error_code::file_write_error:
            return "destination write error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::destination_conflict:
            return "destination is in use by another transfer";
        case error_code::empty_download:
            return "download produced an empty or missing file";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::transport_error:
            return "stream error";
        case error_code::http_error:
            return "HTTP error status";
        case error_code::length_mismatch:
            return "received length differs from declared length";
        case error_code::stream_overflow:
            return "stream delivered more bytes than declared";
        case error_code::media_source_error:
            return "media source failed";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::transfer_cancelled:
            return "transfer cancelled by user";
        case error_code::session_not_started:
            return "session not started";
        case error_code::wait_timeout:
            return "timed out waiting for transfer";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_available:
            return "capability not available in this build";
        default:
            return "unknown error";
    }
}

/**
 * @brief Failure taxonomy used to decide how an error is surfaced
 */
enum class error_category {
    none,
    input_validation,
    resume_conflict,
    io_failure,
    transport_failure,
    user_cancelled,
    usage,
    internal
};

[[nodiscard]] constexpr auto to_string(error_category category) -> const char* {
    switch (category) {
        case error_category::none: return "none";
        case error_category::input_validation: return "input_validation";
        case error_category::resume_conflict: return "resume_conflict";
        case error_category::io_failure: return "io_failure";
        case error_category::transport_failure: return "transport_failure";
        case error_category::user_cancelled: return "user_cancelled";
        case error_category::usage: return "usage";
        case error_category::internal: return "internal";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_input_error(error_code code) noexcept -> bool {
    return static_cast<int>(code) <= -100 && static_cast<int>(code) >= -119;
}

[[nodiscard]] constexpr auto is_resume_error(error_code code) noexcept -> bool {
    return static_cast<int>(code) <= -120 && static_cast<int>(code) >= -139;
}

[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    return static_cast<int>(code) <= -140 && static_cast<int>(code) >= -159;
}

[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    return static_cast<int>(code) <= -160 && static_cast<int>(code) >= -179;
}

[[nodiscard]] constexpr auto is_control_error(error_code code) noexcept -> bool {
    return static_cast<int>(code) <= -180 && static_cast<int>(code) >= -199;
}

/**
 * @brief Map an error code onto the failure taxonomy
 *
 * A partial response without a range request, or one starting at another
 * offset, is a protocol violation of the source and counts as a transport
 * failure.
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    if (code == error_code::success) return error_category::none;
    if (code == error_code::transfer_cancelled) return error_category::user_cancelled;
    if (code == error_code::unexpected_partial_content ||
        code == error_code::range_mismatch) {
        return error_category::transport_failure;
    }
    if (is_input_error(code)) return error_category::input_validation;
    if (is_resume_error(code)) return error_category::resume_conflict;
    if (is_io_error(code)) return error_category::io_failure;
    if (is_transport_error(code)) return error_category::transport_failure;
    if (is_control_error(code)) return error_category::usage;
    return error_category::internal;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto category() const noexcept -> error_category {
        return category_of(code);
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier for a transfer session
 */
struct session_id {
    uint64_t value;

    session_id() : value(0) {}
    explicit session_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const session_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const session_id& other) const -> bool {
        return value < other.value;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return "session-" + std::to_string(value);
    }
};

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_TYPES_H
