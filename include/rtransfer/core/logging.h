// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <rtransfer/config/feature_flags.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if RTRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace rtransfer {

/**
 * @brief Log categories for the transfer engine
 */
struct log_category {
    static constexpr std::string_view engine = "rtransfer.engine";
    static constexpr std::string_view session = "rtransfer.session";
    static constexpr std::string_view transfer = "rtransfer.transfer";
    static constexpr std::string_view resume = "rtransfer.resume";
    static constexpr std::string_view progress = "rtransfer.progress";
    static constexpr std::string_view probe = "rtransfer.probe";
    static constexpr std::string_view media = "rtransfer.media";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name ("trace", "DEBUG", "warn", ...)
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    return std::nullopt;
}

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * URLs frequently carry access tokens in their query string, and local
 * paths reveal user directory layouts.
 */
struct masking_config {
    bool mask_url_queries = false;
    bool mask_paths = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Masks URL query strings and path directories in log text
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask every URL and absolute path found in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_url_queries && !config_.mask_paths) {
            return input;
        }

        std::string result = input;
        if (config_.mask_url_queries) {
            result = replace_all(result, url_pattern(),
                                 [this](const std::string& m) { return mask_url(m); });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(),
                                 [this](const std::string& m) {
                                     // match may start with one whitespace character
                                     auto start = m.find('/');
                                     return m.substr(0, start) + mask_path(m.substr(start));
                                 });
        }
        return result;
    }

    /**
     * @brief Replace the query string of a URL, keeping scheme, host and path
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_url_queries) {
            return url;
        }
        auto q = url.find('?');
        if (q == std::string::npos || q + 1 >= url.size()) {
            return url;
        }
        return url.substr(0, q + 1) + std::string(3, config_.mask_char[0]);
    }

    /**
     * @brief Mask the directory part of a path, keeping the filename
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char[0]) + "/" +
               path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    static auto url_pattern() -> const std::regex& {
        static const std::regex pattern(R"(https?://[^\s"]+)");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(R"((?:^|\s)(?:/[A-Za-z0-9._-]+){2,})");
        return pattern;
    }

    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern,
                            Fn&& fn) -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            auto pos = static_cast<std::size_t>(it->position());
            result += input.substr(last_pos, pos - last_pos);
            result += fn(it->str());
            last_pos = pos + static_cast<std::size_t>(it->length());
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured log context for one transfer session
 */
struct transfer_log_context {
    std::string session_id;
    std::string url;
    std::string destination;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> offset;
    std::optional<double> progress_percent;
    std::optional<double> speed_bps;
    std::optional<double> eta_seconds;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> state;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!url.empty()) add_field("url", masker ? masker->mask_url(url) : url);
        if (!destination.empty()) {
            add_field("destination",
                      masker ? masker->mask_path(destination) : destination);
        }
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (offset) add_uint("offset", *offset);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (speed_bps) add_double("speed_bps", *speed_bps);
        if (eta_seconds) add_double("eta_seconds", *eta_seconds);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (state) add_field("state", *state);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            std::string file = *source_file;
            if (masker) {
                file = masker->mask_path(file);
            }
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::transfer)
 *     .with_message("Transfer completed")
 *     .with_session_id("session-7")
 *     .with_bytes_transferred(1048576)
 *     .with_duration_ms(500)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_session_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->session_id = std::string(id);
        return *this;
    }

    auto with_url(std::string_view url) -> log_entry_builder& {
        ensure_context();
        entry_.context->url = std::string(url);
        return *this;
    }

    auto with_destination(std::string_view destination) -> log_entry_builder& {
        ensure_context();
        entry_.context->destination = std::string(destination);
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_transferred = bytes;
        return *this;
    }

    auto with_total_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->total_bytes = bytes;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class transfer_logger;

transfer_logger& get_logger();

enum class log_output_format {
    text,   ///< Human readable single line
    json    ///< One JSON object per record
};

/**
 * @brief Process-wide logger for the transfer engine
 */
class transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&,
                                                 const std::string&)>;

    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times; called whenever an engine is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if RTRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if RTRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if RTRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    /**
     * @brief Suppress stderr/backend output; callbacks still fire
     */
    void set_quiet(bool quiet) { quiet_.store(quiet); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, message, context, current_masker);
        }
    }

    void flush() {
#if RTRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }
        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        emit(level, json_str);
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const sensitive_info_masker& masker) {
        std::ostringstream oss;
#if !RTRANSFER_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        emit(level, oss.str());
    }

    void emit([[maybe_unused]] log_level level, const std::string& line) {
        if (quiet_.load()) {
            return;
        }
#if RTRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if RTRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> quiet_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline transfer_logger& get_logger() {
    static transfer_logger instance;
    return instance;
}

#define RT_LOG(level, category, message) \
    rtransfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RT_LOG_CTX(level, category, message, context) \
    rtransfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RT_LOG_TRACE(category, message) \
    RT_LOG(rtransfer::log_level::trace, category, message)

#define RT_LOG_DEBUG(category, message) \
    RT_LOG(rtransfer::log_level::debug, category, message)

#define RT_LOG_INFO(category, message) \
    RT_LOG(rtransfer::log_level::info, category, message)

#define RT_LOG_WARN(category, message) \
    RT_LOG(rtransfer::log_level::warn, category, message)

#define RT_LOG_ERROR(category, message) \
    RT_LOG(rtransfer::log_level::error, category, message)

#define RT_LOG_DEBUG_CTX(category, message, ctx) \
    RT_LOG_CTX(rtransfer::log_level::debug, category, message, ctx)

#define RT_LOG_INFO_CTX(category, message, ctx) \
    RT_LOG_CTX(rtransfer::log_level::info, category, message, ctx)

#define RT_LOG_WARN_CTX(category, message, ctx) \
    RT_LOG_CTX(rtransfer::log_level::warn, category, message, ctx)

#define RT_LOG_ERROR_CTX(category, message, ctx) \
    RT_LOG_CTX(rtransfer::log_level::error, category, message, ctx)

}  // namespace rtransfer
