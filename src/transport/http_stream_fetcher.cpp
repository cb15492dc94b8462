/**
 * @file http_stream_fetcher.cpp
 * @brief Streaming fetch adapter over libcurl
 */

#include "rtransfer/transport/http_stream_fetcher.h"

#include "body_pipe.h"
#include "http_headers.h"
#include "rtransfer/core/logging.h"

#include <curl/curl.h>

#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace rtransfer {

namespace {

auto classify_status(int status_code) -> fetch_status {
    if (status_code == 200) return fetch_status::full;
    if (status_code == 206) return fetch_status::partial;
    return fetch_status::error;
}

auto global_init() -> CURLcode {
    static std::once_flag flag;
    static CURLcode code = CURLE_OK;
    std::call_once(flag, [] { code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return code;
}

/**
 * @brief Response received on its own thread while the caller drains chunks
 *
 * The head (status and headers) is available once begin() returns. Body
 * bytes pass through a bounded body_pipe, so a slow or paused reader holds
 * back the receiving thread instead of buffering the whole body.
 */
class curl_fetch_response : public fetch_response {
public:
    curl_fetch_response(const http_fetcher_config& config,
                        std::string url,
                        std::optional<byte_range> range)
        : config_(config),
          url_(std::move(url)),
          range_(std::move(range)),
          pipe_(config.chunk_size, config.max_buffered_chunks) {
        error_buffer_[0] = '\0';
    }

    ~curl_fetch_response() override {
        pipe_.abandon();
        if (worker_.joinable()) {
            worker_.join();
        }
        if (header_list_) {
            curl_slist_free_all(header_list_);
        }
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    /**
     * @brief Start receiving and wait for the response head
     */
    [[nodiscard]] auto begin() -> result<void> {
        handle_ = curl_easy_init();
        if (!handle_) {
            return unexpected{error{error_code::internal_error, "curl_easy_init failed"}};
        }

        if (range_) {
            header_list_ = curl_slist_append(header_list_,
                                             ("Range: " + range_->to_header()).c_str());
        }

        curl_easy_setopt(handle_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(handle_, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle_, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.timeout.count()));
        curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, error_buffer_);
        if (header_list_) {
            curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, header_list_);
        }
        curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION, &curl_fetch_response::on_header);
        curl_easy_setopt(handle_, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &curl_fetch_response::on_body);
        curl_easy_setopt(handle_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle_, CURLOPT_XFERINFOFUNCTION, &curl_fetch_response::on_progress);
        curl_easy_setopt(handle_, CURLOPT_XFERINFODATA, this);

        worker_ = std::thread([this] { receive(); });

        std::unique_lock lock(head_mutex_);
        if (!head_cv_.wait_for(lock, config_.timeout, [this] { return head_ready_; })) {
            lock.unlock();
            pipe_.abandon();
            return unexpected{error{error_code::connection_failed,
                "No response from " + url_ + " within " +
                    std::to_string(config_.timeout.count()) + " ms"}};
        }
        if (head_failure_) {
            return unexpected{*head_failure_};
        }
        return {};
    }

    [[nodiscard]] auto status() const -> fetch_status override {
        return classify_status(status_code_);
    }

    [[nodiscard]] auto status_code() const -> int override { return status_code_; }

    [[nodiscard]] auto declared_length() const -> uint64_t override { return declared_length_; }

    [[nodiscard]] auto content_type() const -> std::string override { return content_type_; }

    [[nodiscard]] auto range_start() const -> std::optional<uint64_t> override {
        return range_start_;
    }

    [[nodiscard]] auto next_chunk() -> result<std::optional<std::vector<std::byte>>> override {
        return pipe_.read();
    }

private:
    static auto on_header(char* buffer, size_t size, size_t count, void* userdata) -> size_t {
        auto* self = static_cast<curl_fetch_response*>(userdata);
        auto length = size * count;
        if (self->head_ready_) {
            return length;  // trailers
        }

        std::string_view line(buffer, length);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.remove_suffix(1);
        }

        // Every response of a redirect chain starts with its own status line.
        if (line.substr(0, 5) == "HTTP/") {
            self->headers_.clear();
            return length;
        }

        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            auto value = line.substr(colon + 1);
            while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            self->headers_.emplace_back(std::string(line.substr(0, colon)), std::string(value));
        }
        return length;
    }

    static auto on_body(char* buffer, size_t size, size_t count, void* userdata) -> size_t {
        auto* self = static_cast<curl_fetch_response*>(userdata);
        auto length = size * count;
        self->publish_head(std::nullopt);
        if (!self->pipe_.write(buffer, length)) {
            return 0;  // reader gone, abort the transfer
        }
        return length;
    }

    static auto on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        -> int {
        auto* self = static_cast<curl_fetch_response*>(userdata);
        return self->pipe_.is_abandoned() ? 1 : 0;
    }

    void receive() {
        auto code = curl_easy_perform(handle_);
        if (code != CURLE_OK && !pipe_.is_abandoned()) {
            std::string detail = error_buffer_[0] != '\0' ? std::string(error_buffer_)
                                                          : curl_easy_strerror(code);
            publish_head(error{error_code::connection_failed,
                "HTTP GET failed: " + url_ + ": " + detail});
            pipe_.close(error{error_code::transport_error, "Connection lost: " + detail});
            return;
        }
        publish_head(std::nullopt);
        pipe_.close();
    }

    /// Runs on the receiving thread; later calls are no-ops
    void publish_head(std::optional<error> failure) {
        if (head_ready_) {
            return;
        }

        std::lock_guard lock(head_mutex_);
        if (failure) {
            head_failure_ = std::move(failure);
        } else {
            long code = 0;
            curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
            status_code_ = static_cast<int>(code);
            declared_length_ =
                detail::parse_length(detail::find_header(headers_, "Content-Length")).value_or(0);
            content_type_ = detail::find_header(headers_, "Content-Type").value_or("");
            if (status_code_ == 206) {
                range_start_ = detail::parse_content_range_start(
                    detail::find_header(headers_, "Content-Range"));
            }
        }
        head_ready_ = true;
        head_cv_.notify_all();
    }

    http_fetcher_config config_;
    std::string url_;
    std::optional<byte_range> range_;

    CURL* handle_ = nullptr;
    curl_slist* header_list_ = nullptr;
    char error_buffer_[CURL_ERROR_SIZE];

    detail::body_pipe pipe_;
    std::thread worker_;

    std::mutex head_mutex_;
    std::condition_variable head_cv_;
    bool head_ready_ = false;
    std::optional<error> head_failure_;
    std::vector<std::pair<std::string, std::string>> headers_;
    int status_code_ = 0;
    uint64_t declared_length_ = 0;
    std::string content_type_;
    std::optional<uint64_t> range_start_;
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct http_stream_fetcher::impl {
    http_fetcher_config config;

    explicit impl(const http_fetcher_config& cfg) : config(cfg) {}
};

// ============================================================================
// Construction
// ============================================================================

http_stream_fetcher::http_stream_fetcher(const http_fetcher_config& config)
    : impl_(std::make_unique<impl>(config)) {}

http_stream_fetcher::~http_stream_fetcher() = default;

auto http_stream_fetcher::create(const http_fetcher_config& config)
    -> result<std::unique_ptr<http_stream_fetcher>> {
    if (!config.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
            "Chunk size must be between " + std::to_string(http_fetcher_config::min_chunk_size) +
            " and " + std::to_string(http_fetcher_config::max_chunk_size) +
            " bytes, buffered chunks and timeout must be positive"}};
    }
    if (auto code = global_init(); code != CURLE_OK) {
        return unexpected{error{error_code::not_available,
            std::string("libcurl initialisation failed: ") + curl_easy_strerror(code)}};
    }
    return std::unique_ptr<http_stream_fetcher>(new http_stream_fetcher(config));
}

auto http_stream_fetcher::config() const -> const http_fetcher_config& {
    return impl_->config;
}

// ============================================================================
// Fetch
// ============================================================================

auto http_stream_fetcher::open(const std::string& url,
                               const std::optional<byte_range>& range)
    -> result<std::unique_ptr<fetch_response>> {
    RT_LOG_DEBUG(log_category::transfer,
                 "GET " + url + (range ? " [" + range->to_header() + "]" : std::string{}));

    auto response = std::make_unique<curl_fetch_response>(impl_->config, url, range);
    auto started = response->begin();
    if (!started) {
        return unexpected{started.error()};
    }

    RT_LOG_DEBUG(log_category::transfer,
                 "GET " + url + " -> " + std::to_string(response->status_code()));
    return std::unique_ptr<fetch_response>(std::move(response));
}

}  // namespace rtransfer
