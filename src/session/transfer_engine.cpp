/**
 * @file transfer_engine.cpp
 * @brief Implementation of the transfer engine and its builder
 */

#include "rtransfer/session/transfer_engine.h"

#include "rtransfer/core/logging.h"
#include "rtransfer/core/url_utils.h"
#include "rtransfer/media/ytdlp_media_source.h"
#include "rtransfer/session/destination_registry.h"
#include "rtransfer/transport/http_reachability_probe.h"
#include "rtransfer/transport/http_stream_fetcher.h"

#include <atomic>
#include <utility>

namespace rtransfer {

struct transfer_engine::impl {
    std::shared_ptr<const session_dependencies> deps;
    std::atomic<uint64_t> next_id{1};

    explicit impl(std::shared_ptr<const session_dependencies> d) : deps(std::move(d)) {}
};

// ============================================================================
// Builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_config(engine_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_engine::builder::with_max_declared_size(std::optional<uint64_t> bytes)
    -> builder& {
    config_.max_declared_size = bytes;
    return *this;
}

auto transfer_engine::builder::with_pause_poll_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.pause_poll_interval = interval;
    return *this;
}

auto transfer_engine::builder::with_resume_by_default(bool enable) -> builder& {
    config_.resume_by_default = enable;
    return *this;
}

auto transfer_engine::builder::with_reject_webpages(bool enable) -> builder& {
    config_.reject_webpages = enable;
    return *this;
}

auto transfer_engine::builder::with_default_media_format(std::string format) -> builder& {
    config_.default_media_format = std::move(format);
    return *this;
}

auto transfer_engine::builder::with_media_output_template(std::string output_template)
    -> builder& {
    config_.media_output_template = std::move(output_template);
    return *this;
}

auto transfer_engine::builder::with_download_directory(std::filesystem::path directory)
    -> builder& {
    config_.download_directory = std::move(directory);
    return *this;
}

auto transfer_engine::builder::with_progress_callback(session_progress_callback callback)
    -> builder& {
    config_.progress_callback = std::move(callback);
    return *this;
}

auto transfer_engine::builder::with_stream_fetcher(std::shared_ptr<stream_fetcher> fetcher)
    -> builder& {
    fetcher_ = std::move(fetcher);
    return *this;
}

auto transfer_engine::builder::with_media_source(std::shared_ptr<media_source> source)
    -> builder& {
    media_ = std::move(source);
    return *this;
}

auto transfer_engine::builder::with_reachability_probe(
    std::shared_ptr<reachability_probe> probe) -> builder& {
    probe_ = std::move(probe);
    probe_set_ = true;
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (config_.pause_poll_interval.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Pause poll interval must be positive"}};
    }
    if (config_.max_declared_size && *config_.max_declared_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Maximum declared size must be positive"}};
    }
    if (config_.default_media_format.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Default media format must not be empty"}};
    }
    if (config_.media_output_template.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Media output template must not be empty"}};
    }

    auto deps = std::make_shared<session_dependencies>();
    deps->config = std::move(config_);
    deps->registry = destination_registry::create();

    if (fetcher_) {
        deps->fetcher = std::move(fetcher_);
    } else {
        auto fetcher = http_stream_fetcher::create();
        if (!fetcher) {
            return unexpected{fetcher.error()};
        }
        deps->fetcher = std::move(fetcher.value());
    }

    if (media_) {
        deps->media = std::move(media_);
    } else {
        deps->media = std::make_shared<ytdlp_media_source>();
    }

    if (probe_set_) {
        deps->probe = std::move(probe_);
    } else {
        deps->probe = std::make_shared<http_reachability_probe>();
    }

    return transfer_engine{std::move(deps)};
}

// ============================================================================
// transfer_engine
// ============================================================================

transfer_engine::transfer_engine(std::shared_ptr<const session_dependencies> deps)
    : impl_(std::make_unique<impl>(std::move(deps))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    RT_LOG_DEBUG(log_category::engine,
                 "Engine ready (fetcher: " + std::string(impl_->deps->fetcher->type()) +
                     ", media: " + std::string(impl_->deps->media->type()) + ")");
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;
transfer_engine::~transfer_engine() = default;

auto transfer_engine::make_request(std::string url, transfer_mode mode) const
    -> transfer_request {
    transfer_request request;
    request.url = std::move(url);
    request.mode = mode;
    request.resume_allowed = impl_->deps->config.resume_by_default;
    return request;
}

auto transfer_engine::create_session(transfer_request request)
    -> result<std::unique_ptr<transfer_session>> {
    if (request.url.empty()) {
        return unexpected{error{error_code::invalid_request, "Request has no URL"}};
    }

    session_id id{impl_->next_id.fetch_add(1)};
    RT_LOG_DEBUG(log_category::engine, "Created " + id.to_string() + " for " + request.url);
    return std::make_unique<transfer_session>(id, std::move(request), impl_->deps);
}

auto transfer_engine::list_formats(const std::string& url)
    -> result<std::vector<media_format>> {
    if (auto valid = validate_url_format(url); !valid) {
        return unexpected{valid.error()};
    }

    auto formats = impl_->deps->media->list_formats(url);
    if (!formats) {
        RT_LOG_WARN(log_category::media,
                    "Could not list formats: " + formats.error().message);
        return unexpected{formats.error()};
    }
    return filter_playable_formats(formats.value());
}

auto transfer_engine::config() const -> const engine_config& {
    return impl_->deps->config;
}

auto transfer_engine::active_destinations() const -> std::size_t {
    return impl_->deps->registry->size();
}

}  // namespace rtransfer
