/**
 * @file transfer_session.cpp
 * @brief Implementation of the transfer session orchestrator
 */

#include "rtransfer/session/transfer_session.h"

#include "rtransfer/core/logging.h"
#include "rtransfer/core/progress_channel.h"
#include "rtransfer/core/progress_tracker.h"
#include "rtransfer/core/resume_negotiator.h"
#include "rtransfer/core/transfer_control.h"
#include "rtransfer/core/transfer_loop.h"
#include "rtransfer/core/url_utils.h"
#include "rtransfer/media/media_source_interface.h"
#include "rtransfer/session/destination_registry.h"
#include "rtransfer/transport/reachability_probe.h"
#include "rtransfer/transport/stream_fetcher_interface.h"

#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace rtransfer {

class transfer_session::impl {
public:
    impl(session_id sid, transfer_request req, std::shared_ptr<const session_dependencies> d)
        : id(sid),
          request(std::move(req)),
          deps(std::move(d)),
          control(deps->config.pause_poll_interval) {
        control.set_transition_listener([this](transfer_state from, transfer_state to) {
            RT_LOG_DEBUG(log_category::session,
                         id.to_string() + ": " + to_string(from) + " -> " + to_string(to));
        });
    }

    ~impl() {
        auto current = control.state();
        if (current == transfer_state::running || current == transfer_state::paused) {
            (void)control.cancel();
        }
        join_worker();
    }

    // ========================================================================
    // Start
    // ========================================================================

    auto start() -> result<void> {
        {
            std::lock_guard lock(mutex);
            if (started) {
                return unexpected{error{error_code::invalid_state_transition,
                    "Session already started: " + id.to_string()}};
            }
            started = true;
        }

        transfer_log_context ctx;
        ctx.session_id = id.to_string();
        ctx.url = request.url;
        RT_LOG_INFO_CTX(log_category::session,
                        std::string("Starting ") + to_string(request.mode) + " transfer", ctx);

        if (auto valid = validate_url_format(request.url); !valid) {
            return fail_before_start(valid.error());
        }

        probe_result probed = probe_result::unknown();
        if (deps->probe) {
            probed = deps->probe->probe(request.url);
            if (!probed.reachable) {
                return fail_before_start(error{error_code::url_unreachable,
                    "URL is not reachable (status " + std::to_string(probed.status_code) +
                        "): " + request.url});
            }
        }

        if (request.mode == transfer_mode::media_stream) {
            return start_media();
        }
        return start_plain(probed);
    }

    auto start_plain(const probe_result& probed) -> result<void> {
        if (!deps->fetcher) {
            return fail_before_start(error{error_code::not_available,
                "No stream fetcher configured"});
        }

        std::optional<uint64_t> remote_size;
        if (probed.declared_size && *probed.declared_size > 0) {
            remote_size = probed.declared_size;
        }

        const auto& cfg = deps->config;
        if (remote_size && cfg.max_declared_size && *remote_size > *cfg.max_declared_size) {
            return fail_before_start(error{error_code::file_too_large,
                "Declared size " + format_bytes(static_cast<double>(*remote_size)) +
                    " exceeds the limit of " +
                    format_bytes(static_cast<double>(*cfg.max_declared_size))});
        }
        if (cfg.reject_webpages && probed.content_kind &&
            is_webpage_content_type(*probed.content_kind)) {
            return fail_before_start(error{error_code::webpage_content});
        }

        std::optional<std::string_view> content_type;
        if (probed.content_kind) {
            content_type = *probed.content_kind;
        }
        auto inferred = infer_filename(request.url, content_type);

        std::filesystem::path dest = request.destination
                                         ? *request.destination
                                         : cfg.download_directory / inferred;
        std::error_code ec;
        if (std::filesystem::is_directory(dest, ec)) {
            dest /= inferred;
        }
        if (auto prepared = prepare_parent(dest); !prepared) {
            return fail_before_start(prepared.error());
        }
        set_destination(dest);

        auto lease = deps->registry->acquire(dest);
        if (!lease) {
            return fail_before_start(lease.error());
        }

        resume_negotiator negotiator;
        auto plan = negotiator.negotiate(dest, request.resume_allowed, remote_size);
        if (!plan) {
            return fail_before_start(plan.error());
        }

        if (plan.value().already_complete) {
            // The outcome is in place before waiters see the terminal state.
            transfer_outcome result;
            result.state = transfer_state::completed;
            result.final_path = dest;
            result.bytes_transferred = plan.value().local_size;
            result.already_complete = true;
            store_outcome(std::move(result));
            if (auto done = control.complete_without_transfer(); !done) {
                clear_outcome();
                return done;
            }
            RT_LOG_INFO(log_category::session,
                        id.to_string() + ": already complete, nothing to transfer");
            return {};
        }

        stream_job job;
        job.url = request.url;
        job.destination = dest;
        job.decision = plan.value().decision;
        job.probed_total = remote_size;

        if (auto running = control.start(); !running) {
            return running;
        }

        std::lock_guard lock(join_mutex);
        worker = std::thread([this, job = std::move(job),
                              held = std::move(lease.value())]() mutable {
            run_worker([&](transfer_loop& loop) {
                return loop.run_stream(*deps->fetcher, job);
            });
            held.release();
        });
        return {};
    }

    auto start_media() -> result<void> {
        if (!deps->media) {
            return fail_before_start(error{error_code::not_available,
                "No media source configured"});
        }

        const auto& cfg = deps->config;
        media_job job;
        job.url = request.url;
        job.format_id = request.quality.empty() ? cfg.default_media_format
                                                : extract_format_id(request.quality);

        std::filesystem::path target = request.destination
                                           ? *request.destination
                                           : cfg.download_directory / cfg.media_output_template;
        std::error_code ec;
        if (std::filesystem::is_directory(target, ec)) {
            target /= cfg.media_output_template;
        }
        if (auto prepared = prepare_parent(target); !prepared) {
            return fail_before_start(prepared.error());
        }
        job.destination_template = target.string();
        set_destination(target);

        // A template names no file until the media source expands it, so only a
        // concrete path is leased.
        destination_lease held;
        if (target.string().find("%(") == std::string::npos) {
            auto lease = deps->registry->acquire(target);
            if (!lease) {
                return fail_before_start(lease.error());
            }
            held = std::move(lease.value());
        }

        if (auto running = control.start(); !running) {
            return running;
        }

        std::lock_guard lock(join_mutex);
        worker = std::thread([this, job = std::move(job),
                              held = std::move(held)]() mutable {
            run_worker([&](transfer_loop& loop) {
                return loop.run_media(*deps->media, job);
            });
            held.release();
        });
        return {};
    }

    // ========================================================================
    // Worker
    // ========================================================================

    template <typename Body>
    void run_worker(Body&& body) {
        loop_options options;
        options.sink = [this](const progress_sample& sample) { publish(sample); };
        options.size_limit = size_limit_policy{deps->config.max_declared_size};
        options.reject_webpages = deps->config.reject_webpages;
        options.label = id.to_string();

        transfer_outcome result;
        try {
            transfer_loop loop(control, std::move(options));
            result = body(loop);
        } catch (const std::exception& e) {
            control.fail(error{error_code::internal_error, e.what()});
            result.state = control.state();
            result.failure = control.failure();
            result.final_path = destination_snapshot();
        }

        if (result.final_path.empty()) {
            result.final_path = destination_snapshot();
        }

        transfer_log_context ctx;
        ctx.session_id = id.to_string();
        ctx.destination = result.final_path.string();
        ctx.bytes_transferred = result.bytes_transferred;
        ctx.duration_ms = static_cast<uint64_t>(result.elapsed.count());
        ctx.state = to_string(result.state);
        if (result.failure) {
            ctx.error_message = result.failure->message;
        }
        RT_LOG_INFO_CTX(log_category::session, "Session finished", ctx);

        store_outcome(std::move(result));
    }

    void publish(const progress_sample& sample) {
        progress.publish(sample);
        if (deps->config.progress_callback) {
            deps->config.progress_callback(id, sample);
        }
        if (get_logger().is_enabled(log_level::trace)) {
            RT_LOG_TRACE(log_category::progress,
                         id.to_string() + " " + format_progress_line(sample));
        }
    }

    // ========================================================================
    // Helpers
    // ========================================================================

    auto fail_before_start(const error& reason) -> result<void> {
        transfer_outcome result;
        result.state = transfer_state::failed;
        result.failure = reason;
        result.final_path = destination_snapshot();
        store_outcome(result);

        if (!control.fail(reason)) {
            result.state = control.state();
            result.failure = control.failure();
            store_outcome(std::move(result));
        }

        transfer_log_context ctx;
        ctx.session_id = id.to_string();
        ctx.url = request.url;
        ctx.error_message = reason.message;
        RT_LOG_ERROR_CTX(log_category::session, "Session rejected", ctx);
        return unexpected{reason};
    }

    static auto prepare_parent(const std::filesystem::path& target) -> result<void> {
        auto parent = target.parent_path();
        if (parent.empty()) {
            return {};
        }
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return unexpected{error{error_code::file_open_error,
                "Cannot create directory " + parent.string() + ": " + ec.message()}};
        }
        return {};
    }

    void set_destination(const std::filesystem::path& path) {
        std::lock_guard lock(mutex);
        destination = path;
    }

    auto destination_snapshot() const -> std::filesystem::path {
        std::lock_guard lock(mutex);
        return destination;
    }

    void store_outcome(transfer_outcome result) {
        std::lock_guard lock(mutex);
        outcome = std::move(result);
    }

    void clear_outcome() {
        std::lock_guard lock(mutex);
        outcome.reset();
    }

    void join_worker() {
        std::lock_guard lock(join_mutex);
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }

    auto is_started() const -> bool {
        std::lock_guard lock(mutex);
        return started;
    }

    auto finished_outcome() -> result<transfer_outcome> {
        join_worker();
        std::lock_guard lock(mutex);
        if (!outcome) {
            return unexpected{error{error_code::internal_error,
                "Session terminal without an outcome"}};
        }
        return *outcome;
    }

    session_id id;
    transfer_request request;
    std::shared_ptr<const session_dependencies> deps;
    transfer_control control;
    progress_channel<progress_sample> progress;

    mutable std::mutex mutex;
    bool started = false;
    std::filesystem::path destination;
    std::optional<transfer_outcome> outcome;

    std::mutex join_mutex;
    std::thread worker;
};

// ============================================================================
// transfer_session
// ============================================================================

transfer_session::transfer_session(session_id id,
                                   transfer_request request,
                                   std::shared_ptr<const session_dependencies> deps)
    : impl_(std::make_unique<impl>(id, std::move(request), std::move(deps))) {}

transfer_session::~transfer_session() = default;

auto transfer_session::id() const -> session_id {
    return impl_->id;
}

auto transfer_session::request() const -> const transfer_request& {
    return impl_->request;
}

auto transfer_session::start() -> result<void> {
    return impl_->start();
}

auto transfer_session::pause() -> result<void> {
    auto paused = impl_->control.pause();
    if (paused) {
        RT_LOG_INFO(log_category::session, impl_->id.to_string() + ": pause requested");
    }
    return paused;
}

auto transfer_session::resume() -> result<void> {
    auto resumed = impl_->control.resume();
    if (resumed) {
        RT_LOG_INFO(log_category::session, impl_->id.to_string() + ": resumed");
    }
    return resumed;
}

auto transfer_session::cancel() -> result<void> {
    auto cancelled = impl_->control.cancel();
    if (cancelled) {
        RT_LOG_INFO(log_category::session, impl_->id.to_string() + ": cancel requested");
    }
    return cancelled;
}

auto transfer_session::state() const -> transfer_state {
    return impl_->control.state();
}

auto transfer_session::latest_progress() const -> std::optional<progress_sample> {
    return impl_->progress.latest();
}

auto transfer_session::progress_sequence() const -> uint64_t {
    return impl_->progress.sequence();
}

auto transfer_session::destination() const -> std::filesystem::path {
    return impl_->destination_snapshot();
}

auto transfer_session::wait() -> result<transfer_outcome> {
    if (!impl_->is_started()) {
        return unexpected{error{error_code::session_not_started}};
    }
    impl_->control.wait_terminal();
    return impl_->finished_outcome();
}

auto transfer_session::wait_for(std::chrono::milliseconds timeout)
    -> result<transfer_outcome> {
    if (!impl_->is_started()) {
        return unexpected{error{error_code::session_not_started}};
    }
    if (!impl_->control.wait_terminal_for(timeout)) {
        return unexpected{error{error_code::wait_timeout}};
    }
    return impl_->finished_outcome();
}

auto transfer_session::outcome() const -> std::optional<transfer_outcome> {
    std::lock_guard lock(impl_->mutex);
    return impl_->outcome;
}

}  // namespace rtransfer
