/**
 * @file transfer_loop.cpp
 * @brief Implementation of the chunked transfer loop
 */

#include "rtransfer/core/transfer_loop.h"

#include "rtransfer/core/logging.h"
#include "rtransfer/core/progress_tracker.h"
#include "rtransfer/core/url_utils.h"
#include "rtransfer/media/media_source_interface.h"
#include "rtransfer/transport/stream_fetcher_interface.h"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace rtransfer {

namespace {

using clock = std::chrono::steady_clock;

auto elapsed_since(clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
}

auto on_disk_size(const std::filesystem::path& path) -> std::optional<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

}  // namespace

transfer_loop::transfer_loop(transfer_control& control, loop_options options)
    : control_(control), options_(std::move(options)) {}

void transfer_loop::emit(const progress_sample& sample) const {
    if (options_.sink) {
        options_.sink(sample);
    }
}

auto transfer_loop::finish_failed(transfer_outcome& outcome, error reason)
    -> transfer_outcome {
    transfer_log_context ctx;
    ctx.session_id = options_.label;
    ctx.destination = outcome.final_path.string();
    ctx.bytes_transferred = outcome.bytes_transferred;
    ctx.error_message = reason.message;
    RT_LOG_ERROR_CTX(log_category::transfer, "Transfer failed", ctx);

    control_.fail(reason);
    outcome.state = control_.state();
    outcome.failure = control_.failure();
    return outcome;
}

// ============================================================================
// Plain stream path
// ============================================================================

auto transfer_loop::run_stream(stream_fetcher& fetcher, const stream_job& job)
    -> transfer_outcome {
    auto start = clock::now();
    transfer_outcome outcome;
    outcome.final_path = job.destination;
    outcome.bytes_transferred = job.decision.offset;

    auto fail = [&](error reason) {
        outcome.elapsed = elapsed_since(start);
        return finish_failed(outcome, std::move(reason));
    };

    auto opened = fetcher.open(job.url, job.decision.range);
    if (!opened) {
        return fail(opened.error());
    }
    auto response = std::move(opened.value());

    if (response->status() == fetch_status::error) {
        return fail(error{error_code::http_error,
            "HTTP error status " + std::to_string(response->status_code())});
    }

    if (options_.reject_webpages && is_webpage_content_type(response->content_type())) {
        return fail(error{error_code::webpage_content});
    }

    auto reconciled = negotiator_.reconcile(job.decision, response->status(),
                                            response->range_start());
    if (!reconciled) {
        return fail(reconciled.error());
    }
    const resume_decision decision = reconciled.value();
    outcome.bytes_transferred = decision.offset;

    uint64_t declared = response->declared_length();
    uint64_t total = 0;
    if (declared > 0) {
        total = response->status() == fetch_status::partial ? decision.offset + declared
                                                            : declared;
    } else if (job.probed_total && *job.probed_total > decision.offset) {
        total = *job.probed_total;
    }

    if (total > 0 && !options_.size_limit.allows(total)) {
        return fail(error{error_code::file_too_large,
            "Declared size " + std::to_string(total) + " exceeds the configured limit"});
    }

    transfer_log_context ctx;
    ctx.session_id = options_.label;
    ctx.url = job.url;
    ctx.destination = job.destination.string();
    ctx.offset = decision.offset;
    if (total > 0) {
        ctx.total_bytes = total;
    }

    auto cancelled = [&](uint64_t kept) {
        outcome.bytes_transferred = kept;
        outcome.elapsed = elapsed_since(start);
        (void)control_.mark_cancelled();
        outcome.state = control_.state();

        ctx.bytes_transferred = kept;
        RT_LOG_INFO_CTX(log_category::transfer, "Transfer cancelled, partial file kept", ctx);
        return outcome;
    };

    // A cancel that arrived while the response was opening leaves the
    // existing partial file untouched, even when a fallback would truncate it.
    if (control_.at_chunk_boundary() == boundary_action::stop) {
        return cancelled(job.decision.offset);
    }

    // The destination is opened only once the effective decision is known,
    // so a fallback never writes a byte in append mode.
    auto open_mode = std::ios::binary |
                     (decision.mode == write_mode::append ? std::ios::app : std::ios::trunc);
    std::ofstream file(job.destination, open_mode);
    if (!file) {
        return fail(error{error_code::file_open_error,
            "Cannot open destination: " + job.destination.string()});
    }

    RT_LOG_INFO_CTX(log_category::transfer,
                    std::string("Streaming started (") + to_string(decision.mode) + ")", ctx);

    progress_tracker tracker(total, decision.offset, start);
    uint64_t bytes = decision.offset;

    while (true) {
        if (control_.at_chunk_boundary() == boundary_action::stop) {
            file.close();
            return cancelled(bytes);
        }

        auto next = response->next_chunk();
        if (!next) {
            file.close();
            outcome.bytes_transferred = bytes;
            return fail(next.error());
        }
        if (!next.value()) {
            break;
        }

        const auto& chunk = *next.value();
        if (chunk.empty()) {
            continue;
        }

        uint64_t after = bytes + chunk.size();
        if (total > 0 && after > total) {
            file.close();
            outcome.bytes_transferred = bytes;
            return fail(error{error_code::stream_overflow,
                "Source sent " + std::to_string(after) + " bytes, declared " +
                    std::to_string(total)});
        }
        if (total == 0 && !options_.size_limit.allows(after)) {
            file.close();
            outcome.bytes_transferred = bytes;
            return fail(error{error_code::file_too_large,
                "Transfer exceeded the configured limit at " + std::to_string(after) +
                    " bytes"});
        }

        file.write(reinterpret_cast<const char*>(chunk.data()),
                   static_cast<std::streamsize>(chunk.size()));
        if (!file) {
            file.close();
            outcome.bytes_transferred = bytes;
            return fail(error{error_code::file_write_error,
                "Write failed at byte " + std::to_string(bytes)});
        }

        bytes = after;
        emit(tracker.observe(bytes, clock::now()));
    }

    file.close();
    outcome.bytes_transferred = bytes;
    if (file.fail()) {
        return fail(error{error_code::file_write_error, "Cannot flush destination"});
    }

    if (total > 0 && bytes != total) {
        return fail(error{error_code::length_mismatch,
            "Received " + std::to_string(bytes) + " of " + std::to_string(total) + " bytes"});
    }

    auto size = on_disk_size(job.destination);
    if (!size || *size == 0) {
        return fail(error{error_code::empty_download});
    }

    outcome.state = control_.complete();
    outcome.elapsed = elapsed_since(start);

    ctx.bytes_transferred = bytes;
    ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());
    ctx.speed_bps = tracker.average_speed(clock::now());
    ctx.state = to_string(outcome.state);
    RT_LOG_INFO_CTX(log_category::transfer, "Streaming finished", ctx);
    return outcome;
}

// ============================================================================
// Media path
// ============================================================================

auto transfer_loop::run_media(media_source& source, const media_job& job)
    -> transfer_outcome {
    auto start = clock::now();
    transfer_outcome outcome;

    progress_tracker tracker(0, 0, start);
    uint64_t completed_streams = 0;   // bytes of streams that already finished
    uint64_t stream_bytes = 0;        // bytes of the stream in progress
    uint64_t cumulative = 0;
    std::optional<error> local_failure;

    auto handler = [&](const media_event& event) -> media_verdict {
        if (control_.at_chunk_boundary() == boundary_action::stop) {
            return media_verdict::abort;
        }

        // A smaller count than before means the source moved on to the next stream.
        if (event.bytes < stream_bytes) {
            completed_streams += stream_bytes;
        }
        stream_bytes = event.bytes;
        cumulative = std::max(cumulative, completed_streams + event.bytes);

        if (event.kind == media_event_kind::finished) {
            tracker.set_total(cumulative);
            emit(tracker.observe(cumulative, clock::now()));
            return media_verdict::proceed;
        }

        uint64_t total = 0;
        if (event.total && *event.total > 0) {
            total = completed_streams + *event.total;
            if (cumulative > total) {
                if (!event.total_is_estimate) {
                    local_failure = error{error_code::stream_overflow,
                        "Media source reported " + std::to_string(cumulative) +
                            " bytes, declared " + std::to_string(total)};
                    return media_verdict::abort;
                }
                total = cumulative;
            }
        }

        if (!options_.size_limit.allows(total > 0 ? total : cumulative)) {
            local_failure = error{error_code::file_too_large,
                "Media size exceeds the configured limit"};
            return media_verdict::abort;
        }

        tracker.set_total(total);
        emit(tracker.observe(cumulative, clock::now()));
        return media_verdict::proceed;
    };

    transfer_log_context ctx;
    ctx.session_id = options_.label;
    ctx.url = job.url;
    ctx.destination = job.destination_template;
    RT_LOG_INFO_CTX(log_category::media, "Media transfer started (format " + job.format_id + ")",
                    ctx);

    auto fetched = source.fetch(job.url, job.format_id, job.destination_template, handler);
    outcome.bytes_transferred = cumulative;

    auto fail = [&](error reason) {
        outcome.elapsed = elapsed_since(start);
        return finish_failed(outcome, std::move(reason));
    };

    if (local_failure) {
        return fail(*local_failure);
    }

    if (!fetched || fetched.value().aborted) {
        if (control_.is_cancel_requested()) {
            (void)control_.mark_cancelled();
            outcome.state = control_.state();
            outcome.elapsed = elapsed_since(start);
            ctx.bytes_transferred = cumulative;
            RT_LOG_INFO_CTX(log_category::media, "Media transfer cancelled", ctx);
            return outcome;
        }
        if (!fetched) {
            return fail(error{error_code::media_source_error, fetched.error().message});
        }
        return fail(error{error_code::media_source_error, "Media source stopped early"});
    }

    outcome.final_path = fetched.value().final_path;
    auto size = on_disk_size(outcome.final_path);
    if (!size || *size == 0) {
        return fail(error{error_code::empty_download});
    }
    if (cumulative == 0) {
        outcome.bytes_transferred = *size;
    }

    outcome.state = control_.complete();
    outcome.elapsed = elapsed_since(start);

    ctx.destination = outcome.final_path.string();
    ctx.bytes_transferred = outcome.bytes_transferred;
    ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());
    ctx.state = to_string(outcome.state);
    RT_LOG_INFO_CTX(log_category::media, "Media transfer finished", ctx);
    return outcome;
}

}  // namespace rtransfer
