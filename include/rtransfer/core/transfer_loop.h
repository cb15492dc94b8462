/**
 * @file transfer_loop.h
 * @brief Chunked copy loop from a stream or media source to disk
 *
 * One loop serves both transfer paths. Behaviour differences are carried
 * by @ref loop_options: an optional progress sink and a size-limit policy.
 * Pause and cancel are only honoured between chunks; a chunk read from the
 * source is always written completely first.
 */

#ifndef RTRANSFER_CORE_TRANSFER_LOOP_H
#define RTRANSFER_CORE_TRANSFER_LOOP_H

#include "resume_negotiator.h"
#include "transfer_control.h"
#include "transfer_types.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace rtransfer {

class stream_fetcher;
class media_source;

/**
 * @brief Upper bound on the size of a transfer
 *
 * Applied to the declared total when one is known and to the running byte
 * count otherwise.
 */
struct size_limit_policy {
    std::optional<uint64_t> max_bytes;

    [[nodiscard]] static auto unlimited() -> size_limit_policy { return {}; }

    [[nodiscard]] static auto at_most(uint64_t bytes) -> size_limit_policy {
        return size_limit_policy{bytes};
    }

    [[nodiscard]] auto allows(uint64_t bytes) const noexcept -> bool {
        return !max_bytes || bytes <= *max_bytes;
    }
};

using progress_sink = std::function<void(const progress_sample&)>;

struct loop_options {
    progress_sink sink;                 ///< Receives every sample; may be empty
    size_limit_policy size_limit;
    bool reject_webpages = true;        ///< Fail plain responses typed text/html
    std::string label;                  ///< Session label for log records
};

/**
 * @brief Plain stream job
 */
struct stream_job {
    std::string url;
    std::filesystem::path destination;
    resume_decision decision;
    std::optional<uint64_t> probed_total;  ///< Used when the response declares no length
};

/**
 * @brief Media job
 */
struct media_job {
    std::string url;
    std::string format_id;
    std::string destination_template;
};

/**
 * @brief Drives one transfer to a terminal state
 *
 * The control must already be running. Every run ends with the control in
 * a terminal state, and the returned outcome mirrors it.
 */
class transfer_loop {
public:
    transfer_loop(transfer_control& control, loop_options options);

    [[nodiscard]] auto run_stream(stream_fetcher& fetcher, const stream_job& job)
        -> transfer_outcome;

    [[nodiscard]] auto run_media(media_source& source, const media_job& job)
        -> transfer_outcome;

private:
    void emit(const progress_sample& sample) const;

    auto finish_failed(transfer_outcome& outcome, error reason) -> transfer_outcome;

    transfer_control& control_;
    loop_options options_;
    resume_negotiator negotiator_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_TRANSFER_LOOP_H
