/**
 * @file transfer_session.h
 * @brief One request bound to one transfer loop run
 */

#ifndef RTRANSFER_SESSION_TRANSFER_SESSION_H
#define RTRANSFER_SESSION_TRANSFER_SESSION_H

#include "engine_config.h"
#include "rtransfer/core/transfer_types.h"
#include "rtransfer/core/types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace rtransfer {

class stream_fetcher;
class media_source;
class reachability_probe;
class destination_registry;

/**
 * @brief Collaborators shared by the sessions of one engine
 */
struct session_dependencies {
    engine_config config;
    std::shared_ptr<stream_fetcher> fetcher;
    std::shared_ptr<media_source> media;
    std::shared_ptr<reachability_probe> probe;  ///< May be null: no pre-flight probe
    std::shared_ptr<destination_registry> registry;
};

/**
 * @brief Transfer session
 *
 * start() validates the request, probes the URL, claims the destination
 * and negotiates resume on the calling thread. A session that needs no
 * transfer (already complete) or fails validation is terminal when start()
 * returns; otherwise a dedicated worker thread runs the transfer loop.
 *
 * The caller interacts with the worker only through pause(), resume(),
 * cancel() and latest_progress().
 *
 * @code
 * auto session = engine.create_session(request);
 * if (!session) { ... }
 * auto& s = *session.value();
 * if (auto started = s.start(); !started) { ... }
 * s.pause();
 * s.resume();
 * auto outcome = s.wait();
 * @endcode
 */
class transfer_session {
public:
    transfer_session(session_id id,
                     transfer_request request,
                     std::shared_ptr<const session_dependencies> deps);

    /**
     * @brief Cancels a running transfer and joins the worker
     */
    ~transfer_session();

    transfer_session(const transfer_session&) = delete;
    auto operator=(const transfer_session&) -> transfer_session& = delete;

    [[nodiscard]] auto id() const -> session_id;
    [[nodiscard]] auto request() const -> const transfer_request&;

    /**
     * @brief Run pre-flight steps and launch the worker
     *
     * Returns invalid_state_transition if already started. Validation,
     * conflict and negotiation failures are returned as well, and leave
     * the session failed.
     */
    [[nodiscard]] auto start() -> result<void>;

    [[nodiscard]] auto pause() -> result<void>;
    [[nodiscard]] auto resume() -> result<void>;
    [[nodiscard]] auto cancel() -> result<void>;

    [[nodiscard]] auto state() const -> transfer_state;

    /**
     * @brief Most recent progress sample, if any was produced yet
     */
    [[nodiscard]] auto latest_progress() const -> std::optional<progress_sample>;

    /**
     * @brief Number of samples published so far
     */
    [[nodiscard]] auto progress_sequence() const -> uint64_t;

    /**
     * @brief Destination resolved by start(); empty before
     */
    [[nodiscard]] auto destination() const -> std::filesystem::path;

    /**
     * @brief Block until the session is terminal
     * @return Outcome, or session_not_started
     */
    [[nodiscard]] auto wait() -> result<transfer_outcome>;

    /**
     * @brief Block until the session is terminal or the timeout expires
     * @return Outcome, session_not_started, or wait_timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> result<transfer_outcome>;

    /**
     * @brief Outcome if the session already reached a terminal state
     */
    [[nodiscard]] auto outcome() const -> std::optional<transfer_outcome>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_SESSION_TRANSFER_SESSION_H
