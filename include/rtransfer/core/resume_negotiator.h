/**
 * @file resume_negotiator.h
 * @brief Decides whether a partial local file is extended or restarted
 *
 * The negotiator runs once before the first byte is written, and once more
 * if the server answers a range request with the whole resource.
 */

#ifndef RTRANSFER_CORE_RESUME_NEGOTIATOR_H
#define RTRANSFER_CORE_RESUME_NEGOTIATOR_H

#include "transfer_types.h"
#include "types.h"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace rtransfer {

/**
 * @brief Result of the initial negotiation
 */
struct resume_plan {
    resume_decision decision;
    bool already_complete = false;  ///< Local file already holds the whole resource
    uint64_t local_size = 0;        ///< Size of the destination at negotiation time
};

/**
 * @brief Resume negotiation protocol
 *
 * - resume not allowed or destination missing: offset 0, truncate, no range
 * - local size >= known remote size > 0: already complete, no stream opened
 * - otherwise: append from the local size with "bytes=<size>-"
 *
 * @code
 * resume_negotiator negotiator;
 * auto plan = negotiator.negotiate(path, true, probed_size);
 * if (!plan) { ... }
 * auto response = fetcher.open(url, plan.value().decision.range);
 * auto effective = negotiator.reconcile(plan.value().decision, response->status(),
 *                                       response->range_start());
 * @endcode
 */
class resume_negotiator {
public:
    /**
     * @brief Compute the initial decision from local state
     * @param destination Destination file path
     * @param resume_allowed Whether the caller allows extending a partial file
     * @param probed_remote_size Declared remote size, if the probe found one
     * @return Plan, or file_read_error when the destination cannot be inspected
     */
    [[nodiscard]] auto negotiate(const std::filesystem::path& destination,
                                 bool resume_allowed,
                                 std::optional<uint64_t> probed_remote_size) const
        -> result<resume_plan>;

    /**
     * @brief Decision used after the server ignored a range request
     */
    [[nodiscard]] auto fallback() const -> resume_decision;

    /**
     * @brief Reconcile a decision with the actual response kind
     *
     * A full response to a range request yields fallback(). A partial
     * response to a request without a range is unexpected_partial_content.
     * An error response is http_error.
     *
     * When the source reports where a partial response starts, a start of 0
     * is treated as the whole resource (fallback()), and any other start
     * different from the decision's offset is range_mismatch.
     */
    [[nodiscard]] auto reconcile(const resume_decision& decision,
                                 fetch_status status,
                                 std::optional<uint64_t> range_start = std::nullopt) const
        -> result<resume_decision>;
};

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_RESUME_NEGOTIATOR_H
