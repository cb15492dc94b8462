/**
 * @file body_pipe.h
 * @brief Bounded hand-off of response body bytes between two threads
 *
 * The receiving thread writes body bytes as they arrive; they are cut into
 * fixed-size chunks and queued. The consuming thread reads one chunk at a
 * time. A full queue blocks the writer, so at most max_chunks chunks of the
 * body are held in memory.
 */

#ifndef RTRANSFER_SRC_TRANSPORT_BODY_PIPE_H
#define RTRANSFER_SRC_TRANSPORT_BODY_PIPE_H

#include "rtransfer/core/types.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace rtransfer::detail {

class body_pipe {
public:
    body_pipe(std::size_t chunk_size, std::size_t max_chunks);

    body_pipe(const body_pipe&) = delete;
    auto operator=(const body_pipe&) -> body_pipe& = delete;

    // ------------------------------------------------------------------
    // Writer side
    // ------------------------------------------------------------------

    /**
     * @brief Append body bytes, blocking while the queue is full
     * @return false once the reader abandoned the pipe
     */
    [[nodiscard]] auto write(const char* data, std::size_t size) -> bool;

    /**
     * @brief End of body; queues the last short chunk
     * @param failure Receive error to report after the queued chunks
     */
    void close(std::optional<error> failure = std::nullopt);

    // ------------------------------------------------------------------
    // Reader side
    // ------------------------------------------------------------------

    /**
     * @brief Next chunk, blocking until one is queued or the pipe is closed
     * @return Chunk, nullopt after the last chunk, or the receive error
     */
    [[nodiscard]] auto read() -> result<std::optional<std::vector<std::byte>>>;

    /**
     * @brief Reader goes away; a blocked or later write() returns false
     */
    void abandon();

    [[nodiscard]] auto is_abandoned() const -> bool;

private:
    std::size_t chunk_size_;
    std::size_t max_chunks_;

    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
    std::deque<std::vector<std::byte>> queue_;
    std::vector<std::byte> pending_;
    std::optional<error> failure_;
    bool closed_ = false;
    bool abandoned_ = false;
};

}  // namespace rtransfer::detail

#endif  // RTRANSFER_SRC_TRANSPORT_BODY_PIPE_H
