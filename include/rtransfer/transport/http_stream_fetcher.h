/**
 * @file http_stream_fetcher.h
 * @brief Streaming fetch adapter over libcurl
 *
 * Sends GET requests (with a Range header when resuming) and exposes the
 * response body as a sequence of fixed-size chunks, handed over as they
 * arrive from the network.
 */

#ifndef RTRANSFER_TRANSPORT_HTTP_STREAM_FETCHER_H
#define RTRANSFER_TRANSPORT_HTTP_STREAM_FETCHER_H

#include "stream_fetcher_interface.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace rtransfer {

struct http_fetcher_config {
    static constexpr std::size_t min_chunk_size = 1024;
    static constexpr std::size_t max_chunk_size = 4 * 1024 * 1024;
    static constexpr std::size_t default_chunk_size = 8 * 1024;

    std::chrono::milliseconds timeout{30000};  ///< Connect and response-head timeout
    std::size_t chunk_size = default_chunk_size;
    std::size_t max_buffered_chunks = 16;       ///< Received chunks held for a slow reader
    std::string user_agent = "rtransfer/1.0";

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return chunk_size >= min_chunk_size && chunk_size <= max_chunk_size &&
               max_buffered_chunks > 0 && timeout.count() > 0;
    }
};

/**
 * @brief stream_fetcher backed by libcurl
 *
 * Each opened response receives on its own thread. open() returns once the
 * status and headers are in; the body follows chunk by chunk, and a reader
 * that stops pulling (paused) holds the connection back once
 * max_buffered_chunks are waiting. Destroying the response aborts the
 * transfer.
 *
 * @code
 * auto fetcher = http_stream_fetcher::create(http_fetcher_config{});
 * if (!fetcher) { ... }
 * auto engine = transfer_engine::builder()
 *     .with_stream_fetcher(std::move(fetcher.value()))
 *     .build();
 * @endcode
 */
class http_stream_fetcher : public stream_fetcher {
public:
    /**
     * @brief Create a fetcher
     * @return Fetcher, or invalid_configuration for an out-of-range chunk size
     */
    [[nodiscard]] static auto create(const http_fetcher_config& config = {})
        -> result<std::unique_ptr<http_stream_fetcher>>;

    ~http_stream_fetcher() override;

    [[nodiscard]] auto type() const -> std::string_view override { return "http"; }

    [[nodiscard]] auto open(const std::string& url,
                            const std::optional<byte_range>& range)
        -> result<std::unique_ptr<fetch_response>> override;

    [[nodiscard]] auto config() const -> const http_fetcher_config&;

private:
    explicit http_stream_fetcher(const http_fetcher_config& config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_TRANSPORT_HTTP_STREAM_FETCHER_H
