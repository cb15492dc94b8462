/**
 * @file stream_fetcher_interface.h
 * @brief Streaming fetch capability consumed by the transfer loop
 *
 * The core never speaks HTTP; it opens a response through this interface
 * and drains its chunk sequence.
 */

#ifndef RTRANSFER_TRANSPORT_STREAM_FETCHER_INTERFACE_H
#define RTRANSFER_TRANSPORT_STREAM_FETCHER_INTERFACE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rtransfer/core/transfer_types.h"
#include "rtransfer/core/types.h"

namespace rtransfer {

/**
 * @brief An opened response with a forward-only chunk sequence
 *
 * The sequence is finite and cannot be restarted. A response belongs to
 * the worker that opened it.
 */
class fetch_response {
public:
    virtual ~fetch_response() = default;

    fetch_response(const fetch_response&) = delete;
    auto operator=(const fetch_response&) -> fetch_response& = delete;

    [[nodiscard]] virtual auto status() const -> fetch_status = 0;

    /**
     * @brief Protocol status code (HTTP status for HTTP sources), 0 if none
     */
    [[nodiscard]] virtual auto status_code() const -> int = 0;

    /**
     * @brief Length of this response body, 0 when undeclared
     *
     * For a partial response this is the length of the range, not of the
     * whole resource.
     */
    [[nodiscard]] virtual auto declared_length() const -> uint64_t = 0;

    /**
     * @brief Declared content type, empty when absent
     */
    [[nodiscard]] virtual auto content_type() const -> std::string { return {}; }

    /**
     * @brief First byte of a partial response, nullopt when the source did not say
     */
    [[nodiscard]] virtual auto range_start() const -> std::optional<uint64_t> {
        return std::nullopt;
    }

    /**
     * @brief Pull the next chunk
     * @return Chunk bytes, nullopt once the sequence is exhausted, or a
     *         transport error
     */
    [[nodiscard]] virtual auto next_chunk() -> result<std::optional<std::vector<std::byte>>> = 0;

protected:
    fetch_response() = default;
};

/**
 * @brief Streaming fetch capability
 *
 * @code
 * auto opened = fetcher.open(url, byte_range{4096});
 * if (!opened) { return opened.error(); }
 * auto& response = *opened.value();
 * while (true) {
 *     auto chunk = response.next_chunk();
 *     if (!chunk || !chunk.value()) break;
 *     ...
 * }
 * @endcode
 */
class stream_fetcher {
public:
    virtual ~stream_fetcher() = default;

    stream_fetcher(const stream_fetcher&) = delete;
    auto operator=(const stream_fetcher&) -> stream_fetcher& = delete;

    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    /**
     * @brief Open the resource, optionally from a byte offset
     * @param url Source URL
     * @param range Requested range; nullopt asks for the whole resource
     * @return Opened response or connection error
     */
    [[nodiscard]] virtual auto open(const std::string& url,
                                    const std::optional<byte_range>& range)
        -> result<std::unique_ptr<fetch_response>> = 0;

protected:
    stream_fetcher() = default;
};

}  // namespace rtransfer

#endif  // RTRANSFER_TRANSPORT_STREAM_FETCHER_INTERFACE_H
