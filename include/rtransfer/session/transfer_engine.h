/**
 * @file transfer_engine.h
 * @brief Factory for transfer sessions sharing configuration and collaborators
 */

#ifndef RTRANSFER_SESSION_TRANSFER_ENGINE_H
#define RTRANSFER_SESSION_TRANSFER_ENGINE_H

#include "engine_config.h"
#include "transfer_session.h"
#include "rtransfer/core/types.h"
#include "rtransfer/media/media_source_interface.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rtransfer {

class stream_fetcher;
class reachability_probe;

/**
 * @brief Transfer engine
 *
 * Owns the engine configuration, the injected collaborators and the
 * destination registry. Collaborators left unset by the builder default to
 * the HTTP adapters and the yt-dlp media source.
 *
 * @code
 * auto engine = transfer_engine::builder()
 *     .with_download_directory("/tmp/downloads")
 *     .with_max_declared_size(1ULL << 30)
 *     .build();
 * if (!engine) { ... }
 *
 * auto session = engine.value().create_session(
 *     engine.value().make_request("https://example.com/file.zip"));
 * @endcode
 */
class transfer_engine {
public:
    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(engine_config config) -> builder&;

        /**
         * @brief Largest accepted declared size (default: 10 GiB)
         * @param bytes Limit, or nullopt for no limit
         */
        auto with_max_declared_size(std::optional<uint64_t> bytes) -> builder&;

        /**
         * @brief Pause wait bound (default: 100 ms)
         */
        auto with_pause_poll_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_resume_by_default(bool enable) -> builder&;
        auto with_reject_webpages(bool enable) -> builder&;
        auto with_default_media_format(std::string format) -> builder&;
        auto with_media_output_template(std::string output_template) -> builder&;
        auto with_download_directory(std::filesystem::path directory) -> builder&;
        auto with_progress_callback(session_progress_callback callback) -> builder&;

        auto with_stream_fetcher(std::shared_ptr<stream_fetcher> fetcher) -> builder&;
        auto with_media_source(std::shared_ptr<media_source> source) -> builder&;

        /**
         * @brief Pre-flight probe; pass nullptr to skip probing
         */
        auto with_reachability_probe(std::shared_ptr<reachability_probe> probe) -> builder&;

        /**
         * @brief Build the engine
         * @return Engine, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        engine_config config_;
        std::shared_ptr<stream_fetcher> fetcher_;
        std::shared_ptr<media_source> media_;
        std::shared_ptr<reachability_probe> probe_;
        bool probe_set_ = false;
    };

    // Non-copyable, movable
    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;
    ~transfer_engine();

    /**
     * @brief Request for @p url using the engine's resume default
     */
    [[nodiscard]] auto make_request(std::string url,
                                    transfer_mode mode = transfer_mode::plain_file) const
        -> transfer_request;

    /**
     * @brief Create an idle session for @p request
     * @return Session, or invalid_request for an empty URL
     */
    [[nodiscard]] auto create_session(transfer_request request)
        -> result<std::unique_ptr<transfer_session>>;

    /**
     * @brief Formats of a media URL carrying both video and audio
     *
     * An empty list means only the default selector is offered.
     */
    [[nodiscard]] auto list_formats(const std::string& url) -> result<std::vector<media_format>>;

    [[nodiscard]] auto config() const -> const engine_config&;

    /**
     * @brief Number of destinations held by running sessions
     */
    [[nodiscard]] auto active_destinations() const -> std::size_t;

private:
    explicit transfer_engine(std::shared_ptr<const session_dependencies> deps);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_SESSION_TRANSFER_ENGINE_H
