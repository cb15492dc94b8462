/**
 * @file ytdlp_media_source.h
 * @brief Media source running the yt-dlp executable as a child process
 *
 * Progress is read from yt-dlp's newline progress output using a fixed
 * progress template; formats come from its JSON dump (-J).
 */

#ifndef RTRANSFER_MEDIA_YTDLP_MEDIA_SOURCE_H
#define RTRANSFER_MEDIA_YTDLP_MEDIA_SOURCE_H

#include "media_source_interface.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtransfer {

struct ytdlp_config {
    std::string executable = "yt-dlp";
    std::vector<std::string> extra_arguments;  ///< Appended before the URL
};

/**
 * @brief media_source backed by yt-dlp
 *
 * Aborting from the event handler terminates the child with SIGTERM.
 */
class ytdlp_media_source : public media_source {
public:
    explicit ytdlp_media_source(ytdlp_config config = {});

    [[nodiscard]] auto type() const -> std::string_view override { return "yt-dlp"; }

    [[nodiscard]] auto list_formats(const std::string& url)
        -> result<std::vector<media_format>> override;

    [[nodiscard]] auto fetch(const std::string& url,
                             const std::string& format_id,
                             const std::string& destination_template,
                             const event_handler& handler)
        -> result<media_fetch_result> override;

    [[nodiscard]] auto config() const -> const ytdlp_config& { return config_; }

private:
    ytdlp_config config_;
};

namespace ytdlp {

/// Prefix of progress lines produced by the progress template
inline constexpr std::string_view progress_prefix = "rtprog ";

/// Prefix of the line carrying the final output path
inline constexpr std::string_view final_path_prefix = "rtfile ";

/**
 * @brief Argument vector for a download run
 */
[[nodiscard]] auto build_fetch_arguments(const ytdlp_config& config,
                                         const std::string& url,
                                         const std::string& format_id,
                                         const std::string& destination_template)
    -> std::vector<std::string>;

/**
 * @brief Argument vector for a JSON metadata dump
 */
[[nodiscard]] auto build_listing_arguments(const ytdlp_config& config,
                                           const std::string& url)
    -> std::vector<std::string>;

/**
 * @brief Parse one "rtprog <status> <bytes> <total> <estimate> <file>" line
 * @return Event, or nullopt for any other line
 */
[[nodiscard]] auto parse_progress_line(std::string_view line) -> std::optional<media_event>;

/**
 * @brief Parse one "rtfile <path>" line
 */
[[nodiscard]] auto parse_final_path_line(std::string_view line)
    -> std::optional<std::filesystem::path>;

/**
 * @brief Extract every entry of the "formats" array of a -J dump
 * @return Formats, or media_source_error for malformed JSON
 */
[[nodiscard]] auto parse_format_listing(std::string_view json)
    -> result<std::vector<media_format>>;

}  // namespace ytdlp

}  // namespace rtransfer

#endif  // RTRANSFER_MEDIA_YTDLP_MEDIA_SOURCE_H
