/**
 * @file media_source_interface.h
 * @brief Media source capability for streaming-site downloads
 */

#ifndef RTRANSFER_MEDIA_MEDIA_SOURCE_INTERFACE_H
#define RTRANSFER_MEDIA_MEDIA_SOURCE_INTERFACE_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rtransfer/core/types.h"

namespace rtransfer {

/**
 * @brief One downloadable format of a media URL
 */
struct media_format {
    std::string id;
    std::optional<int> height;
    std::optional<double> fps;
    std::string container;  ///< File extension, e.g. "mp4"
    std::string note;
    bool has_video = true;
    bool has_audio = true;

    /**
     * @brief Selector label "<id> - <height>p <note> <ext>"
     */
    [[nodiscard]] auto label() const -> std::string {
        std::string out = id + " - ";
        out += height ? std::to_string(*height) + "p" : std::string("?p");
        if (!note.empty()) {
            out += " " + note;
        }
        out += " " + container;
        return out;
    }
};

/**
 * @brief Keep formats carrying video and audio in mp4, webm or mkv
 */
[[nodiscard]] inline auto filter_playable_formats(const std::vector<media_format>& formats)
    -> std::vector<media_format> {
    std::vector<media_format> playable;
    for (const auto& format : formats) {
        bool container_ok = format.container == "mp4" || format.container == "webm" ||
                            format.container == "mkv";
        if (format.has_video && format.has_audio && container_ok) {
            playable.push_back(format);
        }
    }
    return playable;
}

/**
 * @brief Kind of media progress event
 */
enum class media_event_kind {
    downloading,
    finished
};

/**
 * @brief Byte-count event emitted by a media source
 *
 * Byte counts are per downloaded stream; a source fetching separate video
 * and audio streams restarts its count for each one.
 */
struct media_event {
    media_event_kind kind = media_event_kind::downloading;
    uint64_t bytes = 0;
    std::optional<uint64_t> total;  ///< Exact size or estimate, if known
    bool total_is_estimate = false;
    std::filesystem::path filename; ///< Output file the event refers to, if known
};

/**
 * @brief Handler verdict telling the source whether to go on
 */
enum class media_verdict {
    proceed,
    abort
};

/**
 * @brief Completed media fetch
 */
struct media_fetch_result {
    std::filesystem::path final_path;
    bool aborted = false;  ///< Handler asked the source to stop
};

/**
 * @brief Media source capability
 */
class media_source {
public:
    using event_handler = std::function<media_verdict(const media_event&)>;

    virtual ~media_source() = default;

    media_source(const media_source&) = delete;
    auto operator=(const media_source&) -> media_source& = delete;

    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    /**
     * @brief List formats offered for a URL (may be empty)
     */
    [[nodiscard]] virtual auto list_formats(const std::string& url)
        -> result<std::vector<media_format>> = 0;

    /**
     * @brief Download a URL, reporting progress through @p handler
     * @param url Media page URL
     * @param format_id Format selector passed to the source
     * @param destination_template Output path or template
     * @param handler Called for every event; abort stops the source
     * @return Final path, or media_source_error
     */
    [[nodiscard]] virtual auto fetch(const std::string& url,
                                     const std::string& format_id,
                                     const std::string& destination_template,
                                     const event_handler& handler)
        -> result<media_fetch_result> = 0;

protected:
    media_source() = default;
};

}  // namespace rtransfer

#endif  // RTRANSFER_MEDIA_MEDIA_SOURCE_INTERFACE_H
