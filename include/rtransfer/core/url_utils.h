/**
 * @file url_utils.h
 * @brief URL validation and destination name inference
 */

#ifndef RTRANSFER_CORE_URL_UTILS_H
#define RTRANSFER_CORE_URL_UTILS_H

#include "types.h"

#include <optional>
#include <string>
#include <string_view>

namespace rtransfer {

/**
 * @brief Components of an absolute http(s) URL
 */
struct url_parts {
    std::string scheme;  ///< Lower-cased
    std::string host;    ///< Host with optional ":port"
    std::string path;    ///< Starts with '/', "/" when absent
    std::string query;   ///< Without the leading '?'
};

/**
 * @brief Split an http(s) URL
 * @return Components, or invalid_url when the scheme is not http/https,
 *         the host is empty, or the URL contains whitespace
 */
[[nodiscard]] auto parse_url(std::string_view url) -> result<url_parts>;

[[nodiscard]] auto validate_url_format(std::string_view url) -> result<void>;

/**
 * @brief Strip parameters and lower-case a content type ("Text/HTML; charset=x" -> "text/html")
 */
[[nodiscard]] auto normalize_content_type(std::string_view content_type) -> std::string;

[[nodiscard]] auto is_webpage_content_type(std::string_view content_type) -> bool;

/**
 * @brief Conventional extension for a MIME type, including the dot
 * @return Extension, or an empty string for unknown types
 */
[[nodiscard]] auto extension_for_mime(std::string_view content_type) -> std::string;

/**
 * @brief Local file name for a plain download
 *
 * Uses the percent-decoded basename of the URL path. When that is empty or
 * has no extension, falls back to "downloaded_file" plus the extension for
 * @p content_type.
 */
[[nodiscard]] auto infer_filename(std::string_view url,
                                  std::optional<std::string_view> content_type = std::nullopt)
    -> std::string;

/**
 * @brief Reduce a selector label "<id> - 720p ..." to "<id>"
 */
[[nodiscard]] auto extract_format_id(std::string_view selector) -> std::string;

}  // namespace rtransfer

#endif  // RTRANSFER_CORE_URL_UTILS_H
