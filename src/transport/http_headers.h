/**
 * @file http_headers.h
 * @brief Header lookup helpers shared by the HTTP adapters
 */

#ifndef RTRANSFER_SRC_TRANSPORT_HTTP_HEADERS_H
#define RTRANSFER_SRC_TRANSPORT_HTTP_HEADERS_H

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace rtransfer::detail {

[[nodiscard]] inline auto iequals(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Case-insensitive header lookup in any string map
 */
template <typename Map>
[[nodiscard]] auto find_header(const Map& headers, std::string_view name)
    -> std::optional<std::string> {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string(value);
        }
    }
    return std::nullopt;
}

/**
 * @brief Parse a Content-Length value; nullopt when absent or malformed
 */
[[nodiscard]] inline auto parse_length(const std::optional<std::string>& value)
    -> std::optional<uint64_t> {
    if (!value) {
        return std::nullopt;
    }
    auto text = std::string_view(*value);
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);

    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return parsed;
}

/**
 * @brief First byte position of a Content-Range value ("bytes 500-999/1000")
 *
 * Unsatisfied ranges (an asterisk instead of positions) and malformed values
 * give nullopt.
 */
[[nodiscard]] inline auto parse_content_range_start(const std::optional<std::string>& value)
    -> std::optional<uint64_t> {
    if (!value) {
        return std::nullopt;
    }
    auto text = std::string_view(*value);
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);

    constexpr std::string_view unit = "bytes";
    if (text.size() < unit.size() || !iequals(text.substr(0, unit.size()), unit)) {
        return std::nullopt;
    }
    text.remove_prefix(unit.size());
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);

    uint64_t first = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), first);
    if (ec != std::errc{} || ptr == text.data() + text.size() || *ptr != '-') {
        return std::nullopt;
    }
    return first;
}

}  // namespace rtransfer::detail

#endif  // RTRANSFER_SRC_TRANSPORT_HTTP_HEADERS_H
