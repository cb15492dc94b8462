/**
 * @file url_utils.cpp
 * @brief Implementation of URL helpers
 */

#include "rtransfer/core/url_utils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace rtransfer {

namespace {

auto to_lower(std::string_view input) -> std::string {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

auto trim(std::string_view input) -> std::string_view {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto percent_decode(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += input[i];
    }
    return out;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 24> mime_extensions{{
    {"application/pdf", ".pdf"},
    {"application/zip", ".zip"},
    {"application/gzip", ".gz"},
    {"application/x-gzip", ".gz"},
    {"application/x-tar", ".tar"},
    {"application/x-7z-compressed", ".7z"},
    {"application/json", ".json"},
    {"application/xml", ".xml"},
    {"application/octet-stream", ".bin"},
    {"application/x-iso9660-image", ".iso"},
    {"audio/mpeg", ".mp3"},
    {"audio/ogg", ".ogg"},
    {"audio/wav", ".wav"},
    {"image/gif", ".gif"},
    {"image/jpeg", ".jpg"},
    {"image/png", ".png"},
    {"image/svg+xml", ".svg"},
    {"image/webp", ".webp"},
    {"text/csv", ".csv"},
    {"text/html", ".html"},
    {"text/plain", ".txt"},
    {"video/mp4", ".mp4"},
    {"video/webm", ".webm"},
    {"video/x-matroska", ".mkv"},
}};

}  // namespace

auto parse_url(std::string_view url) -> result<url_parts> {
    url = trim(url);
    if (url.empty()) {
        return unexpected{error{error_code::invalid_url, "URL is empty"}};
    }
    if (std::any_of(url.begin(), url.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        return unexpected{error{error_code::invalid_url, "URL contains whitespace"}};
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return unexpected{error{error_code::invalid_url,
                                "URL has no scheme: " + std::string(url)}};
    }

    url_parts parts;
    parts.scheme = to_lower(url.substr(0, scheme_end));
    if (parts.scheme != "http" && parts.scheme != "https") {
        return unexpected{error{error_code::invalid_url,
                                "Unsupported URL scheme: " + parts.scheme}};
    }

    auto rest = url.substr(scheme_end + 3);
    auto host_end = rest.find_first_of("/?#");
    parts.host = std::string(rest.substr(0, host_end));

    // Drop userinfo for the emptiness check.
    auto at = parts.host.rfind('@');
    std::string_view bare_host = at == std::string::npos
                                     ? std::string_view(parts.host)
                                     : std::string_view(parts.host).substr(at + 1);
    if (bare_host.empty() || bare_host.front() == ':') {
        return unexpected{error{error_code::invalid_url,
                                "URL has no host: " + std::string(url)}};
    }

    if (host_end == std::string_view::npos) {
        parts.path = "/";
        return parts;
    }

    auto tail = rest.substr(host_end);
    auto fragment = tail.find('#');
    if (fragment != std::string_view::npos) {
        tail = tail.substr(0, fragment);
    }
    auto query = tail.find('?');
    if (query != std::string_view::npos) {
        parts.query = std::string(tail.substr(query + 1));
        tail = tail.substr(0, query);
    }
    parts.path = tail.empty() ? std::string("/") : std::string(tail);
    return parts;
}

auto validate_url_format(std::string_view url) -> result<void> {
    auto parsed = parse_url(url);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    return {};
}

auto normalize_content_type(std::string_view content_type) -> std::string {
    auto semicolon = content_type.find(';');
    return to_lower(trim(content_type.substr(0, semicolon)));
}

auto is_webpage_content_type(std::string_view content_type) -> bool {
    return normalize_content_type(content_type) == "text/html";
}

auto extension_for_mime(std::string_view content_type) -> std::string {
    auto mime = normalize_content_type(content_type);
    for (const auto& [type, ext] : mime_extensions) {
        if (type == mime) {
            return std::string(ext);
        }
    }
    return {};
}

auto infer_filename(std::string_view url, std::optional<std::string_view> content_type)
    -> std::string {
    std::string basename;
    auto parsed = parse_url(url);
    if (parsed) {
        const auto& path = parsed.value().path;
        auto slash = path.find_last_of('/');
        basename = percent_decode(slash == std::string::npos ? path : path.substr(slash + 1));
        // Never let a decoded name escape the destination directory.
        std::replace(basename.begin(), basename.end(), '/', '_');
        std::replace(basename.begin(), basename.end(), '\\', '_');
        if (basename == "." || basename == "..") {
            basename.clear();
        }
    }

    if (!basename.empty() && basename.find('.') != std::string::npos) {
        return basename;
    }

    std::string ext = content_type ? extension_for_mime(*content_type) : std::string{};
    return "downloaded_file" + ext;
}

auto extract_format_id(std::string_view selector) -> std::string {
    auto trimmed = trim(selector);
    auto separator = trimmed.find(" - ");
    if (separator == std::string_view::npos) {
        return std::string(trimmed);
    }
    return std::string(trim(trimmed.substr(0, separator)));
}

}  // namespace rtransfer
