/**
 * @file http_reachability_probe.cpp
 * @brief HEAD-based reachability probe
 */

#include "rtransfer/transport/http_reachability_probe.h"

#include "http_headers.h"
#include "rtransfer/config/feature_flags.h"
#include "rtransfer/core/logging.h"
#include "rtransfer/core/url_utils.h"

#include <map>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace rtransfer {

struct http_reachability_probe::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
#else
        (void)timeout;
#endif
    }
};

http_reachability_probe::http_reachability_probe(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

http_reachability_probe::~http_reachability_probe() = default;

auto http_reachability_probe::probe(const std::string& url) -> probe_result {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return probe_result::unknown();
    }

    std::map<std::string, std::string> headers;
    auto response = impl_->client->head(url, headers);
    if (response.is_err()) {
        RT_LOG_WARN(log_category::probe,
                    "HEAD request failed, assuming reachable: " + url);
        return probe_result::unknown();
    }

    const auto& resp = response.value();
    probe_result result;
    result.status_code = resp.status_code;
    result.reachable = is_reachable_status(resp.status_code);

    if (resp.status_code == 200) {
        result.declared_size =
            detail::parse_length(detail::find_header(resp.headers, "Content-Length"));
    }
    if (auto type = detail::find_header(resp.headers, "Content-Type")) {
        auto normalized = normalize_content_type(*type);
        if (!normalized.empty()) {
            result.content_kind = normalized;
        }
    }

    RT_LOG_DEBUG(log_category::probe,
                 "HEAD " + url + " -> " + std::to_string(resp.status_code));
    return result;
#else
    RT_LOG_DEBUG(log_category::probe,
                 "Probe unavailable without network_system, assuming reachable: " + url);
    return probe_result::unknown();
#endif
}

}  // namespace rtransfer
