/**
 * @file http_reachability_probe.h
 * @brief HEAD-based reachability probe over the network_system HTTP client
 */

#ifndef RTRANSFER_TRANSPORT_HTTP_REACHABILITY_PROBE_H
#define RTRANSFER_TRANSPORT_HTTP_REACHABILITY_PROBE_H

#include "reachability_probe.h"

#include <chrono>
#include <memory>

namespace rtransfer {

/**
 * @brief Classify a HEAD status code
 *
 * 200, 206 and 403 count as reachable (403 is common for servers that
 * refuse HEAD but serve GET). Redirects count as reachable because the
 * client does not follow them. Everything else is unreachable.
 */
[[nodiscard]] constexpr auto is_reachable_status(int status_code) noexcept -> bool {
    return status_code == 200 || status_code == 206 || status_code == 403 ||
           (status_code >= 300 && status_code < 400);
}

/**
 * @brief reachability_probe issuing a HEAD request
 *
 * Transport failures and builds without network_system both answer
 * reachable with unknown size.
 */
class http_reachability_probe : public reachability_probe {
public:
    explicit http_reachability_probe(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    ~http_reachability_probe() override;

    [[nodiscard]] auto type() const -> std::string_view override { return "http"; }

    [[nodiscard]] auto probe(const std::string& url) -> probe_result override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_TRANSPORT_HTTP_REACHABILITY_PROBE_H
