/**
 * @file reachability_probe.h
 * @brief Pre-flight reachability probe capability
 */

#ifndef RTRANSFER_TRANSPORT_REACHABILITY_PROBE_H
#define RTRANSFER_TRANSPORT_REACHABILITY_PROBE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rtransfer {

/**
 * @brief What a probe learned about a URL
 */
struct probe_result {
    bool reachable = true;
    std::optional<uint64_t> declared_size;  ///< Unset or 0 means unknown
    std::optional<std::string> content_kind;  ///< MIME type without parameters
    int status_code = 0;

    [[nodiscard]] static auto unknown() -> probe_result {
        return probe_result{};
    }
};

/**
 * @brief Reachability probe
 *
 * Implementations never fail on network errors: a transient failure
 * answers reachable with unknown size. Only a definite classification
 * answers unreachable.
 */
class reachability_probe {
public:
    virtual ~reachability_probe() = default;

    reachability_probe(const reachability_probe&) = delete;
    auto operator=(const reachability_probe&) -> reachability_probe& = delete;

    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    [[nodiscard]] virtual auto probe(const std::string& url) -> probe_result = 0;

protected:
    reachability_probe() = default;
};

}  // namespace rtransfer

#endif  // RTRANSFER_TRANSPORT_REACHABILITY_PROBE_H
