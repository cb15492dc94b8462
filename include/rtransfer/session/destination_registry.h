/**
 * @file destination_registry.h
 * @brief In-process exclusivity of destination paths
 */

#ifndef RTRANSFER_SESSION_DESTINATION_REGISTRY_H
#define RTRANSFER_SESSION_DESTINATION_REGISTRY_H

#include "rtransfer/core/types.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace rtransfer {

class destination_registry;

/**
 * @brief Ownership of one registered destination; released on destruction
 */
class destination_lease {
public:
    destination_lease() = default;
    destination_lease(std::shared_ptr<destination_registry> registry, std::string key);
    ~destination_lease();

    destination_lease(const destination_lease&) = delete;
    auto operator=(const destination_lease&) -> destination_lease& = delete;
    destination_lease(destination_lease&& other) noexcept;
    auto operator=(destination_lease&& other) noexcept -> destination_lease&;

    [[nodiscard]] auto key() const -> const std::string& { return key_; }
    [[nodiscard]] auto held() const noexcept -> bool { return registry_ != nullptr; }

    void release();

private:
    std::shared_ptr<destination_registry> registry_;
    std::string key_;
};

/**
 * @brief Set of destinations with a running session
 *
 * A second session for a path already held fails with
 * destination_conflict. Paths are compared after normalization, so
 * "a/../b.bin" and "b.bin" collide. No lock files are created.
 */
class destination_registry : public std::enable_shared_from_this<destination_registry> {
public:
    [[nodiscard]] static auto create() -> std::shared_ptr<destination_registry>;

    [[nodiscard]] auto acquire(const std::filesystem::path& destination)
        -> result<destination_lease>;

    [[nodiscard]] auto is_held(const std::filesystem::path& destination) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] static auto normalize(const std::filesystem::path& destination)
        -> std::string;

private:
    friend class destination_lease;

    destination_registry() = default;

    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::set<std::string> held_;
};

}  // namespace rtransfer

#endif  // RTRANSFER_SESSION_DESTINATION_REGISTRY_H
