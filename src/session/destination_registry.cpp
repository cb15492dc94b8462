/**
 * @file destination_registry.cpp
 * @brief Implementation of destination exclusivity
 */

#include "rtransfer/session/destination_registry.h"

#include "rtransfer/core/logging.h"

#include <system_error>
#include <utility>

namespace rtransfer {

// ============================================================================
// destination_lease
// ============================================================================

destination_lease::destination_lease(std::shared_ptr<destination_registry> registry,
                                     std::string key)
    : registry_(std::move(registry)), key_(std::move(key)) {}

destination_lease::~destination_lease() {
    release();
}

destination_lease::destination_lease(destination_lease&& other) noexcept
    : registry_(std::move(other.registry_)), key_(std::move(other.key_)) {
    other.registry_.reset();
}

auto destination_lease::operator=(destination_lease&& other) noexcept
    -> destination_lease& {
    if (this != &other) {
        release();
        registry_ = std::move(other.registry_);
        key_ = std::move(other.key_);
        other.registry_.reset();
    }
    return *this;
}

void destination_lease::release() {
    if (registry_) {
        registry_->release(key_);
        registry_.reset();
    }
}

// ============================================================================
// destination_registry
// ============================================================================

auto destination_registry::create() -> std::shared_ptr<destination_registry> {
    return std::shared_ptr<destination_registry>(new destination_registry());
}

auto destination_registry::normalize(const std::filesystem::path& destination)
    -> std::string {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(destination, ec);
    if (ec) {
        return destination.lexically_normal().string();
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal().string();
    }
    return canonical.string();
}

auto destination_registry::acquire(const std::filesystem::path& destination)
    -> result<destination_lease> {
    auto key = normalize(destination);
    {
        std::lock_guard lock(mutex_);
        if (!held_.insert(key).second) {
            RT_LOG_WARN(log_category::session,
                        "Destination already in use: " + key);
            return unexpected{error{error_code::destination_conflict,
                "Destination is in use by another transfer: " + destination.string()}};
        }
    }
    return destination_lease(shared_from_this(), std::move(key));
}

auto destination_registry::is_held(const std::filesystem::path& destination) const -> bool {
    auto key = normalize(destination);
    std::lock_guard lock(mutex_);
    return held_.count(key) > 0;
}

auto destination_registry::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return held_.size();
}

void destination_registry::release(const std::string& key) {
    std::lock_guard lock(mutex_);
    held_.erase(key);
}

}  // namespace rtransfer
