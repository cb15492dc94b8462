/**
 * @file body_pipe.cpp
 * @brief Implementation of the bounded body hand-off
 */

#include "body_pipe.h"

#include <algorithm>

namespace rtransfer::detail {

body_pipe::body_pipe(std::size_t chunk_size, std::size_t max_chunks)
    : chunk_size_(std::max<std::size_t>(chunk_size, 1)),
      max_chunks_(std::max<std::size_t>(max_chunks, 1)) {
    pending_.reserve(chunk_size_);
}

auto body_pipe::write(const char* data, std::size_t size) -> bool {
    std::unique_lock lock(mutex_);
    while (size > 0) {
        if (abandoned_) {
            return false;
        }

        auto take = std::min(size, chunk_size_ - pending_.size());
        auto first = reinterpret_cast<const std::byte*>(data);
        pending_.insert(pending_.end(), first, first + take);
        data += take;
        size -= take;

        if (pending_.size() == chunk_size_) {
            writable_.wait(lock, [this] { return abandoned_ || queue_.size() < max_chunks_; });
            if (abandoned_) {
                return false;
            }
            queue_.push_back(std::move(pending_));
            pending_ = std::vector<std::byte>();
            pending_.reserve(chunk_size_);
            readable_.notify_one();
        }
    }
    return !abandoned_;
}

void body_pipe::close(std::optional<error> failure) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return;
    }
    // The short tail may exceed the bound by one chunk.
    if (!pending_.empty()) {
        queue_.push_back(std::move(pending_));
        pending_ = std::vector<std::byte>();
    }
    failure_ = std::move(failure);
    closed_ = true;
    readable_.notify_all();
}

auto body_pipe::read() -> result<std::optional<std::vector<std::byte>>> {
    std::unique_lock lock(mutex_);
    readable_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (!queue_.empty()) {
        auto chunk = std::move(queue_.front());
        queue_.pop_front();
        writable_.notify_one();
        return std::optional<std::vector<std::byte>>{std::move(chunk)};
    }
    if (failure_) {
        return unexpected{*failure_};
    }
    return std::optional<std::vector<std::byte>>{};
}

void body_pipe::abandon() {
    std::lock_guard lock(mutex_);
    abandoned_ = true;
    queue_.clear();
    writable_.notify_all();
}

auto body_pipe::is_abandoned() const -> bool {
    std::lock_guard lock(mutex_);
    return abandoned_;
}

}  // namespace rtransfer::detail
