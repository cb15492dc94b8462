/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef RTRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define RTRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <rtransfer/transport/stream_fetcher_interface.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace rtransfer::benchmark {

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 64 * MB;

constexpr std::size_t min_chunk = 4 * KB;
constexpr std::size_t default_chunk = 8 * KB;
constexpr std::size_t max_chunk = 1 * MB;
}  // namespace sizes

/**
 * @brief Random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
inline auto generate_random_data(std::size_t size, uint32_t seed = 0)
    -> std::vector<std::byte> {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<> dis(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

/**
 * @brief Temporary directory removed on destruction
 */
class temp_directory {
public:
    explicit temp_directory(const std::string& prefix = "rtransfer_bench")
        : path_(std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(std::random_device{}()))) {
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    auto operator=(const temp_directory&) -> temp_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief stream_fetcher serving a shared buffer from memory
 *
 * Ranges are always honoured, so a request with an offset yields a partial
 * response of the remaining bytes.
 */
class memory_stream_fetcher : public stream_fetcher {
public:
    memory_stream_fetcher(std::shared_ptr<const std::vector<std::byte>> data,
                          std::size_t chunk_size)
        : data_(std::move(data)), chunk_size_(chunk_size) {}

    [[nodiscard]] auto type() const -> std::string_view override { return "memory"; }

    [[nodiscard]] auto open(const std::string& /*url*/, const std::optional<byte_range>& range)
        -> result<std::unique_ptr<fetch_response>> override {
        std::size_t offset = range ? std::min<std::size_t>(range->offset, data_->size()) : 0;
        return std::unique_ptr<fetch_response>(
            std::make_unique<response>(data_, offset, chunk_size_, range.has_value()));
    }

private:
    class response : public fetch_response {
    public:
        response(std::shared_ptr<const std::vector<std::byte>> data,
                 std::size_t offset,
                 std::size_t chunk_size,
                 bool partial)
            : data_(std::move(data)), position_(offset), offset_(offset),
              chunk_size_(chunk_size), partial_(partial) {}

        [[nodiscard]] auto status() const -> fetch_status override {
            return partial_ ? fetch_status::partial : fetch_status::full;
        }
        [[nodiscard]] auto status_code() const -> int override { return partial_ ? 206 : 200; }
        [[nodiscard]] auto declared_length() const -> uint64_t override {
            return data_->size() - offset_;
        }
        [[nodiscard]] auto content_type() const -> std::string override {
            return "application/octet-stream";
        }

        [[nodiscard]] auto next_chunk()
            -> result<std::optional<std::vector<std::byte>>> override {
            if (position_ >= data_->size()) {
                return std::optional<std::vector<std::byte>>{};
            }
            auto count = std::min(chunk_size_, data_->size() - position_);
            auto first = data_->begin() + static_cast<std::ptrdiff_t>(position_);
            std::vector<std::byte> chunk(first, first + static_cast<std::ptrdiff_t>(count));
            position_ += count;
            return std::optional<std::vector<std::byte>>{std::move(chunk)};
        }

    private:
        std::shared_ptr<const std::vector<std::byte>> data_;
        std::size_t position_;
        std::size_t offset_;
        std::size_t chunk_size_;
        bool partial_;
    };

    std::shared_ptr<const std::vector<std::byte>> data_;
    std::size_t chunk_size_;
};

}  // namespace rtransfer::benchmark

#endif  // RTRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
