/**
 * @file test_fixtures.h
 * @brief Fixtures and in-memory collaborators for transfer tests
 */

#ifndef RTRANSFER_TEST_FIXTURES_H
#define RTRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <rtransfer/rtransfer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace rtransfer::test {

// =============================================================================
// Byte helpers
// =============================================================================

inline auto make_payload(std::size_t size, uint32_t seed = 42) -> std::vector<std::byte> {
    std::mt19937 gen(seed);  // Fixed seed for reproducibility
    std::uniform_int_distribution<> dis(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

inline auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
    std::ifstream file(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                          std::istreambuf_iterator<char>());
    std::vector<std::byte> out(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        out[i] = static_cast<std::byte>(raw[i]);
    }
    return out;
}

inline void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
}

inline auto slice(const std::vector<std::byte>& data, std::size_t from, std::size_t to)
    -> std::vector<std::byte> {
    return std::vector<std::byte>(data.begin() + static_cast<std::ptrdiff_t>(from),
                                  data.begin() + static_cast<std::ptrdiff_t>(to));
}

/**
 * @brief Poll @p predicate until it holds or @p timeout expires
 */
template <typename Predicate>
auto eventually(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// =============================================================================
// chunk_gate
// =============================================================================

/**
 * @brief Holds the worker at one chunk index until the test releases it
 */
class chunk_gate {
public:
    explicit chunk_gate(std::size_t index) : index_(index) {}

    [[nodiscard]] auto index() const -> std::size_t { return index_; }

    /// Worker side
    void arrive_and_wait() {
        std::unique_lock lock(mutex_);
        arrived_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
    }

    /// Test side
    auto wait_arrived(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
        -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return arrived_; });
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::size_t index_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool arrived_ = false;
    bool released_ = false;
};

// =============================================================================
// fake_stream_fetcher
// =============================================================================

/**
 * @brief Remote resource served by fake_stream_fetcher
 */
struct fake_resource {
    std::vector<std::byte> data;
    std::size_t chunk_size = 100;
    bool honor_range = true;
    bool declare_length = true;
    std::string content_type = "application/octet-stream";
    int error_status = 0;                    ///< Non-zero: answer with this error status
    bool fail_open = false;                  ///< open() fails with connection_failed
    bool partial_without_range = false;      ///< Answer 206 even without a range
    uint64_t extra_bytes = 0;                ///< Bytes sent beyond the declared length
    uint64_t missing_bytes = 0;              ///< Bytes withheld from the end of the body
    std::optional<std::size_t> fail_at_chunk;  ///< next_chunk() errors at this index
    std::chrono::milliseconds chunk_delay{0};
    std::vector<std::size_t> chunk_sizes;    ///< Sizes of the first chunks, then chunk_size
    std::optional<uint64_t> served_offset;   ///< Answer range requests from this byte
    std::function<void()> on_open;           ///< Runs inside open(), before it returns
};

class fake_fetch_response : public fetch_response {
public:
    fake_fetch_response(fetch_status status,
                        int code,
                        uint64_t declared,
                        std::string content_type,
                        std::vector<std::byte> body,
                        const fake_resource& resource,
                        std::shared_ptr<chunk_gate> gate,
                        std::optional<uint64_t> range_start = std::nullopt)
        : status_(status),
          code_(code),
          declared_(declared),
          content_type_(std::move(content_type)),
          body_(std::move(body)),
          chunk_size_(resource.chunk_size),
          chunk_sizes_(resource.chunk_sizes),
          fail_at_(resource.fail_at_chunk),
          delay_(resource.chunk_delay),
          gate_(std::move(gate)),
          range_start_(range_start) {}

    [[nodiscard]] auto status() const -> fetch_status override { return status_; }
    [[nodiscard]] auto status_code() const -> int override { return code_; }
    [[nodiscard]] auto declared_length() const -> uint64_t override { return declared_; }
    [[nodiscard]] auto content_type() const -> std::string override { return content_type_; }
    [[nodiscard]] auto range_start() const -> std::optional<uint64_t> override {
        return range_start_;
    }

    [[nodiscard]] auto next_chunk() -> result<std::optional<std::vector<std::byte>>> override {
        auto index = index_++;
        if (gate_ && gate_->index() == index) {
            gate_->arrive_and_wait();
        }
        if (fail_at_ && *fail_at_ == index) {
            return unexpected{error{error_code::transport_error, "connection reset"}};
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (position_ >= body_.size()) {
            return std::optional<std::vector<std::byte>>{};
        }
        auto wanted = index < chunk_sizes_.size() ? chunk_sizes_[index] : chunk_size_;
        auto count = std::min(wanted, body_.size() - position_);
        auto chunk = slice(body_, position_, position_ + count);
        position_ += count;
        return std::optional<std::vector<std::byte>>{std::move(chunk)};
    }

private:
    fetch_status status_;
    int code_;
    uint64_t declared_;
    std::string content_type_;
    std::vector<std::byte> body_;
    std::size_t chunk_size_;
    std::vector<std::size_t> chunk_sizes_;
    std::optional<std::size_t> fail_at_;
    std::chrono::milliseconds delay_;
    std::shared_ptr<chunk_gate> gate_;
    std::optional<uint64_t> range_start_;
    std::size_t index_ = 0;
    std::size_t position_ = 0;
};

/**
 * @brief In-memory stream_fetcher recording every request
 */
class fake_stream_fetcher : public stream_fetcher {
public:
    explicit fake_stream_fetcher(fake_resource resource) : resource_(std::move(resource)) {}

    [[nodiscard]] auto type() const -> std::string_view override { return "fake"; }

    [[nodiscard]] auto open(const std::string& url, const std::optional<byte_range>& range)
        -> result<std::unique_ptr<fetch_response>> override {
        fake_resource resource;
        std::shared_ptr<chunk_gate> gate;
        {
            std::lock_guard lock(mutex_);
            urls_.push_back(url);
            ranges_.push_back(range);
            resource = resource_;
            gate = gate_;
        }

        if (resource.on_open) {
            resource.on_open();
        }
        if (resource.fail_open) {
            return unexpected{error{error_code::connection_failed, "connection refused"}};
        }
        if (resource.error_status != 0) {
            return std::unique_ptr<fetch_response>(std::make_unique<fake_fetch_response>(
                fetch_status::error, resource.error_status, 0, "text/plain",
                std::vector<std::byte>{}, resource, gate));
        }

        std::size_t offset = 0;
        auto status = fetch_status::full;
        int code = 200;
        if (range && resource.honor_range) {
            offset = static_cast<std::size_t>(std::min<uint64_t>(
                resource.served_offset.value_or(range->offset), resource.data.size()));
            status = fetch_status::partial;
            code = 206;
        } else if (resource.partial_without_range) {
            status = fetch_status::partial;
            code = 206;
        }

        auto body = slice(resource.data, offset, resource.data.size());
        uint64_t declared = resource.declare_length ? body.size() : 0;
        if (resource.missing_bytes > 0) {
            body.resize(body.size() - std::min<std::size_t>(body.size(),
                                                            resource.missing_bytes));
        }
        for (uint64_t i = 0; i < resource.extra_bytes; ++i) {
            body.push_back(std::byte{0x5A});
        }

        std::optional<uint64_t> range_start;
        if (status == fetch_status::partial) {
            range_start = offset;
        }

        return std::unique_ptr<fetch_response>(std::make_unique<fake_fetch_response>(
            status, code, declared, resource.content_type, std::move(body), resource, gate,
            range_start));
    }

    void set_resource(fake_resource resource) {
        std::lock_guard lock(mutex_);
        resource_ = std::move(resource);
    }

    /**
     * @brief Gate the next opened response at @p index
     */
    auto gate_at(std::size_t index) -> std::shared_ptr<chunk_gate> {
        std::lock_guard lock(mutex_);
        gate_ = std::make_shared<chunk_gate>(index);
        return gate_;
    }

    void clear_gate() {
        std::lock_guard lock(mutex_);
        gate_.reset();
    }

    [[nodiscard]] auto open_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return ranges_.size();
    }

    [[nodiscard]] auto last_range() const -> std::optional<byte_range> {
        std::lock_guard lock(mutex_);
        return ranges_.empty() ? std::nullopt : ranges_.back();
    }

private:
    mutable std::mutex mutex_;
    fake_resource resource_;
    std::shared_ptr<chunk_gate> gate_;
    std::vector<std::string> urls_;
    std::vector<std::optional<byte_range>> ranges_;
};

// =============================================================================
// fake_media_source
// =============================================================================

/**
 * @brief Scripted media source writing a file once every event was accepted
 */
class fake_media_source : public media_source {
public:
    struct script {
        std::vector<media_event> events;
        std::size_t output_size = 1000;
        std::string output_name = "clip.mp4";
        bool name_from_url = false;           ///< Name is the text after the last '=' plus ".mp4"
        std::optional<error> failure;         ///< Returned after the events
        bool report_final_path = true;
        std::chrono::milliseconds event_delay{0};
        std::vector<media_format> formats;
    };

    fake_media_source() : fake_media_source(script{}) {}
    explicit fake_media_source(script s) : script_(std::move(s)) {}

    [[nodiscard]] auto type() const -> std::string_view override { return "fake-media"; }

    [[nodiscard]] auto list_formats(const std::string& /*url*/)
        -> result<std::vector<media_format>> override {
        return script_.formats;
    }

    [[nodiscard]] auto fetch(const std::string& url,
                             const std::string& format_id,
                             const std::string& destination_template,
                             const event_handler& handler)
        -> result<media_fetch_result> override {
        {
            std::lock_guard lock(mutex_);
            last_format_ = format_id;
            last_template_ = destination_template;
        }

        media_fetch_result fetched;
        for (const auto& event : script_.events) {
            if (script_.event_delay.count() > 0) {
                std::this_thread::sleep_for(script_.event_delay);
            }
            if (handler(event) == media_verdict::abort) {
                fetched.aborted = true;
                return fetched;
            }
        }

        if (script_.failure) {
            return unexpected{*script_.failure};
        }

        auto name = script_.output_name;
        if (script_.name_from_url) {
            name = url.substr(url.rfind('=') + 1) + ".mp4";
        }
        auto target = std::filesystem::path(destination_template).parent_path() / name;
        write_file(target, make_payload(script_.output_size));
        if (script_.report_final_path) {
            fetched.final_path = target;
        }
        return fetched;
    }

    [[nodiscard]] auto last_format() const -> std::string {
        std::lock_guard lock(mutex_);
        return last_format_;
    }

    [[nodiscard]] auto last_template() const -> std::string {
        std::lock_guard lock(mutex_);
        return last_template_;
    }

    /**
     * @brief Evenly spaced downloading events followed by finished
     */
    static auto linear_events(uint64_t total, uint64_t step, bool estimate = false)
        -> std::vector<media_event> {
        std::vector<media_event> events;
        for (uint64_t bytes = step; bytes <= total; bytes += step) {
            media_event event;
            event.bytes = bytes;
            event.total = total;
            event.total_is_estimate = estimate;
            events.push_back(event);
        }
        media_event done;
        done.kind = media_event_kind::finished;
        done.bytes = total;
        done.total = total;
        events.push_back(done);
        return events;
    }

private:
    script script_;
    mutable std::mutex mutex_;
    std::string last_format_;
    std::string last_template_;
};

// =============================================================================
// fake_probe
// =============================================================================

class fake_probe : public reachability_probe {
public:
    explicit fake_probe(probe_result answer = probe_result::unknown())
        : answer_(std::move(answer)) {}

    [[nodiscard]] auto type() const -> std::string_view override { return "fake-probe"; }

    [[nodiscard]] auto probe(const std::string& /*url*/) -> probe_result override {
        ++calls_;
        return answer_;
    }

    [[nodiscard]] auto calls() const -> int { return calls_.load(); }

private:
    probe_result answer_;
    std::atomic<int> calls_{0};
};

inline auto probe_with_size(uint64_t size, std::string kind = "application/octet-stream")
    -> probe_result {
    probe_result result;
    result.status_code = 200;
    result.declared_size = size;
    result.content_kind = std::move(kind);
    return result;
}

// =============================================================================
// Fixtures
// =============================================================================

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("rtransfer_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);

        get_logger().set_quiet(true);
    }

    void TearDown() override {
        get_logger().set_quiet(false);

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto file_size(const std::filesystem::path& path) const -> uint64_t {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Engine wired to in-memory collaborators
 */
class EngineFixture : public TempDirectoryFixture {
protected:
    static constexpr std::size_t payload_size = 1000;
    static constexpr const char* source_url = "https://files.example.com/data/payload.bin";

    void SetUp() override {
        TempDirectoryFixture::SetUp();

        payload_ = make_payload(payload_size);
        fake_resource resource;
        resource.data = payload_;
        fetcher_ = std::make_shared<fake_stream_fetcher>(resource);
        media_ = std::make_shared<fake_media_source>(media_script());
        probe_ = std::make_shared<fake_probe>(probe_with_size(payload_size));

        build_engine();
    }

    void TearDown() override {
        engine_.reset();
        TempDirectoryFixture::TearDown();
    }

    virtual auto media_script() -> fake_media_source::script {
        fake_media_source::script s;
        s.events = fake_media_source::linear_events(1000, 250);
        return s;
    }

    void build_engine(transfer_engine::builder builder = transfer_engine::builder()) {
        auto result = builder
            .with_download_directory(download_dir_)
            .with_pause_poll_interval(std::chrono::milliseconds(10))
            .with_stream_fetcher(fetcher_)
            .with_media_source(media_)
            .with_reachability_probe(probe_)
            .build();
        ASSERT_TRUE(result.has_value()) << result.error().message;
        engine_ = std::make_unique<transfer_engine>(std::move(result.value()));
    }

    auto plain_request(const std::filesystem::path& destination, bool resume = true)
        -> transfer_request {
        auto request = engine_->make_request(source_url);
        request.destination = destination;
        request.resume_allowed = resume;
        return request;
    }

    auto new_session(transfer_request request) -> std::unique_ptr<transfer_session> {
        auto session = engine_->create_session(std::move(request));
        EXPECT_TRUE(session.has_value());
        return session.has_value() ? std::move(session.value()) : nullptr;
    }

    std::vector<std::byte> payload_;
    std::shared_ptr<fake_stream_fetcher> fetcher_;
    std::shared_ptr<fake_media_source> media_;
    std::shared_ptr<fake_probe> probe_;
    std::unique_ptr<transfer_engine> engine_;
};

}  // namespace rtransfer::test

#endif  // RTRANSFER_TEST_FIXTURES_H
