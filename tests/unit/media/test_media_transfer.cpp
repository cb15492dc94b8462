/**
 * @file test_media_transfer.cpp
 * @brief Unit tests for the media path of the transfer loop
 */

#include "integration/test_fixtures.h"

#include <rtransfer/core/transfer_loop.h>

#include <mutex>
#include <vector>

namespace rtransfer::test {

using namespace std::chrono_literals;

namespace {

auto downloading(uint64_t bytes, std::optional<uint64_t> total, bool estimate = false)
    -> media_event {
    media_event event;
    event.bytes = bytes;
    event.total = total;
    event.total_is_estimate = estimate;
    return event;
}

auto finished(uint64_t bytes) -> media_event {
    media_event event;
    event.kind = media_event_kind::finished;
    event.bytes = bytes;
    return event;
}

}  // namespace

class MediaTransferTest : public TempDirectoryFixture {
protected:
    auto options() -> loop_options {
        loop_options opts;
        opts.sink = [this](const progress_sample& sample) {
            std::lock_guard lock(samples_mutex_);
            samples_.push_back(sample);
        };
        opts.label = "media-test";
        return opts;
    }

    auto run(fake_media_source& source, std::optional<loop_options> opts = std::nullopt)
        -> transfer_outcome {
        EXPECT_TRUE(control_.start().has_value());
        transfer_loop loop(control_, opts ? std::move(*opts) : options());

        media_job job;
        job.url = "https://video.example.com/watch?v=abc";
        job.format_id = "22";
        job.destination_template = (test_dir_ / "%(title)s.%(ext)s").string();
        return loop.run_media(source, job);
    }

    auto samples() -> std::vector<progress_sample> {
        std::lock_guard lock(samples_mutex_);
        return samples_;
    }

    transfer_control control_{10ms};
    std::mutex samples_mutex_;
    std::vector<progress_sample> samples_;
};

// ============================================================================
// Successful transfers
// ============================================================================

TEST_F(MediaTransferTest, CompletesWithFinalPath) {
    fake_media_source::script script;
    script.events = fake_media_source::linear_events(1000, 250);
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(outcome.final_path, test_dir_ / "clip.mp4");
    EXPECT_EQ(outcome.bytes_transferred, 1000u);
    EXPECT_EQ(file_size(outcome.final_path), 1000u);
    EXPECT_EQ(source.last_format(), "22");

    auto seen = samples();
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen.front().bytes_transferred, 250u);
    EXPECT_EQ(seen.front().total_bytes, 1000u);
    ASSERT_TRUE(seen.back().percent.has_value());
    EXPECT_DOUBLE_EQ(*seen.back().percent, 100.0);
}

TEST_F(MediaTransferTest, SeparateStreamsAccumulate) {
    fake_media_source::script script;
    script.events = {
        downloading(300, 600),
        downloading(600, 600),
        downloading(100, 400),
        downloading(400, 400),
        finished(400),
    };
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(outcome.bytes_transferred, 1000u);

    auto seen = samples();
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen[2].bytes_transferred, 700u);
    EXPECT_EQ(seen[2].total_bytes, 1000u);
    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i].bytes_transferred, seen[i - 1].bytes_transferred);
    }
}

TEST_F(MediaTransferTest, EstimateBelowCountIsRaised) {
    fake_media_source::script script;
    script.events = {downloading(400, 500, true), downloading(800, 500, true), finished(800)};
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::completed);
    auto seen = samples();
    ASSERT_GE(seen.size(), 2u);
    EXPECT_EQ(seen[1].total_bytes, 800u);
    ASSERT_TRUE(seen[1].percent.has_value());
    EXPECT_LE(*seen[1].percent, 100.0);
}

TEST_F(MediaTransferTest, UnknownTotalReportsBytesOnly) {
    fake_media_source::script script;
    script.events = {downloading(300, std::nullopt), downloading(700, std::nullopt)};
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::completed);
    auto seen = samples();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[0].total_known());
    EXPECT_FALSE(seen[0].percent.has_value());
    EXPECT_EQ(seen[1].bytes_transferred, 700u);
}

TEST_F(MediaTransferTest, NoEventsUsesFileSize) {
    fake_media_source::script script;
    script.output_size = 640;
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(outcome.bytes_transferred, 640u);
    EXPECT_TRUE(samples().empty());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(MediaTransferTest, ExactTotalExceededFails) {
    fake_media_source::script script;
    script.events = {downloading(500, 1000), downloading(1200, 1000), finished(1200)};
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::stream_overflow);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clip.mp4"));
}

TEST_F(MediaTransferTest, SizeLimitAborts) {
    fake_media_source::script script;
    script.events = fake_media_source::linear_events(1000, 250);
    fake_media_source source(script);

    auto opts = options();
    opts.size_limit = size_limit_policy::at_most(500);
    auto outcome = run(source, std::move(opts));

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::file_too_large);
    EXPECT_TRUE(samples().empty());
}

TEST_F(MediaTransferTest, SourceFailureIsMediaSourceError) {
    fake_media_source::script script;
    script.events = {downloading(100, 1000)};
    script.failure = error{error_code::transport_error, "ERROR: Video unavailable"};
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::media_source_error);
    EXPECT_EQ(outcome.failure->message, "ERROR: Video unavailable");
    EXPECT_EQ(control_.failure()->code, error_code::media_source_error);
}

TEST_F(MediaTransferTest, MissingFinalPathIsEmptyDownload) {
    fake_media_source::script script;
    script.events = fake_media_source::linear_events(1000, 500);
    script.report_final_path = false;
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::empty_download);
}

TEST_F(MediaTransferTest, EmptyOutputIsEmptyDownload) {
    fake_media_source::script script;
    script.output_size = 0;
    fake_media_source source(script);

    auto outcome = run(source);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::empty_download);
}

// ============================================================================
// Control
// ============================================================================

TEST_F(MediaTransferTest, CancelStopsSource) {
    fake_media_source::script script;
    script.events = fake_media_source::linear_events(1000, 100);
    fake_media_source source(script);

    auto opts = options();
    opts.sink = [this](const progress_sample& sample) {
        {
            std::lock_guard lock(samples_mutex_);
            samples_.push_back(sample);
        }
        if (sample.bytes_transferred == 300) {
            EXPECT_TRUE(control_.cancel().has_value());
        }
    };
    auto outcome = run(source, std::move(opts));

    EXPECT_EQ(outcome.state, transfer_state::cancelled);
    EXPECT_FALSE(outcome.failure.has_value());
    EXPECT_EQ(outcome.bytes_transferred, 300u);
    EXPECT_EQ(samples().size(), 3u);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "clip.mp4"));
}

TEST_F(MediaTransferTest, PauseHoldsEvents) {
    fake_media_source::script script;
    script.events = fake_media_source::linear_events(1000, 250);
    fake_media_source source(script);

    auto opts = options();
    opts.sink = [this](const progress_sample& sample) {
        {
            std::lock_guard lock(samples_mutex_);
            samples_.push_back(sample);
        }
        if (sample.bytes_transferred == 500) {
            EXPECT_TRUE(control_.pause().has_value());
        }
    };

    EXPECT_TRUE(control_.start().has_value());
    transfer_loop loop(control_, std::move(opts));
    media_job job;
    job.url = "https://video.example.com/watch?v=abc";
    job.format_id = "best";
    job.destination_template = (test_dir_ / "%(title)s.%(ext)s").string();

    transfer_outcome outcome;
    std::thread worker([&] { outcome = loop.run_media(source, job); });

    ASSERT_TRUE(eventually([this] { return samples().size() == 2; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(samples().size(), 2u);
    EXPECT_EQ(control_.state(), transfer_state::paused);

    EXPECT_TRUE(control_.resume().has_value());
    worker.join();

    EXPECT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(samples().size(), 5u);
}

}  // namespace rtransfer::test
