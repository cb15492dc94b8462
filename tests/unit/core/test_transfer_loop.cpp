/**
 * @file test_transfer_loop.cpp
 * @brief Unit tests for the plain stream path of the transfer loop
 */

#include "integration/test_fixtures.h"

#include <rtransfer/core/transfer_loop.h>

#include <mutex>
#include <thread>
#include <vector>

namespace rtransfer::test {

using namespace std::chrono_literals;

class TransferLoopTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        payload_ = make_payload(1000);
        destination_ = test_dir_ / "payload.bin";
    }

    auto resource() const -> fake_resource {
        fake_resource r;
        r.data = payload_;
        return r;
    }

    auto options() -> loop_options {
        loop_options opts;
        opts.sink = [this](const progress_sample& sample) {
            std::lock_guard lock(samples_mutex_);
            samples_.push_back(sample);
        };
        opts.label = "loop-test";
        return opts;
    }

    auto run(fake_stream_fetcher& fetcher,
             resume_decision decision = resume_decision::fresh(),
             std::optional<loop_options> opts = std::nullopt,
             std::optional<uint64_t> probed = std::nullopt) -> transfer_outcome {
        EXPECT_TRUE(control_.start().has_value());
        transfer_loop loop(control_, opts ? std::move(*opts) : options());

        stream_job job;
        job.url = "https://example.com/payload.bin";
        job.destination = destination_;
        job.decision = decision;
        job.probed_total = probed;
        return loop.run_stream(fetcher, job);
    }

    auto samples() -> std::vector<progress_sample> {
        std::lock_guard lock(samples_mutex_);
        return samples_;
    }

    std::vector<std::byte> payload_;
    std::filesystem::path destination_;
    transfer_control control_{10ms};
    std::mutex samples_mutex_;
    std::vector<progress_sample> samples_;
};

// ============================================================================
// Successful transfers
// ============================================================================

TEST_F(TransferLoopTest, FreshTransferWritesWholeResource) {
    fake_stream_fetcher fetcher(resource());

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(control_.state(), transfer_state::completed);
    EXPECT_EQ(outcome.bytes_transferred, 1000u);
    EXPECT_EQ(outcome.final_path, destination_);
    EXPECT_EQ(read_file(destination_), payload_);
    EXPECT_FALSE(fetcher.last_range().has_value());
}

TEST_F(TransferLoopTest, SamplesAreMonotonicAndEndAtTotal) {
    fake_stream_fetcher fetcher(resource());

    (void)run(fetcher);

    auto seen = samples();
    ASSERT_EQ(seen.size(), 10u);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i].bytes_transferred, (i + 1) * 100);
        EXPECT_EQ(seen[i].total_bytes, 1000u);
        if (i > 0) {
            EXPECT_GE(seen[i].bytes_transferred, seen[i - 1].bytes_transferred);
        }
    }
    ASSERT_TRUE(seen.back().percent.has_value());
    EXPECT_DOUBLE_EQ(*seen.back().percent, 100.0);
}

TEST_F(TransferLoopTest, HonoredRangeAppendsToPartialFile) {
    write_file(destination_, slice(payload_, 0, 400));
    fake_stream_fetcher fetcher(resource());

    auto outcome = run(fetcher, resume_decision::append_from(400));

    ASSERT_EQ(outcome.state, transfer_state::completed);
    ASSERT_TRUE(fetcher.last_range().has_value());
    EXPECT_EQ(fetcher.last_range()->offset, 400u);
    EXPECT_EQ(read_file(destination_), payload_);

    auto seen = samples();
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.front().bytes_transferred, 500u);
    EXPECT_EQ(seen.front().total_bytes, 1000u);
    EXPECT_EQ(seen.back().bytes_transferred, 1000u);
}

TEST_F(TransferLoopTest, IgnoredRangeRestartsFromZero) {
    write_file(destination_, slice(payload_, 0, 400));
    auto r = resource();
    r.honor_range = false;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher, resume_decision::append_from(400));

    ASSERT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(outcome.bytes_transferred, 1000u);
    EXPECT_EQ(file_size(destination_), 1000u);
    EXPECT_EQ(read_file(destination_), payload_);
}

TEST_F(TransferLoopTest, PartialResponseFromZeroRestartsFromZero) {
    write_file(destination_, slice(payload_, 0, 400));
    auto r = resource();
    r.served_offset = 0;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher, resume_decision::append_from(400));

    ASSERT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(outcome.bytes_transferred, 1000u);
    EXPECT_EQ(read_file(destination_), payload_);
}

TEST_F(TransferLoopTest, UndeclaredLengthUsesProbedTotal) {
    auto r = resource();
    r.declare_length = false;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher, resume_decision::fresh(), std::nullopt, 1000);

    ASSERT_EQ(outcome.state, transfer_state::completed);
    auto seen = samples();
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(seen.back().total_known());
    EXPECT_DOUBLE_EQ(*seen.back().percent, 100.0);
}

TEST_F(TransferLoopTest, UnknownTotalReportsBytesOnly) {
    auto r = resource();
    r.declare_length = false;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    ASSERT_EQ(outcome.state, transfer_state::completed);
    auto seen = samples();
    ASSERT_FALSE(seen.empty());
    EXPECT_FALSE(seen.back().total_known());
    EXPECT_FALSE(seen.back().percent.has_value());
    EXPECT_FALSE(seen.back().eta_seconds.has_value());
    EXPECT_EQ(seen.back().bytes_transferred, 1000u);
}

TEST_F(TransferLoopTest, WebpageAllowedWhenRejectionDisabled) {
    auto r = resource();
    r.content_type = "text/html; charset=utf-8";
    fake_stream_fetcher fetcher(r);

    auto opts = options();
    opts.reject_webpages = false;
    auto outcome = run(fetcher, resume_decision::fresh(), std::move(opts));

    EXPECT_EQ(outcome.state, transfer_state::completed);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(TransferLoopTest, ConnectionFailure) {
    auto r = resource();
    r.fail_open = true;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::connection_failed);
}

TEST_F(TransferLoopTest, ErrorStatusFailsWithCode) {
    auto r = resource();
    r.error_status = 404;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::http_error);
    EXPECT_NE(outcome.failure->message.find("404"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(destination_));
}

TEST_F(TransferLoopTest, PartialContentWithoutRangeFails) {
    auto r = resource();
    r.partial_without_range = true;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::unexpected_partial_content);
    EXPECT_EQ(outcome.failure->category(), error_category::transport_failure);
}

TEST_F(TransferLoopTest, PartialResponseFromWrongOffsetLeavesFileUntouched) {
    write_file(destination_, slice(payload_, 0, 400));
    auto r = resource();
    r.served_offset = 250;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher, resume_decision::append_from(400));

    EXPECT_EQ(outcome.state, transfer_state::failed);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::range_mismatch);
    EXPECT_EQ(read_file(destination_), slice(payload_, 0, 400));
    EXPECT_TRUE(samples().empty());
}

TEST_F(TransferLoopTest, WebpageRejected) {
    auto r = resource();
    r.content_type = "text/html";
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::webpage_content);
}

TEST_F(TransferLoopTest, ShortStreamIsLengthMismatch) {
    auto r = resource();
    r.missing_bytes = 100;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::length_mismatch);
    EXPECT_EQ(outcome.bytes_transferred, 900u);
    EXPECT_EQ(file_size(destination_), 900u);
}

TEST_F(TransferLoopTest, OverlongStreamIsOverflow) {
    auto r = resource();
    r.extra_bytes = 50;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::stream_overflow);
    EXPECT_LE(file_size(destination_), 1000u);
}

TEST_F(TransferLoopTest, DeclaredSizeOverLimit) {
    fake_stream_fetcher fetcher(resource());

    auto opts = options();
    opts.size_limit = size_limit_policy::at_most(500);
    auto outcome = run(fetcher, resume_decision::fresh(), std::move(opts));

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::file_too_large);
    EXPECT_FALSE(std::filesystem::exists(destination_));
}

TEST_F(TransferLoopTest, DeclaredSizeAtLimitIsAllowed) {
    fake_stream_fetcher fetcher(resource());

    auto opts = options();
    opts.size_limit = size_limit_policy::at_most(1000);
    auto outcome = run(fetcher, resume_decision::fresh(), std::move(opts));

    EXPECT_EQ(outcome.state, transfer_state::completed);
}

TEST_F(TransferLoopTest, UndeclaredStreamStopsAtLimit) {
    auto r = resource();
    r.declare_length = false;
    fake_stream_fetcher fetcher(r);

    auto opts = options();
    opts.size_limit = size_limit_policy::at_most(550);
    auto outcome = run(fetcher, resume_decision::fresh(), std::move(opts));

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::file_too_large);
    EXPECT_EQ(outcome.bytes_transferred, 500u);
    EXPECT_EQ(file_size(destination_), 500u);
}

TEST_F(TransferLoopTest, MidStreamErrorKeepsWrittenBytes) {
    auto r = resource();
    r.fail_at_chunk = 3;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::transport_error);
    EXPECT_EQ(outcome.bytes_transferred, 300u);
    EXPECT_EQ(read_file(destination_), slice(payload_, 0, 300));
}

TEST_F(TransferLoopTest, EmptyBodyIsEmptyDownload) {
    fake_resource r;
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::empty_download);
}

TEST_F(TransferLoopTest, UnwritableDestination) {
    destination_ = test_dir_ / "missing_dir" / "payload.bin";
    fake_stream_fetcher fetcher(resource());

    auto outcome = run(fetcher);

    EXPECT_EQ(outcome.state, transfer_state::failed);
    EXPECT_EQ(outcome.failure->code, error_code::file_open_error);
}

// ============================================================================
// Control
// ============================================================================

TEST_F(TransferLoopTest, CancelStopsAtNextBoundary) {
    fake_stream_fetcher fetcher(resource());
    auto gate = fetcher.gate_at(4);

    transfer_outcome outcome;
    std::thread worker([&] { outcome = run(fetcher); });

    ASSERT_TRUE(gate->wait_arrived());
    ASSERT_TRUE(control_.cancel().has_value());
    gate->release();
    worker.join();

    EXPECT_EQ(outcome.state, transfer_state::cancelled);
    EXPECT_FALSE(outcome.failure.has_value());
    // The chunk already being read is still written in full.
    EXPECT_EQ(outcome.bytes_transferred, 500u);
    EXPECT_EQ(read_file(destination_), slice(payload_, 0, 500));
}

TEST_F(TransferLoopTest, CancelDuringOpenKeepsPartialFile) {
    write_file(destination_, slice(payload_, 0, 400));
    auto r = resource();
    r.honor_range = false;
    r.on_open = [this] { (void)control_.cancel(); };
    fake_stream_fetcher fetcher(r);

    auto outcome = run(fetcher, resume_decision::append_from(400));

    EXPECT_EQ(outcome.state, transfer_state::cancelled);
    EXPECT_EQ(outcome.bytes_transferred, 400u);
    EXPECT_EQ(read_file(destination_), slice(payload_, 0, 400));
    EXPECT_TRUE(samples().empty());
}

TEST_F(TransferLoopTest, PauseHoldsWorkerUntilResume) {
    fake_stream_fetcher fetcher(resource());
    auto gate = fetcher.gate_at(2);

    transfer_outcome outcome;
    std::thread worker([&] { outcome = run(fetcher); });

    ASSERT_TRUE(gate->wait_arrived());
    ASSERT_TRUE(control_.pause().has_value());
    gate->release();

    ASSERT_TRUE(eventually([&] {
        auto seen = samples();
        return !seen.empty() && seen.back().bytes_transferred == 300;
    }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(samples().back().bytes_transferred, 300u);
    EXPECT_EQ(control_.state(), transfer_state::paused);

    ASSERT_TRUE(control_.resume().has_value());
    worker.join();

    EXPECT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(read_file(destination_), payload_);
}

// ============================================================================
// Chunk sequences
// ============================================================================

struct chunk_case {
    std::string name;
    std::vector<std::size_t> sizes;  ///< First chunk sizes of the response
    std::size_t chunk_size;          ///< Size of every later chunk
    uint64_t resume_offset;          ///< Bytes already on disk
};

auto random_sizes(std::size_t total, uint32_t seed) -> std::vector<std::size_t> {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::size_t> dis(1, 257);
    std::vector<std::size_t> sizes;
    std::size_t sum = 0;
    while (sum < total) {
        sizes.push_back(dis(gen));
        sum += sizes.back();
    }
    return sizes;
}

class ChunkSequenceTest : public TempDirectoryFixture,
                          public ::testing::WithParamInterface<chunk_case> {};

TEST_P(ChunkSequenceTest, EndsWithExactlyTheResource) {
    const auto& param = GetParam();
    auto payload = make_payload(1000, 7);
    auto destination = test_dir_ / "sequence.bin";
    auto offset = static_cast<std::size_t>(param.resume_offset);
    if (offset > 0) {
        write_file(destination, slice(payload, 0, offset));
    }

    fake_resource r;
    r.data = payload;
    r.chunk_sizes = param.sizes;
    r.chunk_size = param.chunk_size;
    fake_stream_fetcher fetcher(r);

    std::vector<progress_sample> seen;
    loop_options opts;
    opts.sink = [&seen](const progress_sample& sample) { seen.push_back(sample); };

    transfer_control control{10ms};
    ASSERT_TRUE(control.start().has_value());
    transfer_loop loop(control, std::move(opts));

    stream_job job;
    job.url = "https://example.com/sequence.bin";
    job.destination = destination;
    job.decision = offset > 0 ? resume_decision::append_from(offset) : resume_decision::fresh();
    auto outcome = loop.run_stream(fetcher, job);

    ASSERT_EQ(outcome.state, transfer_state::completed);
    EXPECT_EQ(outcome.bytes_transferred, 1000u);
    EXPECT_EQ(read_file(destination), payload);

    ASSERT_FALSE(seen.empty());
    EXPECT_GT(seen.front().bytes_transferred, param.resume_offset);
    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GT(seen[i].bytes_transferred, seen[i - 1].bytes_transferred) << "sample " << i;
    }
    EXPECT_EQ(seen.back().bytes_transferred, 1000u);
    EXPECT_EQ(seen.back().total_bytes, 1000u);
    ASSERT_TRUE(seen.back().percent.has_value());
    EXPECT_DOUBLE_EQ(*seen.back().percent, 100.0);
}

INSTANTIATE_TEST_SUITE_P(
    Sequences,
    ChunkSequenceTest,
    ::testing::Values(
        chunk_case{"ThreeLargeThenShortFinal", {300, 300, 300}, 100, 0},
        chunk_case{"UnevenThirds", {333, 333, 333}, 100, 0},
        chunk_case{"SingleChunk", {1000}, 1000, 0},
        chunk_case{"SingleBytes", {}, 1, 0},
        chunk_case{"Random", random_sizes(1000, 11), 100, 0},
        chunk_case{"ResumeUnalignedOffset", {250, 13, 300}, 64, 437},
        chunk_case{"ResumeLastByte", {}, 100, 999},
        chunk_case{"ResumeAfterFirstByte", {999}, 100, 1},
        chunk_case{"ResumeRandom", random_sizes(613, 23), 100, 387}),
    [](const ::testing::TestParamInfo<chunk_case>& info) { return info.param.name; });

}  // namespace rtransfer::test
