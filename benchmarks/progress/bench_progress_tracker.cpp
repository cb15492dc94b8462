/**
 * @file bench_progress_tracker.cpp
 * @brief Benchmarks for progress accounting and publication
 */

#include <benchmark/benchmark.h>

#include <rtransfer/core/progress_channel.h>
#include <rtransfer/core/progress_tracker.h>

#include <chrono>
#include <thread>

namespace rtransfer::benchmark {

using clock = std::chrono::steady_clock;

/**
 * @brief Cost of one observe() call per chunk
 */
static void BM_ProgressTracker_Observe(::benchmark::State& state) {
    const auto total = static_cast<uint64_t>(state.range(0));
    constexpr uint64_t chunk = 8 * 1024;

    auto start = clock::now();
    progress_tracker tracker(total, 0, start);
    uint64_t bytes = 0;
    auto now = start;

    for (auto _ : state) {
        bytes += chunk;
        if (total > 0 && bytes > total) {
            bytes = chunk;
        }
        now += std::chrono::microseconds(50);
        ::benchmark::DoNotOptimize(tracker.observe(bytes, now));
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_ProgressTracker_FormatLine(::benchmark::State& state) {
    auto start = clock::now();
    progress_tracker tracker(state.range(0) > 0 ? 100 * 1024 * 1024 : 0, 0, start);
    auto sample = tracker.observe(42 * 1024 * 1024, start + std::chrono::seconds(3));

    for (auto _ : state) {
        auto line = format_progress_line(sample);
        ::benchmark::DoNotOptimize(line);
    }
}

/**
 * @brief Latest-value publication with a concurrent reader
 */
static void BM_ProgressChannel_Publish(::benchmark::State& state) {
    static progress_channel<progress_sample> channel;
    progress_sample sample;

    if (state.thread_index() == 0) {
        channel.reset();
    }

    for (auto _ : state) {
        if (state.thread_index() == 0) {
            sample.bytes_transferred += 1024;
            channel.publish(sample);
        } else {
            ::benchmark::DoNotOptimize(channel.latest());
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ProgressTracker_Observe)
    ->Arg(0)
    ->Arg(1024 * 1024 * 1024)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_ProgressTracker_FormatLine)
    ->Arg(0)
    ->Arg(1)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_ProgressChannel_Publish)
    ->Threads(1)
    ->Threads(2)
    ->Threads(4)
    ->Unit(::benchmark::kNanosecond);

}  // namespace rtransfer::benchmark
