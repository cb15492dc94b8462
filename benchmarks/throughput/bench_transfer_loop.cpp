/**
 * @file bench_transfer_loop.cpp
 * @brief Throughput of the chunked copy loop from memory to disk
 */

#include <benchmark/benchmark.h>

#include <rtransfer/core/logging.h>
#include <rtransfer/core/transfer_control.h>
#include <rtransfer/core/transfer_loop.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <fstream>
#include <memory>

namespace rtransfer::benchmark {

/**
 * @brief Fresh stream run for various sizes and chunk sizes
 */
static void BM_TransferLoop_Stream(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    get_logger().set_quiet(true);
    temp_directory dir;
    auto data = std::make_shared<const std::vector<std::byte>>(
        generate_random_data(file_size, 42));
    memory_stream_fetcher fetcher(data, chunk_size);

    stream_job job;
    job.url = "https://bench.example.com/payload.bin";
    job.destination = dir.path() / "payload.bin";

    for (auto _ : state) {
        transfer_control control;
        if (!control.start()) {
            state.SkipWithError("Control did not start");
            return;
        }
        transfer_loop loop(control, loop_options{});

        auto outcome = loop.run_stream(fetcher, job);
        if (!outcome.succeeded()) {
            state.SkipWithError("Transfer failed");
            return;
        }
        ::benchmark::DoNotOptimize(outcome);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_quiet(false);
}

/**
 * @brief Same run with a progress sink attached
 */
static void BM_TransferLoop_StreamWithSink(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    get_logger().set_quiet(true);
    temp_directory dir;
    auto data = std::make_shared<const std::vector<std::byte>>(
        generate_random_data(file_size, 42));
    memory_stream_fetcher fetcher(data, sizes::default_chunk);

    stream_job job;
    job.url = "https://bench.example.com/payload.bin";
    job.destination = dir.path() / "payload.bin";

    uint64_t samples = 0;
    for (auto _ : state) {
        transfer_control control;
        if (!control.start()) {
            state.SkipWithError("Control did not start");
            return;
        }
        loop_options options;
        options.sink = [&samples](const progress_sample&) { ++samples; };
        transfer_loop loop(control, std::move(options));

        auto outcome = loop.run_stream(fetcher, job);
        if (!outcome.succeeded()) {
            state.SkipWithError("Transfer failed");
            return;
        }
    }

    state.counters["samples"] = ::benchmark::Counter(
        static_cast<double>(samples), ::benchmark::Counter::kAvgIterations);
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_quiet(false);
}

/**
 * @brief Resume of the second half of a file
 */
static void BM_TransferLoop_ResumeHalf(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto half = file_size / 2;

    get_logger().set_quiet(true);
    temp_directory dir;
    auto data = std::make_shared<const std::vector<std::byte>>(
        generate_random_data(file_size, 42));
    memory_stream_fetcher fetcher(data, sizes::default_chunk);

    stream_job job;
    job.url = "https://bench.example.com/payload.bin";
    job.destination = dir.path() / "payload.bin";
    job.decision = resume_decision::append_from(half);
    std::ofstream(job.destination, std::ios::binary).close();

    for (auto _ : state) {
        state.PauseTiming();
        std::filesystem::resize_file(job.destination, 0);
        std::filesystem::resize_file(job.destination, half);
        transfer_control control;
        if (!control.start()) {
            state.SkipWithError("Control did not start");
            return;
        }
        state.ResumeTiming();

        transfer_loop loop(control, loop_options{});
        auto outcome = loop.run_stream(fetcher, job);
        if (!outcome.succeeded()) {
            state.SkipWithError("Resume failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size - half) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_quiet(false);
}

BENCHMARK(BM_TransferLoop_Stream)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_TransferLoop_StreamWithSink)
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_TransferLoop_ResumeHalf)
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Unit(::benchmark::kMillisecond);

}  // namespace rtransfer::benchmark
