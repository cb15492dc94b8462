/**
 * @file rtransfer_cli.cpp
 * @brief Command-line front end for the transfer engine
 *
 * This program demonstrates:
 * - Building an engine with the default HTTP and yt-dlp collaborators
 * - Starting a plain or media session and rendering its progress
 * - Resuming a partial download from where it stopped
 * - Cancelling with Ctrl+C (partial bytes are kept) and pausing with SIGUSR1
 */

#include <rtransfer/rtransfer.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

using namespace rtransfer;

namespace {

std::atomic<bool> g_interrupted{false};
std::atomic<bool> g_toggle_pause{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

void on_toggle_pause(int) {
    g_toggle_pause.store(true);
}

constexpr int exit_completed = 0;
constexpr int exit_failed = 1;
constexpr int exit_usage = 2;
constexpr int exit_cancelled = 130;

void print_usage(const char* program) {
    std::cout << "rtransfer " << version::to_string()
              << " - resumable downloads with pause and cancel" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -o, --output <path>     Destination file (default: inferred from URL)" << std::endl;
    std::cout << "  --no-resume             Restart instead of extending a partial file" << std::endl;
    std::cout << "  --media                 Download through yt-dlp (streaming sites)" << std::endl;
    std::cout << "  -q, --quality <format>  Media format selector (default: best)" << std::endl;
    std::cout << "  --list-formats          List media formats and exit" << std::endl;
    std::cout << "  --log-level <level>     trace, debug, info, warn, error (default: warn)" << std::endl;
    std::cout << "  --json-log              Emit log records as JSON" << std::endl;
    std::cout << "  --help                  Show this help" << std::endl;
    std::cout << std::endl;
    std::cout << "Ctrl+C cancels the transfer and keeps the partial file." << std::endl;
    std::cout << "SIGUSR1 toggles pause." << std::endl;
}

struct cli_options {
    std::string url;
    std::string output;
    bool resume = true;
    bool media = false;
    std::string quality;
    bool list_formats = false;
    log_level level = log_level::warn;
    bool json_log = false;
};

auto list_formats(transfer_engine& engine, const std::string& url) -> int {
    auto formats = engine.list_formats(url);
    if (!formats.has_value()) {
        std::cerr << "Could not list formats: " << formats.error().message << std::endl;
        std::cout << "best" << std::endl;
        return exit_failed;
    }

    if (formats.value().empty()) {
        std::cout << "best" << std::endl;
        return exit_completed;
    }
    for (const auto& format : formats.value()) {
        std::cout << format.label() << std::endl;
    }
    return exit_completed;
}

auto report(const transfer_outcome& outcome) -> int {
    std::cout << std::endl;
    switch (outcome.state) {
        case transfer_state::completed:
            if (outcome.already_complete) {
                std::cout << "Already downloaded: " << outcome.final_path.string() << std::endl;
            } else {
                std::cout << "Saved " << format_bytes(static_cast<double>(outcome.bytes_transferred))
                          << " to " << outcome.final_path.string() << " in "
                          << outcome.elapsed.count() << " ms" << std::endl;
            }
            return exit_completed;
        case transfer_state::cancelled:
            std::cout << "Cancelled after "
                      << format_bytes(static_cast<double>(outcome.bytes_transferred))
                      << "; run again to resume." << std::endl;
            return exit_cancelled;
        default:
            std::cerr << "Download failed: "
                      << (outcome.failure ? outcome.failure->message : std::string("unknown error"))
                      << std::endl;
            return exit_failed;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    cli_options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return exit_completed;
        } else if (arg == "-o" || arg == "--output") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires an argument" << std::endl;
                return exit_usage;
            }
            options.output = argv[i];
        } else if (arg == "--no-resume") {
            options.resume = false;
        } else if (arg == "--media") {
            options.media = true;
        } else if (arg == "-q" || arg == "--quality") {
            if (++i >= argc) {
                std::cerr << "Error: --quality requires an argument" << std::endl;
                return exit_usage;
            }
            options.quality = argv[i];
        } else if (arg == "--list-formats") {
            options.list_formats = true;
        } else if (arg == "--log-level") {
            if (++i >= argc) {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return exit_usage;
            }
            auto level = log_level_from_string(argv[i]);
            if (!level) {
                std::cerr << "Error: unknown log level '" << argv[i] << "'" << std::endl;
                return exit_usage;
            }
            options.level = *level;
        } else if (arg == "--json-log") {
            options.json_log = true;
        } else if (!arg.empty() && arg[0] != '-' && options.url.empty()) {
            options.url = arg;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            print_usage(argv[0]);
            return exit_usage;
        }
    }

    if (options.url.empty()) {
        print_usage(argv[0]);
        return exit_usage;
    }

    auto& logger = get_logger();
    logger.set_level(options.level);
    logger.enable_json_output(options.json_log);

    auto engine_result = transfer_engine::builder()
        .with_resume_by_default(options.resume)
        .build();
    if (!engine_result.has_value()) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return exit_failed;
    }
    auto& engine = engine_result.value();

    if (options.list_formats) {
        return list_formats(engine, options.url);
    }

    auto request = engine.make_request(
        options.url, options.media ? transfer_mode::media_stream : transfer_mode::plain_file);
    if (!options.output.empty()) {
        request.destination = options.output;
    }
    request.quality = options.quality;

    auto session_result = engine.create_session(std::move(request));
    if (!session_result.has_value()) {
        std::cerr << "Error: " << session_result.error().message << std::endl;
        return exit_usage;
    }
    auto& session = *session_result.value();

    std::signal(SIGINT, on_interrupt);
#ifdef SIGUSR1
    std::signal(SIGUSR1, on_toggle_pause);
#endif

    auto started = session.start();
    if (!started.has_value()) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return exit_failed;
    }

    uint64_t last_sequence = 0;
    while (true) {
        auto finished = session.wait_for(std::chrono::milliseconds{200});
        if (finished.has_value()) {
            return report(finished.value());
        }
        if (finished.error().code != error_code::wait_timeout) {
            std::cerr << std::endl << "Error: " << finished.error().message << std::endl;
            return exit_failed;
        }

        if (g_interrupted.exchange(false)) {
            std::cout << std::endl << "Cancelling..." << std::endl;
            if (auto cancelled = session.cancel(); !cancelled.has_value()) {
                std::cerr << "Cancel ignored: " << cancelled.error().message << std::endl;
            }
        }

        if (g_toggle_pause.exchange(false)) {
            auto toggled = session.state() == transfer_state::paused ? session.resume()
                                                                      : session.pause();
            if (!toggled.has_value()) {
                std::cerr << std::endl << toggled.error().message << std::endl;
            } else if (session.state() == transfer_state::paused) {
                std::cout << std::endl << "Paused (send SIGUSR1 again to resume)" << std::endl;
            }
        }

        auto sequence = session.progress_sequence();
        if (sequence != last_sequence) {
            last_sequence = sequence;
            if (auto sample = session.latest_progress()) {
                std::cout << "\r" << format_progress_line(*sample) << "    " << std::flush;
            }
        }
    }
}
