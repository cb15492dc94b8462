/**
 * @file ytdlp_media_source.cpp
 * @brief yt-dlp child process driver
 */

#include "rtransfer/media/ytdlp_media_source.h"

#include "rtransfer/core/logging.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rtransfer {

namespace {

// ============================================================================
// Minimal JSON scanning for the -J dump
// ============================================================================

using json_field = std::pair<std::string, std::string_view>;

auto skip_ws(std::string_view s, std::size_t pos) -> std::size_t {
    while (pos < s.size() &&
           (s[pos] == ' ' || s[pos] == '\n' || s[pos] == '\t' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

void append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/**
 * @brief Decode a string literal starting at @p pos (on the opening quote)
 * @return Decoded text and the position after the closing quote
 */
auto scan_string(std::string_view s, std::size_t pos)
    -> std::optional<std::pair<std::string, std::size_t>> {
    if (pos >= s.size() || s[pos] != '"') {
        return std::nullopt;
    }
    std::string out;
    ++pos;
    while (pos < s.size()) {
        char c = s[pos];
        if (c == '"') {
            return std::make_pair(std::move(out), pos + 1);
        }
        if (c != '\\') {
            out += c;
            ++pos;
            continue;
        }
        if (pos + 1 >= s.size()) {
            return std::nullopt;
        }
        char esc = s[pos + 1];
        switch (esc) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                if (pos + 5 >= s.size()) {
                    return std::nullopt;
                }
                unsigned int cp = 0;
                for (std::size_t i = 2; i < 6; ++i) {
                    char h = s[pos + i];
                    cp <<= 4;
                    if (h >= '0' && h <= '9') cp |= static_cast<unsigned int>(h - '0');
                    else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned int>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned int>(h - 'A' + 10);
                    else return std::nullopt;
                }
                append_utf8(out, cp);
                pos += 4;
                break;
            }
            default:
                return std::nullopt;
        }
        pos += 2;
    }
    return std::nullopt;
}

/**
 * @brief Position just past the value starting at @p pos
 */
auto skip_value(std::string_view s, std::size_t pos) -> std::optional<std::size_t> {
    pos = skip_ws(s, pos);
    if (pos >= s.size()) {
        return std::nullopt;
    }

    if (s[pos] == '"') {
        auto str = scan_string(s, pos);
        if (!str) return std::nullopt;
        return str->second;
    }

    if (s[pos] == '{' || s[pos] == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char c = s[pos];
            if (c == '"') {
                auto str = scan_string(s, pos);
                if (!str) return std::nullopt;
                pos = str->second;
                continue;
            }
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return pos + 1;
                }
            }
            ++pos;
        }
        return std::nullopt;
    }

    auto end = pos;
    while (end < s.size() && s[end] != ',' && s[end] != '}' && s[end] != ']' &&
           s[end] != ' ' && s[end] != '\n' && s[end] != '\t' && s[end] != '\r') {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return end;
}

/**
 * @brief Top-level fields of the object starting at @p pos
 */
auto object_fields(std::string_view s, std::size_t pos = 0)
    -> std::optional<std::vector<json_field>> {
    pos = skip_ws(s, pos);
    if (pos >= s.size() || s[pos] != '{') {
        return std::nullopt;
    }
    ++pos;

    std::vector<json_field> fields;
    pos = skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        return fields;
    }

    while (pos < s.size()) {
        pos = skip_ws(s, pos);
        auto key = scan_string(s, pos);
        if (!key) return std::nullopt;
        pos = skip_ws(s, key->second);
        if (pos >= s.size() || s[pos] != ':') return std::nullopt;

        auto value_start = skip_ws(s, pos + 1);
        auto value_end = skip_value(s, value_start);
        if (!value_end) return std::nullopt;
        fields.emplace_back(std::move(key->first),
                            s.substr(value_start, *value_end - value_start));

        pos = skip_ws(s, *value_end);
        if (pos < s.size() && s[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < s.size() && s[pos] == '}') {
            return fields;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

auto array_elements(std::string_view s) -> std::optional<std::vector<std::string_view>> {
    auto pos = skip_ws(s, 0);
    if (pos >= s.size() || s[pos] != '[') {
        return std::nullopt;
    }
    ++pos;

    std::vector<std::string_view> elements;
    pos = skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        return elements;
    }

    while (pos < s.size()) {
        auto start = skip_ws(s, pos);
        auto end = skip_value(s, start);
        if (!end) return std::nullopt;
        elements.push_back(s.substr(start, *end - start));

        pos = skip_ws(s, *end);
        if (pos < s.size() && s[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < s.size() && s[pos] == ']') {
            return elements;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

auto find_field(const std::vector<json_field>& fields, std::string_view key)
    -> std::optional<std::string_view> {
    for (const auto& [name, raw] : fields) {
        if (name == key) {
            return raw;
        }
    }
    return std::nullopt;
}

auto as_string(std::optional<std::string_view> raw) -> std::string {
    if (!raw || raw->empty() || raw->front() != '"') {
        return {};
    }
    auto decoded = scan_string(*raw, 0);
    return decoded ? decoded->first : std::string{};
}

auto as_number(std::optional<std::string_view> raw) -> std::optional<double> {
    if (!raw || raw->empty() || *raw == "null" || raw->front() == '"') {
        return std::nullopt;
    }
    std::string text(*raw);
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return std::nullopt;
    }
    return value;
}

auto parse_count(std::string_view token) -> std::optional<uint64_t> {
    if (token.empty() || token == "NA" || token == "None") {
        return std::nullopt;
    }
    std::string text(token);
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || value < 0.0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

// ============================================================================
// Child process
// ============================================================================

/**
 * @brief yt-dlp child with its stdout (and optionally stderr) on a pipe
 *
 * The destructor terminates and reaps a child that is still running.
 */
class child_process {
public:
    child_process() = default;

    child_process(const child_process&) = delete;
    auto operator=(const child_process&) -> child_process& = delete;

    ~child_process() {
        if (pid_ > 0) {
            terminate();
            (void)wait();
        }
        if (stream_) {
            std::fclose(stream_);
        }
    }

    [[nodiscard]] auto spawn(const std::vector<std::string>& args, bool merge_stderr)
        -> result<void> {
        int fds[2];
        if (::pipe(fds) != 0) {
            return unexpected{error{error_code::media_source_error,
                std::string("pipe failed: ") + std::strerror(errno)}};
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            ::close(fds[0]);
            ::close(fds[1]);
            return unexpected{error{error_code::media_source_error,
                std::string("fork failed: ") + std::strerror(errno)}};
        }

        if (pid == 0) {
            ::dup2(fds[1], STDOUT_FILENO);
            if (merge_stderr) {
                ::dup2(fds[1], STDERR_FILENO);
            } else {
                int null_fd = ::open("/dev/null", O_WRONLY);
                if (null_fd >= 0) {
                    ::dup2(null_fd, STDERR_FILENO);
                    ::close(null_fd);
                }
            }
            ::close(fds[0]);
            ::close(fds[1]);
            ::execvp(argv[0], argv.data());
            ::_exit(127);
        }

        ::close(fds[1]);
        stream_ = ::fdopen(fds[0], "r");
        if (!stream_) {
            ::close(fds[0]);
            pid_ = pid;
            return unexpected{error{error_code::media_source_error, "fdopen failed"}};
        }
        pid_ = pid;
        return {};
    }

    /**
     * @brief Next output line without the trailing newline; nullopt at EOF
     */
    [[nodiscard]] auto read_line() -> std::optional<std::string> {
        if (!stream_) {
            return std::nullopt;
        }
        std::string line;
        char buffer[4096];
        while (std::fgets(buffer, sizeof(buffer), stream_) != nullptr) {
            line += buffer;
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return line;
            }
        }
        if (line.empty()) {
            return std::nullopt;
        }
        return line;
    }

    void terminate() {
        if (pid_ > 0) {
            ::kill(pid_, SIGTERM);
        }
    }

    /**
     * @brief Reap the child
     * @return Exit status, 128 + signal number when killed
     */
    [[nodiscard]] auto wait() -> int {
        if (pid_ <= 0) {
            return -1;
        }
        int status = 0;
        pid_t reaped;
        do {
            reaped = ::waitpid(pid_, &status, 0);
        } while (reaped < 0 && errno == EINTR);
        pid_ = -1;

        if (reaped < 0) {
            return -1;
        }
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

private:
    pid_t pid_ = -1;
    FILE* stream_ = nullptr;
};

auto describe_exit(int code, const std::string& last_error, const std::string& executable)
    -> std::string {
    if (code == 127) {
        return executable + " could not be executed";
    }
    if (!last_error.empty()) {
        return last_error;
    }
    return executable + " exited with status " + std::to_string(code);
}

}  // namespace

// ============================================================================
// Parsing helpers
// ============================================================================

namespace ytdlp {

auto build_fetch_arguments(const ytdlp_config& config,
                           const std::string& url,
                           const std::string& format_id,
                           const std::string& destination_template)
    -> std::vector<std::string> {
    std::vector<std::string> args{
        config.executable,
        "--no-simulate",
        "--progress",
        "--newline",
        "--no-colors",
        "--progress-template",
        "download:" + std::string(progress_prefix) +
            "%(progress.status)s %(progress.downloaded_bytes)s "
            "%(progress.total_bytes)s %(progress.total_bytes_estimate)s "
            "%(progress.filename)s",
        "--print",
        "after_move:" + std::string(final_path_prefix) + "%(filepath)s",
        "-f",
        format_id.empty() ? std::string("best") : format_id,
        "-o",
        destination_template,
    };
    args.insert(args.end(), config.extra_arguments.begin(), config.extra_arguments.end());
    args.push_back(url);
    return args;
}

auto build_listing_arguments(const ytdlp_config& config, const std::string& url)
    -> std::vector<std::string> {
    std::vector<std::string> args{config.executable, "-J", "--no-warnings", "--no-playlist"};
    args.insert(args.end(), config.extra_arguments.begin(), config.extra_arguments.end());
    args.push_back(url);
    return args;
}

auto parse_progress_line(std::string_view line) -> std::optional<media_event> {
    if (line.substr(0, progress_prefix.size()) != progress_prefix) {
        return std::nullopt;
    }
    line.remove_prefix(progress_prefix.size());

    std::string_view tokens[4];
    for (auto& token : tokens) {
        auto space = line.find(' ');
        token = line.substr(0, space);
        line = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);
    }

    media_event event;
    if (tokens[0] == "downloading") {
        event.kind = media_event_kind::downloading;
    } else if (tokens[0] == "finished") {
        event.kind = media_event_kind::finished;
    } else {
        return std::nullopt;
    }

    auto bytes = parse_count(tokens[1]);
    auto exact = parse_count(tokens[2]);
    auto estimate = parse_count(tokens[3]);

    if (exact && *exact > 0) {
        event.total = exact;
    } else if (estimate && *estimate > 0) {
        event.total = estimate;
        event.total_is_estimate = true;
    }

    if (bytes) {
        event.bytes = *bytes;
    } else if (event.kind == media_event_kind::finished && event.total) {
        event.bytes = *event.total;
    }

    if (!line.empty() && line != "NA") {
        event.filename = std::filesystem::path(std::string(line));
    }
    return event;
}

auto parse_final_path_line(std::string_view line) -> std::optional<std::filesystem::path> {
    if (line.substr(0, final_path_prefix.size()) != final_path_prefix) {
        return std::nullopt;
    }
    line.remove_prefix(final_path_prefix.size());
    if (line.empty() || line == "NA") {
        return std::nullopt;
    }
    return std::filesystem::path(std::string(line));
}

auto parse_format_listing(std::string_view json) -> result<std::vector<media_format>> {
    auto brace = json.find('{');
    auto top = brace == std::string_view::npos ? std::nullopt : object_fields(json, brace);
    if (!top) {
        return unexpected{error{error_code::media_source_error,
                                "Malformed format listing"}};
    }

    std::vector<media_format> formats;
    auto raw_formats = find_field(*top, "formats");
    if (!raw_formats || *raw_formats == "null") {
        return formats;
    }

    auto entries = array_elements(*raw_formats);
    if (!entries) {
        return unexpected{error{error_code::media_source_error,
                                "Malformed formats array"}};
    }

    for (auto entry : *entries) {
        auto fields = object_fields(entry);
        if (!fields) {
            continue;
        }

        media_format format;
        format.id = as_string(find_field(*fields, "format_id"));
        if (format.id.empty()) {
            continue;
        }
        if (auto height = as_number(find_field(*fields, "height"))) {
            format.height = static_cast<int>(*height);
        }
        format.fps = as_number(find_field(*fields, "fps"));
        format.container = as_string(find_field(*fields, "ext"));
        format.note = as_string(find_field(*fields, "format_note"));
        format.has_video = as_string(find_field(*fields, "vcodec")) != "none";
        format.has_audio = as_string(find_field(*fields, "acodec")) != "none";
        formats.push_back(std::move(format));
    }
    return formats;
}

}  // namespace ytdlp

// ============================================================================
// ytdlp_media_source
// ============================================================================

ytdlp_media_source::ytdlp_media_source(ytdlp_config config)
    : config_(std::move(config)) {}

auto ytdlp_media_source::list_formats(const std::string& url)
    -> result<std::vector<media_format>> {
    child_process child;
    auto spawned = child.spawn(ytdlp::build_listing_arguments(config_, url), false);
    if (!spawned) {
        return unexpected{spawned.error()};
    }

    std::string output;
    while (auto line = child.read_line()) {
        output += *line;
        output += '\n';
    }

    int code = child.wait();
    if (code != 0) {
        return unexpected{error{error_code::media_source_error,
            describe_exit(code, {}, config_.executable)}};
    }

    auto formats = ytdlp::parse_format_listing(output);
    if (formats) {
        RT_LOG_DEBUG(log_category::media,
                     "Listed " + std::to_string(formats.value().size()) + " formats");
    }
    return formats;
}

auto ytdlp_media_source::fetch(const std::string& url,
                               const std::string& format_id,
                               const std::string& destination_template,
                               const event_handler& handler)
    -> result<media_fetch_result> {
    child_process child;
    auto args = ytdlp::build_fetch_arguments(config_, url, format_id, destination_template);
    auto spawned = child.spawn(args, true);
    if (!spawned) {
        return unexpected{spawned.error()};
    }

    media_fetch_result fetched;
    std::filesystem::path last_event_file;
    std::string last_error;

    while (auto line = child.read_line()) {
        if (auto event = ytdlp::parse_progress_line(*line)) {
            if (!event->filename.empty()) {
                last_event_file = event->filename;
            }
            if (!fetched.aborted && handler(*event) == media_verdict::abort) {
                RT_LOG_DEBUG(log_category::media, "Handler requested abort, stopping yt-dlp");
                fetched.aborted = true;
                child.terminate();
            }
            continue;
        }
        if (auto path = ytdlp::parse_final_path_line(*line)) {
            fetched.final_path = *path;
            continue;
        }
        if (line->rfind("ERROR:", 0) == 0) {
            last_error = *line;
            RT_LOG_WARN(log_category::media, *line);
        } else {
            RT_LOG_TRACE(log_category::media, *line);
        }
    }

    int code = child.wait();
    if (fetched.aborted) {
        return fetched;
    }
    if (code != 0) {
        return unexpected{error{error_code::media_source_error,
            describe_exit(code, last_error, config_.executable)}};
    }

    if (fetched.final_path.empty()) {
        fetched.final_path = last_event_file;
    }
    return fetched;
}

}  // namespace rtransfer
