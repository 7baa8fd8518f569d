// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/commands.hpp>
#include <volley/cli/progress_bar.hpp>
#include <volley/core/download_engine.hpp>
#include <volley/core/http_session.hpp>
#include <volley/core/settings.hpp>
#include <volley/core/url.hpp>
#include <volley/version.hpp>
#include <curl/curl.h>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <thread>
#include <type_traits>

using namespace volley::core;

namespace chrono = std::chrono;

namespace volley::cli {

namespace {

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void handle_signal(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Fetch the value of an option that takes one
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                fail(std::format("Option {} needs a value", arg));
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        auto number = [&]<typename T>(std::optional<T>& out) {
            auto v = value();
            if (!v) return;
            out = parse_number<T>(*v);
            if (!out) fail(std::format("Invalid value for {}: {}", arg, *v));
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--part-files") {
            args.part_files = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value()) args.output_file = *v;
        } else if (arg == "--config") {
            if (auto v = value()) args.config_file = *v;
        } else if (arg == "--log-level") {
            if (auto v = value()) args.log_level = *v;
        } else if (arg == "-n" || arg == "--concurrency") {
            number(args.concurrency);
        } else if (arg == "-r" || arg == "--retries") {
            number(args.retries);
        } else if (arg == "--base-delay") {
            number(args.base_delay);
        } else if (arg == "--max-delay") {
            number(args.max_delay);
        } else if (arg == "--timeout") {
            number(args.timeout);
        } else if (arg == "--jitter") {
            number(args.jitter);
        } else if (arg == "-c" || arg == "--chunk-size") {
            number(args.chunk_size);
        } else if (arg.starts_with("-") && arg.size() > 1) {
            fail(std::format("Unknown option: {}", arg));
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            fail(std::format("Unexpected argument: {}", arg));
        }
    }

    return args;
}

std::expected<DownloadConfig, std::error_code> build_config(const CliArgs& args) {
    DownloadConfig config;

    if (!args.config_file.empty()) {
        auto loaded = load_config(args.config_file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.concurrency) config.concurrency = *args.concurrency;
    if (args.retries) config.max_retries = *args.retries;

    // Durations are given in seconds; out of range values are a config error
    auto set_seconds = [](double value, auto& out) {
        auto d = duration_from_seconds<std::remove_reference_t<decltype(out)>>(value);
        if (d) out = *d;
        return d.has_value();
    };
    if ((args.base_delay && !set_seconds(*args.base_delay, config.base_delay))
        || (args.max_delay && !set_seconds(*args.max_delay, config.max_delay))
        || (args.timeout && !set_seconds(*args.timeout, config.timeout))) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
    if (args.jitter) config.jitter = *args.jitter;
    if (args.chunk_size) config.chunk_size = *args.chunk_size;
    if (args.part_files) config.sink_mode = SinkMode::part_files;

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

int download(const CliArgs& args, const DownloadConfig& config) {
    HttpSession session;
    DownloadEngine engine(session, config);

    ProgressBar bar(std::cerr, "Downloading");
    if (!args.quiet) {
        engine.callback([&bar](const DownloadProgress& p) { bar.update(p); });
    }

    // Turn a signal into a cooperative cancel
    std::jthread watcher([&engine](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (interrupted()) {
                engine.cancel();
                return;
            }
            std::this_thread::sleep_for(chrono::milliseconds(50));
        }
    });

    auto result = engine.run(args.url, args.output_file);
    watcher.request_stop();
    watcher.join();

    if (!result) {
        if (!args.quiet) bar.clear();
        const auto& error = result.error();
        if (error.kind == ErrorClass::cancelled) {
            std::cerr << "Download cancelled" << std::endl;
        } else {
            std::cerr << "Error: " << error.message() << std::endl;
        }
        return exit_code_for(error.kind);
    }

    if (!args.quiet) {
        bar.finish();
        auto seconds = static_cast<double>(result->elapsed.count()) / 1000.0;
        std::cout << std::format("Saved {} ({}, {} chunk(s), {} attempt(s), {:.1f}s)",
                                 result->output_path, format_bytes(result->bytes),
                                 result->chunks, result->total_attempts, seconds)
                  << std::endl;
    }
    return exit_code::ok;
}

int info(const CliArgs& args, const DownloadConfig& config) {
    HttpSession session;
    DownloadEngine engine(session, config);

    auto resource = engine.probe(args.url);
    if (!resource) {
        std::cerr << "Error: " << resource.error().message() << std::endl;
        return exit_code_for(resource.error().kind);
    }

    std::cout << "URL: " << resource->url << '\n';
    if (resource->total_size) {
        std::cout << "Size: " << *resource->total_size << " bytes (" << format_bytes(*resource->total_size) << ")\n";
    } else {
        std::cout << "Size: unknown\n";
    }
    std::cout << "Ranges: " << (resource->supports_ranges ? "yes" : "no") << '\n';
    if (!resource->content_type.empty()) {
        std::cout << "Content-Type: " << resource->content_type << '\n';
    }

    if (auto url = Url::parse(args.url)) {
        std::cout << "Filename: " << default_output_name(*url, resource->filename) << '\n';
    }
    std::cout << std::flush;
    return exit_code::ok;
}

int exit_code_for(ErrorClass kind) noexcept {
    switch (kind) {
        case ErrorClass::none:       return exit_code::ok;
        case ErrorClass::network:    return exit_code::network;
        case ErrorClass::integrity:  return exit_code::integrity;
        case ErrorClass::disk:       return exit_code::disk;
        case ErrorClass::usage:      return exit_code::usage;
        case ErrorClass::cancelled:  return exit_code::cancelled;
    }
    return exit_code::integrity;
}

void install_signal_handlers() noexcept {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

bool interrupted() noexcept {
    return g_interrupted.load(std::memory_order_relaxed);
}

void print_help(std::string_view program_name) {
    std::cout << "volley " << version.to_string() << " - concurrent range downloader\n"
              << "\n"
              << "USAGE:\n"
              << "  " << program_name << " [OPTIONS] <URL>\n"
              << "\n"
              << "OPTIONS:\n"
              << "  -o, --output <FILE>       Save to FILE (default: name from server or URL)\n"
              << "  -n, --concurrency <N>     Parallel chunk fetches (default: " << DEFAULT_CONCURRENCY << ")\n"
              << "  -r, --retries <N>         Attempts per chunk (default: " << DEFAULT_MAX_RETRIES << ")\n"
              << "      --base-delay <SEC>    First retry delay (default: 0.5)\n"
              << "      --max-delay <SEC>     Retry delay cap (default: 30)\n"
              << "      --timeout <SEC>       Connect and stall timeout (default: " << DEFAULT_TIMEOUT.count() << ")\n"
              << "      --jitter <F>          Random reduction of retry delays, 0..1 (default: 0)\n"
              << std::format("  -c, --chunk-size <BYTES>  Fixed chunk size instead of N equal parts (e.g. {})\n", SUGGESTED_CHUNK_SIZE)
              << "      --part-files          Fetch chunks into separate files, join at the end\n"
              << "      --config <FILE>       JSON config file; options above override it\n"
              << "  -i, --info                Show size and range support without downloading\n"
              << "  -V, --verbose             Debug logging\n"
              << "  -q, --quiet               Errors only, no progress bar\n"
              << "      --log-level <LEVEL>   trace, debug, info, warn, error, critical, off\n"
              << "  -h, --help                Show this help message\n"
              << "  -v, --version             Show version information\n"
              << "\n"
              << "EXIT CODES:\n"
              << "  0 success, 1 network/server, 2 integrity, 3 disk, 4 usage, 130 cancelled\n"
              << "\n"
              << "EXAMPLES:\n"
              << "  " << program_name << " https://example.com/file.iso\n"
              << "  " << program_name << " -n 16 -o big.iso https://example.com/file.iso\n";
}

void print_version() {
    std::cout << "volley " << version.to_string() << '\n'
              << "Built with C++23, " << curl_version() << '\n';
}

} // namespace volley::cli
