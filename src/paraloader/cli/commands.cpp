// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/cli/commands.hpp>
#include <paraloader/cli/progress_bar.hpp>
#include <paraloader/core/chunk.hpp>
#include <paraloader/core/download_engine.hpp>
#include <paraloader/core/error.hpp>
#include <paraloader/core/http_transport.hpp>
#include <paraloader/core/settings.hpp>
#include <paraloader/version.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

using namespace paraloader::core;

namespace chrono = std::chrono;

namespace paraloader::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

// Parse a non-negative decimal; nullopt on garbage or overflow
std::optional<std::uint64_t> parse_number(const char* text) noexcept {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const auto value = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(value);
}

// Settings file plus command line overrides
Settings effective_settings(const CliArgs& args) noexcept {
    Settings settings = Settings::load_or_create(args.config_path);
    if (args.connections) {
        settings.default_connections = *args.connections;
    }
    if (args.chunk_size) {
        settings.chunk_size = *args.chunk_size;
    }
    if (args.fixed_chunks) {
        settings.balanced_chunks = false;
    }
    return settings;
}

} // namespace

void request_stop() noexcept {
    g_stop_requested = 1;
}

bool stop_requested() noexcept {
    return g_stop_requested != 0;
}

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;
    std::uint32_t positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

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
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-i" || arg == "--info") {
            args.info_only = true;
            continue;
        }
        if (arg == "--fixed-chunks") {
            args.fixed_chunks = true;
            continue;
        }
        if (arg == "-c" || arg == "--connections" ||
            arg == "-s" || arg == "--chunk-size" ||
            arg == "--config") {
            if (i + 1 >= argc) {
                args.error = "Missing value for " + arg;
                return args;
            }
            const char* value = argv[++i];

            if (arg == "--config") {
                args.config_path = value;
                continue;
            }

            auto number = parse_number(value);
            if (!number) {
                args.error = "Invalid number for " + arg + ": " + value;
                return args;
            }
            if (arg == "-c" || arg == "--connections") {
                if (*number > UINT32_MAX) {
                    args.error = "Invalid number for " + arg + ": " + value;
                    return args;
                }
                args.connections = static_cast<std::uint32_t>(*number);
            } else {
                args.chunk_size = *number;
            }
            continue;
        }
        if (arg.size() > 1 && arg.starts_with("-")) {
            args.error = "Unknown option: " + arg;
            return args;
        }

        // Positional: URL, then output path
        if (positional == 0) {
            args.url = arg;
        } else if (positional == 1) {
            args.output = arg;
        } else {
            args.error = "Unexpected argument: " + arg;
            return args;
        }
        ++positional;
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        // Outlive the engine: its reporting thread draws them
        ProgressBar bar(0, "Downloading");
        Spinner spinner;

        const auto settings = effective_settings(args);
        auto transport = std::make_shared<HttpTransport>(settings.to_http_options());
        auto engine = std::make_unique<DownloadEngine>(transport);

        auto result = engine->set_url(args.url);
        if (!result) {
            std::cerr << "Error: Invalid URL: " << args.url << std::endl;
            return std::unexpected(result.error());
        }

        engine->output_path(args.output);

        auto options = settings.to_options();
        // Redraw often enough for a smooth bar
        options.report_interval = chrono::milliseconds(250);
        engine->options(options);

        // Progress display runs on the engine's reporting thread
        if (!args.quiet) {
            engine->callback([&bar, &spinner](const DownloadReport& r) {
                if (DownloadEngine::is_terminal(r.state)) {
                    return;
                }
                if (r.total_bytes > 0) {
                    bar.total(r.total_bytes);
                    bar.chunks(r.completed_chunks, r.total_chunks);
                    bar.update(r.downloaded_bytes, static_cast<std::uint64_t>(r.average_speed_bps));
                } else if (r.state == DownloadState::dispatching) {
                    spinner.update(r.downloaded_bytes);
                }
            });
        }

        if (auto ec = engine->start()) {
            std::cerr << "Error: Failed to start download: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }

        // Poll for completion; a signal turns into a stop request
        bool stopping = false;
        while (!DownloadEngine::is_terminal(engine->state())) {
            if (stop_requested() && !stopping) {
                stopping = true;
                engine->stop();
            }
            std::this_thread::sleep_for(chrono::milliseconds(100));
        }

        // Joins the reporting thread, so nothing draws after this
        auto outcome = engine->wait();
        const auto report = engine->report();

        if (!args.quiet) {
            if (outcome && report.total_bytes > 0) {
                bar.finish();
            } else if (outcome) {
                spinner.finish();
            } else {
                bar.clear();
            }
        }

        if (!outcome) {
            if (outcome.error() == make_error_code(DownloadErrc::cancelled)) {
                std::cerr << "Download stopped" << std::endl;
                return STOPPED_EXIT_CODE;
            }
            std::cerr << "Error: Download failed: " << outcome.error().message() << std::endl;
            return std::unexpected(outcome.error());
        }

        if (!args.quiet) {
            std::cout << "Saved " << outcome->path << " (" << format_bytes(outcome->size) << ", "
                      << to_string(report.mode) << ")" << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Download aborted: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

CliResult info(const CliArgs& args) noexcept {
    try {
        auto url = validate_url(args.url);
        if (!url) {
            std::cerr << "Error: Invalid URL: " << args.url << std::endl;
            return std::unexpected(url.error());
        }

        const auto settings = effective_settings(args);
        HttpTransport transport(settings.to_http_options());
        auto response = transport.head(url->str());
        if (!response) {
            std::cerr << "Error: " << response.error().message() << std::endl;
            return std::unexpected(response.error());
        }

        std::cout << "URL: " << url->str() << std::endl;
        std::cout << "Status: " << response->status_code << std::endl;
        std::cout << "Content-Type: " << response->content_type << std::endl;
        std::cout << "Content-Length: "
                  << (response->content_length ? std::to_string(*response->content_length) : "unknown")
                  << std::endl;
        std::cout << "Accept-Ranges: " << (response->accepts_ranges ? "bytes" : "none") << std::endl;

        const auto size = response->content_length.value_or(0);
        if (size == 0 || !response->accepts_ranges) {
            std::cout << "Mode: single stream" << std::endl;
            return 0;
        }

        const auto options = settings.to_options();
        const auto hint = effective_chunk_size(options.chunk_policy, size,
                                               options.chunk_size, options.connections);
        const auto chunks = partition(size, hint, options.connections);
        std::cout << "Mode: parallel, " << chunks.size() << " chunks over "
                  << options.connections << " connections" << std::endl;
        if (args.verbose) {
            for (const auto& c : chunks) {
                std::cout << "  chunk " << c.index << ": bytes " << c.start << "-" << c.end
                          << " (" << format_bytes(c.size()) << ")" << std::endl;
            }
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Info aborted: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "paraloader " << program_name << " - Parallel chunked HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL> <OUTPUT>\n";
    std::cout << "  " << program_name << " --info <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n";
    std::cout << "  -V, --verbose             Enable debug logging\n";
    std::cout << "  -q, --quiet               Warnings only, no progress bar\n";
    std::cout << "  -c, --connections <N>     Parallel connections, "
              << MIN_CONNECTIONS << "-" << MAX_CONNECTIONS
              << " (default: " << DEFAULT_CONNECTIONS << ")\n";
    std::cout << "  -s, --chunk-size <BYTES>  Chunk size hint (default: " << DEFAULT_CHUNK_SIZE << ")\n";
    std::cout << "      --fixed-chunks        Use the chunk size as is instead of one share per connection\n";
    std::cout << "      --config <FILE>       Settings file (default: " << DEFAULT_CONFIG_FILE << ")\n";
    std::cout << "  -i, --info                Show file info without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip file.zip\n";
    std::cout << "  " << program_name << " -c 8 https://example.com/large.iso downloads/large.iso\n";
    std::cout << "  " << program_name << " -i https://example.com/file.zip\n";
}

void print_version() noexcept {
    std::cout << "paraloader " << paraloader::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with C++23, libcurl, spdlog\n";
}

} // namespace paraloader::cli
