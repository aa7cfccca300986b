// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace paraloader::cli {

// CLI result: process exit code, or the error that ended the command
using CliResult = std::expected<int, std::error_code>;

// Exit code when the user stopped the download (128 + SIGINT)
constexpr int STOPPED_EXIT_CODE = 130;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output;
    std::optional<std::uint32_t> connections;
    std::optional<std::uint64_t> chunk_size;
    bool fixed_chunks{false};
    std::string config_path{core::DEFAULT_CONFIG_FILE};
    bool info_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // Set when the command line could not be parsed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Download args.url to args.output
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Probe a URL and print what a download would do
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

// Async-signal-safe stop request, polled by download()
void request_stop() noexcept;
[[nodiscard]] bool stop_requested() noexcept;

} // namespace paraloader::cli
