// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/validation.hpp>
#include <paraloader/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <string>

namespace paraloader::core {

namespace {

constexpr std::string_view INVALID_FILENAME_CHARS = "<>:\"/\\|?*";

constexpr std::array<std::string_view, 22> RESERVED_NAMES = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

} // namespace

bool validate_connections(std::uint32_t connections) noexcept {
    return connections >= MIN_CONNECTIONS && connections <= MAX_CONNECTIONS;
}

bool validate_chunk_size(std::uint64_t chunk_size) noexcept {
    return chunk_size >= MIN_CHUNK_SIZE && chunk_size <= MAX_CHUNK_SIZE;
}

bool validate_max_retries(std::uint32_t max_retries) noexcept {
    return max_retries <= MAX_RETRY_LIMIT;
}

bool is_valid_filename(std::string_view filename) noexcept {
    const bool blank = std::all_of(filename.begin(), filename.end(),
                                   [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
    if (filename.empty() || blank) {
        return false;
    }

    if (filename.find_first_of(INVALID_FILENAME_CHARS) != std::string_view::npos) {
        return false;
    }

    if (filename == "." || filename == "..") {
        return false;
    }

    // Reserved device names, with or without an extension
    auto stem = filename.substr(0, filename.find('.'));
    std::string upper;
    upper.reserve(stem.size());
    for (char c : stem) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return std::find(RESERVED_NAMES.begin(), RESERVED_NAMES.end(), upper) == RESERVED_NAMES.end();
}

bool validate_output_path(std::string_view path) noexcept {
    if (path.empty()) {
        return false;
    }
    try {
        return is_valid_filename(std::filesystem::path(path).filename().string());
    } catch (const std::exception&) {
        return false;
    }
}

std::error_code ensure_parent_directory(std::string_view path) noexcept {
    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty() || std::filesystem::exists(parent, ec)) {
        return ec;
    }
    std::filesystem::create_directories(parent, ec);
    return ec;
}

} // namespace paraloader::core
