// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/disk/chunk_merger.hpp>
#include <paraloader/core/chunk.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace paraloader::disk {

namespace {

bool is_usable_chunk(const std::string& path) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

void remove_quietly(const std::string& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", path, ec.message());
    }
}

} // namespace

std::string temp_path(std::string_view output_path) {
    std::string path(output_path);
    path += core::TEMP_SUFFIX;
    return path;
}

ChunkMerger::ChunkMerger(std::size_t buffer_size) noexcept
    : buffer_size_(buffer_size == 0 ? core::MERGE_BUFFER_SIZE : buffer_size) {}

std::error_code ChunkMerger::merge(const std::vector<std::string>& chunk_paths,
                                   std::string_view output_path,
                                   std::optional<std::uint64_t> expected_size) const noexcept {
    try {
        spdlog::info("Merging {} chunks into {}", chunk_paths.size(), output_path);

        // (index, path) for every usable chunk file
        std::vector<std::pair<std::uint32_t, std::string>> valid;
        valid.reserve(chunk_paths.size());
        for (const auto& path : chunk_paths) {
            if (!is_usable_chunk(path)) {
                spdlog::warn("Chunk file missing or empty: {}", path);
                continue;
            }
            auto index = core::parse_part_index(path);
            if (!index) {
                spdlog::warn("Could not parse chunk number from {}, using 0", path);
            }
            valid.emplace_back(index.value_or(0), path);
        }

        if (valid.empty()) {
            spdlog::error("No valid chunk files to merge");
            return make_error_code(DiskErrc::no_valid_chunks);
        }

        std::stable_sort(valid.begin(), valid.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        const std::string tmp = temp_path(output_path);
        {
            std::ofstream output(tmp, std::ios::binary | std::ios::trunc);
            if (!output) {
                spdlog::error("Cannot create {}", tmp);
                return make_error_code(DiskErrc::write_error);
            }

            std::vector<char> buffer(buffer_size_);
            for (const auto& [index, path] : valid) {
                spdlog::debug("Merging chunk {}: {}", index, path);
                if (auto ec = append_file(path, output, buffer)) {
                    output.close();
                    remove_quietly(tmp);
                    return ec;
                }
            }

            output.flush();
            if (!output) {
                output.close();
                remove_quietly(tmp);
                return make_error_code(DiskErrc::write_error);
            }
        }

        if (expected_size) {
            if (auto ec = verify_size(tmp, *expected_size)) {
                remove_quietly(tmp);
                return ec;
            }
        }

        std::error_code ec;
        fs::rename(tmp, fs::path(output_path), ec);
        if (ec) {
            spdlog::error("Failed to move {} to {}: {}", tmp, output_path, ec.message());
            remove_quietly(tmp);
            return make_error_code(DiskErrc::rename_failed);
        }

        spdlog::info("Successfully created merged file: {}", output_path);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("File merging failed: {}", e.what());
        remove_quietly(temp_path(output_path));
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code ChunkMerger::append_file(const std::string& chunk_path,
                                         std::ofstream& output,
                                         std::vector<char>& buffer) const noexcept {
    std::ifstream input(chunk_path, std::ios::binary);
    if (!input) {
        spdlog::error("Failed to open chunk {}", chunk_path);
        return make_error_code(DiskErrc::read_error);
    }

    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = input.gcount();
        if (got > 0) {
            output.write(buffer.data(), got);
            if (!output) {
                spdlog::error("Write failed while merging {}", chunk_path);
                return make_error_code(DiskErrc::write_error);
            }
        }
    }

    if (input.bad()) {
        spdlog::error("Read failed while merging {}", chunk_path);
        return make_error_code(DiskErrc::read_error);
    }
    return {};
}

std::error_code ChunkMerger::verify_size(std::string_view path, std::uint64_t expected) noexcept {
    std::error_code ec;
    const fs::path p(path);
    if (!fs::exists(p, ec)) {
        return make_error_code(DiskErrc::file_not_found);
    }
    auto actual = fs::file_size(p, ec);
    if (ec) {
        return make_error_code(DiskErrc::read_error);
    }
    if (actual != expected) {
        spdlog::warn("File size mismatch. Expected: {}, Got: {}", expected, actual);
        return make_error_code(DiskErrc::size_mismatch);
    }
    return {};
}

} // namespace paraloader::disk
