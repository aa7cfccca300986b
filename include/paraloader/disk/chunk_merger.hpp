// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/config.hpp>
#include <paraloader/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paraloader::disk {

// Concatenates "<output>.part<N>" files into the final output
class ChunkMerger {
public:
    explicit ChunkMerger(std::size_t buffer_size = core::MERGE_BUFFER_SIZE) noexcept;

    // Merge chunk files in index order (parsed from the .part suffix, not the
    // order given). Missing or empty files are skipped with a warning; if none
    // is usable nothing is written. Output is built in "<output>.tmp" and
    // renamed over the destination, which is left untouched on failure.
    // With expected_size, a merged file of any other size is discarded
    // before the rename and size_mismatch returned.
    [[nodiscard]] std::error_code merge(const std::vector<std::string>& chunk_paths,
                                        std::string_view output_path,
                                        std::optional<std::uint64_t> expected_size = std::nullopt) const noexcept;

    // Merged file exists with exactly expected bytes
    [[nodiscard]] static std::error_code verify_size(std::string_view path,
                                                     std::uint64_t expected) noexcept;

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_size_; }

private:
    [[nodiscard]] std::error_code append_file(const std::string& chunk_path,
                                              std::ofstream& output,
                                              std::vector<char>& buffer) const noexcept;

    std::size_t buffer_size_;
};

// Temp file used while merging into output_path
[[nodiscard]] std::string temp_path(std::string_view output_path);

} // namespace paraloader::disk
