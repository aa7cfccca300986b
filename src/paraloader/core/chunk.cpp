// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/chunk.hpp>
#include <paraloader/core/config.hpp>
#include <algorithm>
#include <charconv>

namespace paraloader::core {

std::vector<Chunk> partition(std::uint64_t total_size,
                             std::uint64_t chunk_size_hint,
                             std::uint32_t connection_count) noexcept {
    std::vector<Chunk> chunks;
    if (total_size == 0 || chunk_size_hint == 0 || connection_count == 0) {
        return chunks;
    }

    chunks.reserve(connection_count);
    for (std::uint32_t i = 0; i < connection_count; ++i) {
        // i * hint >= total_size, checked without overflowing
        if (i > 0 && chunk_size_hint > (total_size - 1) / i) {
            break;
        }
        std::uint64_t start = static_cast<std::uint64_t>(i) * chunk_size_hint;
        std::uint64_t end = start + std::min(chunk_size_hint - 1, total_size - 1 - start);

        // Last chunk absorbs the remainder
        if (i == connection_count - 1) {
            end = total_size - 1;
        }

        chunks.push_back(Chunk{i, start, end});
    }

    // Fewer chunks than connections fit: the final one must still reach the end
    if (!chunks.empty()) {
        chunks.back().end = total_size - 1;
    }

    return chunks;
}

std::uint64_t effective_chunk_size(ChunkSizePolicy policy,
                                   std::uint64_t total_size,
                                   std::uint64_t chunk_size_hint,
                                   std::uint32_t connection_count) noexcept {
    if (policy == ChunkSizePolicy::fixed || connection_count == 0) {
        return chunk_size_hint;
    }
    std::uint64_t share = (total_size + connection_count - 1) / connection_count;
    return std::max(chunk_size_hint, share);
}

std::string part_path(std::string_view output_path, std::uint32_t index) {
    std::string path(output_path);
    path += PART_SUFFIX;
    path += std::to_string(index);
    return path;
}

std::optional<std::uint32_t> parse_part_index(std::string_view path) noexcept {
    auto pos = path.rfind(PART_SUFFIX);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    auto digits = path.substr(pos + std::string_view(PART_SUFFIX).size());
    if (digits.empty()) {
        return std::nullopt;
    }

    std::uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return index;
}

} // namespace paraloader::core
