// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paraloader::core {

// A contiguous byte range [start, end] of the remote resource
struct Chunk {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};  // Inclusive

    [[nodiscard]] constexpr std::uint64_t size() const noexcept { return end - start + 1; }

    constexpr bool operator==(const Chunk&) const = default;
};

// How the engine picks the hint passed to partition()
enum class ChunkSizePolicy : std::uint8_t {
    fixed,    // Use the configured chunk size; last chunk takes the remainder
    balanced  // Equal shares per connection, configured size as a minimum
};

// Split [0, total_size) into at most connection_count chunks of chunk_size_hint
// bytes. Chunk ends are clamped to total_size - 1 and the last chunk always
// runs to the end of the resource. Empty when any input is zero.
[[nodiscard]] std::vector<Chunk> partition(std::uint64_t total_size,
                                           std::uint64_t chunk_size_hint,
                                           std::uint32_t connection_count) noexcept;

// Hint to hand to partition() for the given policy
[[nodiscard]] std::uint64_t effective_chunk_size(ChunkSizePolicy policy,
                                                 std::uint64_t total_size,
                                                 std::uint64_t chunk_size_hint,
                                                 std::uint32_t connection_count) noexcept;

// "<output>.part<index>"
[[nodiscard]] std::string part_path(std::string_view output_path, std::uint32_t index);

// Index encoded in a part file name, nullopt if the suffix is not a number
[[nodiscard]] std::optional<std::uint32_t> parse_part_index(std::string_view path) noexcept;

} // namespace paraloader::core
