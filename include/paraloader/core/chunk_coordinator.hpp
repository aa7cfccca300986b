// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/chunk.hpp>
#include <paraloader/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace paraloader::core {

// Chunk state machine
enum class ChunkState : std::uint8_t {
    pending,            // Waiting to be claimed
    claimed,            // Owned by exactly one worker
    completed,          // Fetched and verified
    failed_permanently  // Retry budget exhausted
};

// What claim_next() hands to a worker
struct ChunkClaim {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::chrono::steady_clock::time_point claimed_at;

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start + 1; }
};

// Per-state tallies
struct ChunkCounts {
    std::uint32_t pending{0};
    std::uint32_t claimed{0};
    std::uint32_t completed{0};
    std::uint32_t failed_permanently{0};
};

// Thread-safe registry of chunk state and retry accounting. The only place
// chunk state changes; every operation runs under one mutex.
class ChunkCoordinator {
public:
    explicit ChunkCoordinator(std::vector<Chunk> chunks,
                              std::uint32_t max_retries = MAX_RETRIES);

    ChunkCoordinator(const ChunkCoordinator&) = delete;
    ChunkCoordinator& operator=(const ChunkCoordinator&) = delete;

    // Claim the first pending chunk. nullopt means "nothing to do right now";
    // a later retryable failure may put work back.
    [[nodiscard]] std::optional<ChunkClaim> claim_next();

    // claimed -> completed. Repeated calls are no-ops.
    void mark_completed(std::uint32_t index);

    // Count a failed attempt: back to pending while retries remain,
    // otherwise failed_permanently.
    void mark_failed(std::uint32_t index);

    // claimed -> pending without charging a retry (claim could not be dispatched)
    void release(std::uint32_t index);

    [[nodiscard]] bool all_done() const;

    // Some chunk failed for good and nothing is left in flight or waiting
    [[nodiscard]] bool exhausted() const;

    // completed / total, by chunk count
    [[nodiscard]] double progress_fraction() const;

    [[nodiscard]] ChunkState state(std::uint32_t index) const;
    [[nodiscard]] std::uint32_t retries(std::uint32_t index) const;
    [[nodiscard]] ChunkCounts counts() const;
    [[nodiscard]] std::vector<std::uint32_t> claimed_indices() const;

    [[nodiscard]] std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(chunks_.size()); }
    [[nodiscard]] std::uint32_t max_retries() const noexcept { return max_retries_; }
    [[nodiscard]] const std::vector<Chunk>& chunks() const noexcept { return chunks_; }

private:
    struct Entry {
        ChunkState state{ChunkState::pending};
        std::uint32_t retries{0};
    };

    const std::vector<Chunk> chunks_;
    const std::uint32_t max_retries_;
    std::vector<Entry> entries_;
    mutable std::mutex mutex_;
};

[[nodiscard]] const char* to_string(ChunkState state) noexcept;

} // namespace paraloader::core
