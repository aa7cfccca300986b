// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>

namespace paraloader::core {

// Point-in-time copy of the aggregated counters
struct ProgressSnapshot {
    std::uint32_t total_chunks{0};
    std::uint32_t completed_chunks{0};
    std::uint32_t failed_chunks{0};
    std::uint64_t downloaded_bytes{0};
    double overall_progress{0.0};      // 0..1, by chunk count
    double average_throughput{0.0};    // bytes per second
    std::chrono::steady_clock::time_point last_progress;
};

// Shared, thread-safe progress counters fed by chunk fetches.
//
// Progress is counted in chunks, not bytes: every chunk weighs the same
// regardless of its length, so the fraction is only as smooth as the chunks
// are even. Throughput is the plain mean of each chunk's bytes / seconds.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker();

    // Forget everything and expect total_chunks chunks
    void start(std::uint32_t total_chunks);

    // Outcome of one fetch attempt. elapsed runs from claim to completion.
    void record(std::uint32_t index, bool success, std::uint64_t bytes,
                std::chrono::duration<double> elapsed);

    // Streaming byte count for a chunk that is still being fetched
    void add_bytes(std::uint32_t index, std::uint64_t bytes);

    // Push the last-progress timestamp to now without recording anything
    void touch();

    [[nodiscard]] double overall_progress() const;
    [[nodiscard]] double average_throughput() const;
    [[nodiscard]] std::uint32_t failed_count() const;
    [[nodiscard]] std::uint32_t completed_count() const;
    [[nodiscard]] std::uint64_t downloaded_bytes() const;
    [[nodiscard]] Clock::duration idle_for() const;
    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    [[nodiscard]] double overall_progress_locked() const noexcept;
    [[nodiscard]] double average_throughput_locked() const noexcept;
    [[nodiscard]] std::uint64_t downloaded_bytes_locked() const noexcept;

    std::uint32_t total_chunks_{0};
    std::set<std::uint32_t> completed_;
    std::set<std::uint32_t> failed_;
    std::map<std::uint32_t, double> chunk_speeds_;     // bytes/s per chunk
    std::map<std::uint32_t, std::uint64_t> chunk_bytes_;
    Clock::time_point last_progress_;
    mutable std::mutex mutex_;
};

} // namespace paraloader::core
