// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/chunk_coordinator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace paraloader::core {

ChunkCoordinator::ChunkCoordinator(std::vector<Chunk> chunks, std::uint32_t max_retries)
    : chunks_(std::move(chunks))
    , max_retries_(max_retries)
    , entries_(chunks_.size()) {}

std::optional<ChunkClaim> ChunkCoordinator::claim_next() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].state == ChunkState::pending) {
            entries_[i].state = ChunkState::claimed;
            const auto& chunk = chunks_[i];
            return ChunkClaim{chunk.index, chunk.start, chunk.end, std::chrono::steady_clock::now()};
        }
    }
    return std::nullopt;
}

void ChunkCoordinator::mark_completed(std::uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= entries_.size()) return;

    auto& entry = entries_[index];
    if (entry.state == ChunkState::completed) {
        return;
    }
    if (entry.state != ChunkState::claimed) {
        spdlog::warn("Chunk {} reported complete while {}", index, to_string(entry.state));
        return;
    }
    entry.state = ChunkState::completed;
}

void ChunkCoordinator::mark_failed(std::uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= entries_.size()) return;

    auto& entry = entries_[index];
    if (entry.state != ChunkState::claimed) {
        spdlog::warn("Chunk {} reported failed while {}", index, to_string(entry.state));
        return;
    }

    ++entry.retries;
    if (entry.retries <= max_retries_) {
        entry.state = ChunkState::pending;
        spdlog::debug("Chunk {} will be retried ({}/{})", index, entry.retries, max_retries_);
    } else {
        entry.state = ChunkState::failed_permanently;
        spdlog::error("Chunk {} failed after {} retries", index, max_retries_);
    }
}

void ChunkCoordinator::release(std::uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= entries_.size()) return;

    if (entries_[index].state == ChunkState::claimed) {
        entries_[index].state = ChunkState::pending;
    }
}

bool ChunkCoordinator::all_done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::all_of(entries_.begin(), entries_.end(),
                       [](const Entry& e) { return e.state == ChunkState::completed; });
}

bool ChunkCoordinator::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    bool any_failed = false;
    for (const auto& e : entries_) {
        if (e.state == ChunkState::pending || e.state == ChunkState::claimed) {
            return false;
        }
        if (e.state == ChunkState::failed_permanently) {
            any_failed = true;
        }
    }
    return any_failed;
}

double ChunkCoordinator::progress_fraction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return 0.0;
    }
    auto completed = std::count_if(entries_.begin(), entries_.end(),
                                   [](const Entry& e) { return e.state == ChunkState::completed; });
    return static_cast<double>(completed) / static_cast<double>(entries_.size());
}

ChunkState ChunkCoordinator::state(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < entries_.size() ? entries_[index].state : ChunkState::failed_permanently;
}

std::uint32_t ChunkCoordinator::retries(std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < entries_.size() ? entries_[index].retries : 0;
}

ChunkCounts ChunkCoordinator::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkCounts counts;
    for (const auto& e : entries_) {
        switch (e.state) {
            case ChunkState::pending:            ++counts.pending; break;
            case ChunkState::claimed:            ++counts.claimed; break;
            case ChunkState::completed:          ++counts.completed; break;
            case ChunkState::failed_permanently: ++counts.failed_permanently; break;
        }
    }
    return counts;
}

std::vector<std::uint32_t> ChunkCoordinator::claimed_indices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> result;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].state == ChunkState::claimed) {
            result.push_back(static_cast<std::uint32_t>(i));
        }
    }
    return result;
}

const char* to_string(ChunkState state) noexcept {
    switch (state) {
        case ChunkState::pending:            return "pending";
        case ChunkState::claimed:            return "claimed";
        case ChunkState::completed:          return "completed";
        case ChunkState::failed_permanently: return "failed permanently";
    }
    return "unknown";
}

} // namespace paraloader::core
