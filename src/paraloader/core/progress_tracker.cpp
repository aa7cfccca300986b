// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/progress_tracker.hpp>

namespace paraloader::core {

ProgressTracker::ProgressTracker()
    : last_progress_(Clock::now()) {}

void ProgressTracker::start(std::uint32_t total_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_chunks_ = total_chunks;
    completed_.clear();
    failed_.clear();
    chunk_speeds_.clear();
    chunk_bytes_.clear();
    last_progress_ = Clock::now();
}

void ProgressTracker::record(std::uint32_t index, bool success, std::uint64_t bytes,
                             std::chrono::duration<double> elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_progress_ = Clock::now();

    if (success) {
        completed_.insert(index);
        failed_.erase(index);
        // Assign, not add: a duplicate success must not count twice
        chunk_bytes_[index] = bytes;
        if (elapsed.count() > 0.0) {
            chunk_speeds_[index] = static_cast<double>(bytes) / elapsed.count();
        }
    } else {
        failed_.insert(index);
        completed_.erase(index);
        // The attempt's partial bytes are discarded with its part file
        chunk_bytes_[index] = 0;
    }
}

void ProgressTracker::add_bytes(std::uint32_t index, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunk_bytes_[index] += bytes;
    last_progress_ = Clock::now();
}

void ProgressTracker::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_progress_ = Clock::now();
}

double ProgressTracker::overall_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overall_progress_locked();
}

double ProgressTracker::average_throughput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return average_throughput_locked();
}

std::uint32_t ProgressTracker::failed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::uint32_t>(failed_.size());
}

std::uint32_t ProgressTracker::completed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::uint32_t>(completed_.size());
}

std::uint64_t ProgressTracker::downloaded_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return downloaded_bytes_locked();
}

ProgressTracker::Clock::duration ProgressTracker::idle_for() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Clock::now() - last_progress_;
}

ProgressSnapshot ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressSnapshot snap;
    snap.total_chunks = total_chunks_;
    snap.completed_chunks = static_cast<std::uint32_t>(completed_.size());
    snap.failed_chunks = static_cast<std::uint32_t>(failed_.size());
    snap.downloaded_bytes = downloaded_bytes_locked();
    snap.overall_progress = overall_progress_locked();
    snap.average_throughput = average_throughput_locked();
    snap.last_progress = last_progress_;
    return snap;
}

double ProgressTracker::overall_progress_locked() const noexcept {
    if (total_chunks_ == 0) {
        return 0.0;
    }
    return static_cast<double>(completed_.size()) / static_cast<double>(total_chunks_);
}

double ProgressTracker::average_throughput_locked() const noexcept {
    if (chunk_speeds_.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& [index, speed] : chunk_speeds_) {
        sum += speed;
    }
    return sum / static_cast<double>(chunk_speeds_.size());
}

std::uint64_t ProgressTracker::downloaded_bytes_locked() const noexcept {
    std::uint64_t total = 0;
    for (const auto& [index, bytes] : chunk_bytes_) {
        total += bytes;
    }
    return total;
}

} // namespace paraloader::core
