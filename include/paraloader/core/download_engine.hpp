// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/chunk.hpp>
#include <paraloader/core/chunk_coordinator.hpp>
#include <paraloader/core/config.hpp>
#include <paraloader/core/error.hpp>
#include <paraloader/core/progress_tracker.hpp>
#include <paraloader/core/transport.hpp>
#include <paraloader/core/url.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace paraloader::core {

class WorkerPool;

// Session lifecycle
enum class DownloadState : std::uint8_t {
    init,        // Created, not started
    probing,     // Asking the server for size and range support
    dispatching, // Fetching (parallel chunks or one stream)
    merging,     // Concatenating chunk files
    completed,   // Output file is in place
    failed,      // Gave up; see error()
    stopped      // Stopped on request
};

enum class DownloadMode : std::uint8_t {
    undecided,     // Before the probe
    parallel,      // Ranged chunks + merge
    single_stream  // One unranged request straight to the output
};

// Session parameters
struct DownloadOptions {
    std::uint32_t connections{DEFAULT_CONNECTIONS};
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    ChunkSizePolicy chunk_policy{ChunkSizePolicy::balanced};
    std::uint32_t max_retries{MAX_RETRIES};
    std::chrono::milliseconds stall_threshold{std::chrono::seconds{STALL_TIMEOUT_SEC}};
    std::chrono::milliseconds poll_interval{DISPATCH_INTERVAL};
    std::chrono::milliseconds report_interval{REPORT_INTERVAL};
    std::chrono::milliseconds worker_poll_interval{WORKER_POLL_INTERVAL};
    std::size_t merge_buffer_size{MERGE_BUFFER_SIZE};
};

// What callers can poll at any time
struct DownloadReport {
    DownloadState state{DownloadState::init};
    DownloadMode mode{DownloadMode::undecided};
    double progress{0.0};               // 0..1, by chunk count
    double average_speed_bps{0.0};
    std::uint32_t completed_chunks{0};
    std::uint32_t failed_chunks{0};
    std::uint32_t total_chunks{0};
    std::uint64_t total_bytes{0};       // 0 when unknown
    std::uint64_t downloaded_bytes{0};
};

// Final outcome of a successful session
struct DownloadResult {
    std::string path;
    std::uint64_t size{0};
};

using ReportCallback = std::function<void(const DownloadReport&)>;

// Drives one download: probe, partition, dispatch chunk fetches to a worker
// pool, watch for completion and stalls, merge, clean up. One engine runs
// one session; terminal states are final.
class DownloadEngine {
public:
    explicit DownloadEngine(std::shared_ptr<Transport> transport);
    ~DownloadEngine();

    // Non-copyable, non-movable (threads capture this)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) = delete;
    DownloadEngine& operator=(DownloadEngine&&) = delete;

    // Configuration is read by the session threads: set it before start()

    // Set and validate the source URL
    [[nodiscard]] std::expected<void, std::error_code> set_url(std::string_view url_str) noexcept;
    [[nodiscard]] const Url& url() const noexcept { return url_; }

    void output_path(std::string path) noexcept { output_path_ = std::move(path); }
    [[nodiscard]] const std::string& output_path() const noexcept { return output_path_; }

    void options(const DownloadOptions& opts) noexcept { options_ = opts; }
    [[nodiscard]] const DownloadOptions& options() const noexcept { return options_; }

    // Progress callback, invoked from the reporting thread (thread-safe).
    // It may call back into the engine; wait() from it returns
    // resource_deadlock_would_occur.
    void callback(ReportCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    // Validate parameters and start the session thread. Validation errors
    // are returned before any network or filesystem activity.
    [[nodiscard]] std::error_code start() noexcept;

    // Request a stop. Queued chunk fetches are dropped, running ones finish,
    // then part files are removed. Does not block.
    void stop() noexcept;

    // Block until the session ends
    [[nodiscard]] std::expected<DownloadResult, std::error_code> wait() noexcept;

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] DownloadMode mode() const noexcept { return mode_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_.load(std::memory_order_acquire); }
    [[nodiscard]] std::error_code error() const noexcept;

    // Thread-safe snapshot of the reporting surface
    [[nodiscard]] DownloadReport report() const noexcept;

    [[nodiscard]] static bool is_terminal(DownloadState state) noexcept;

private:
    [[nodiscard]] std::error_code validate() const noexcept;

    // Session thread body
    void run(std::stop_token stoken) noexcept;
    void run_parallel(std::stop_token stoken, std::uint64_t total_size) noexcept;
    void run_single_stream(std::stop_token stoken, std::optional<std::uint64_t> expected_size) noexcept;

    // Claim every pending chunk and hand it to the pool
    void dispatch_pending(ChunkCoordinator& coordinator, WorkerPool& pool);

    // Worker task: fetch one chunk into its part file and report the outcome
    void fetch_chunk(ChunkCoordinator& coordinator, const ChunkClaim& claim) noexcept;

    // Report a failed attempt to the aggregator and the coordinator
    void chunk_failed(ChunkCoordinator& coordinator, const ChunkClaim& claim) noexcept;

    void handle_stall(const ChunkCoordinator& coordinator) noexcept;
    void merge_chunks(std::uint32_t chunk_count, std::uint64_t total_size) noexcept;
    void cleanup_parts(std::uint32_t chunk_count) const noexcept;

    // Reporting thread body
    void report_loop(std::stop_token stoken) noexcept;
    void emit_report() noexcept;

    // Move to a non-terminal state; ignored once terminal
    // False once the session is terminal
    bool transition(DownloadState next) noexcept;
    // Enter a terminal state once
    void finish(DownloadState terminal, std::error_code ec = {}) noexcept;

    // Sleep that returns early on stop
    void pause_for(std::stop_token stoken, std::chrono::milliseconds duration) noexcept;

    std::shared_ptr<Transport> transport_;
    Url url_;
    std::string output_path_;
    DownloadOptions options_;

    std::atomic<DownloadState> state_{DownloadState::init};
    std::atomic<DownloadMode> mode_{DownloadMode::undecided};
    std::atomic<std::uint64_t> total_size_{0};
    std::error_code error_;
    mutable std::mutex state_mutex_;  // Serializes state changes and error_

    ProgressTracker progress_;

    ReportCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access

    std::stop_source stop_source_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_;

    std::jthread download_thread_;
    std::jthread report_thread_;
    std::atomic<std::thread::id> report_thread_id_{};
    std::mutex join_mutex_;  // Serializes wait() callers
};

[[nodiscard]] const char* to_string(DownloadState state) noexcept;
[[nodiscard]] const char* to_string(DownloadMode mode) noexcept;

} // namespace paraloader::core
