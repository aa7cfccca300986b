// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/download_engine.hpp>
#include <paraloader/core/validation.hpp>
#include <paraloader/core/worker_pool.hpp>
#include <paraloader/disk/chunk_merger.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace paraloader::core {

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {}

DownloadEngine::~DownloadEngine() {
    // Session thread first: its workers still report into progress_
    stop_source_.request_stop();
    if (download_thread_.joinable()) {
        download_thread_.join();
    }
    if (report_thread_.joinable()) {
        report_thread_.join();
    }
}

std::expected<void, std::error_code> DownloadEngine::set_url(std::string_view url_str) noexcept {
    auto parsed = validate_url(url_str);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    url_ = std::move(*parsed);
    return {};
}

std::error_code DownloadEngine::validate() const noexcept {
    if (!transport_) {
        return make_error_code(DownloadErrc::network_error);
    }
    if (url_.str().empty() || !is_supported_url(url_)) {
        return make_error_code(DownloadErrc::invalid_url);
    }
    if (!validate_connections(options_.connections)) {
        return make_error_code(DownloadErrc::invalid_connections);
    }
    if (!validate_chunk_size(options_.chunk_size)) {
        return make_error_code(DownloadErrc::invalid_chunk_size);
    }
    if (!validate_output_path(output_path_)) {
        return make_error_code(DownloadErrc::invalid_output_path);
    }
    // Zero intervals would spin the loops or disable stall detection
    if (!validate_max_retries(options_.max_retries) ||
        options_.stall_threshold.count() <= 0 ||
        options_.poll_interval.count() <= 0 ||
        options_.report_interval.count() <= 0 ||
        options_.worker_poll_interval.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_option);
    }
    return {};
}

std::error_code DownloadEngine::start() noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);

    const auto current = state();
    if (current == DownloadState::stopped) {
        return make_error_code(DownloadErrc::cancelled);
    }
    if (current != DownloadState::init || download_thread_.joinable()) {
        return make_error_code(DownloadErrc::already_started);
    }

    // Nothing touches the network or the disk until this passes
    if (auto ec = validate()) {
        spdlog::error("Invalid download parameters: {}", ec.message());
        return ec;
    }
    if (auto ec = ensure_parent_directory(output_path_)) {
        spdlog::error("Cannot create directory for {}: {}", output_path_, ec.message());
        return ec;
    }

    try {
        // Reporter first so the session thread never sees an unassigned handle
        report_thread_ = std::jthread([this] {
            report_loop(stop_source_.get_token());
        });
        download_thread_ = std::jthread([this] {
            run(stop_source_.get_token());
        });
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start download threads: {}", e.what());
        stop_source_.request_stop();
        error_ = e.code();
        state_.store(DownloadState::failed, std::memory_order_release);
        return e.code();
    }

    spdlog::info("Downloading {} -> {}", url_.str(), output_path_);
    return {};
}

void DownloadEngine::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const auto current = state();
        // A merge is short and leaves either the old or the new file: let it finish
        if (is_terminal(current) || current == DownloadState::merging) {
            return;
        }
        error_ = make_error_code(DownloadErrc::cancelled);
        state_.store(DownloadState::stopped, std::memory_order_release);
    }

    spdlog::info("Stopping download of {}", url_.str());
    stop_source_.request_stop();
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
}

std::expected<DownloadResult, std::error_code> DownloadEngine::wait() noexcept {
    // From inside the progress callback: the reporter cannot join itself
    if (std::this_thread::get_id() == report_thread_id_.load(std::memory_order_acquire)) {
        return std::unexpected(std::make_error_code(std::errc::resource_deadlock_would_occur));
    }

    {
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (download_thread_.joinable()) {
            download_thread_.join();
        }
        if (report_thread_.joinable()) {
            report_thread_.join();
        }
    }

    switch (state()) {
        case DownloadState::completed: {
            std::error_code ec;
            auto size = std::filesystem::file_size(output_path_, ec);
            if (ec) {
                return std::unexpected(ec);
            }
            return DownloadResult{output_path_, size};
        }
        case DownloadState::failed:
        case DownloadState::stopped:
            return std::unexpected(error());
        default:
            // Never started
            return std::unexpected(std::make_error_code(std::errc::operation_not_permitted));
    }
}

std::error_code DownloadEngine::error() const noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return error_;
}

DownloadReport DownloadEngine::report() const noexcept {
    const auto snap = progress_.snapshot();

    DownloadReport r;
    r.state = state();
    r.mode = mode();
    r.progress = snap.overall_progress;
    r.average_speed_bps = snap.average_throughput;
    r.completed_chunks = snap.completed_chunks;
    r.failed_chunks = snap.failed_chunks;
    r.total_chunks = snap.total_chunks;
    r.total_bytes = total_size();
    r.downloaded_bytes = snap.downloaded_bytes;
    return r;
}

bool DownloadEngine::is_terminal(DownloadState state) noexcept {
    return state == DownloadState::completed ||
           state == DownloadState::failed ||
           state == DownloadState::stopped;
}

bool DownloadEngine::transition(DownloadState next) noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (is_terminal(state())) {
        return false;
    }
    state_.store(next, std::memory_order_release);
    return true;
}

void DownloadEngine::finish(DownloadState terminal, std::error_code ec) noexcept {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state())) {
            return;
        }
        error_ = ec;
        state_.store(terminal, std::memory_order_release);
    }

    if (terminal == DownloadState::completed) {
        spdlog::info("Download complete: {}", output_path_);
    } else if (terminal == DownloadState::failed) {
        spdlog::error("Download failed: {}", ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
}

void DownloadEngine::pause_for(std::stop_token stoken, std::chrono::milliseconds duration) noexcept {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    (void)wake_.wait_for(lock, stoken, duration, [] { return false; });
}

//=============================================================================
// Session
//=============================================================================

void DownloadEngine::run(std::stop_token stoken) noexcept {
    transition(DownloadState::probing);

    auto probe = transport_->probe(url_.str());
    if (stoken.stop_requested()) {
        finish(DownloadState::stopped, make_error_code(DownloadErrc::cancelled));
        return;
    }

    std::optional<std::uint64_t> size;
    bool range_supported = false;
    if (probe) {
        size = probe->size;
        range_supported = probe->range_supported;
    } else {
        spdlog::warn("Probe of {} failed: {}", url_.str(), probe.error().message());
    }
    if (size) {
        total_size_.store(*size, std::memory_order_release);
    }

    if (size && *size > 0 && range_supported) {
        mode_.store(DownloadMode::parallel, std::memory_order_release);
        transition(DownloadState::dispatching);
        run_parallel(stoken, *size);
    } else {
        spdlog::info("Size unknown or ranges unsupported, using a single stream");
        mode_.store(DownloadMode::single_stream, std::memory_order_release);
        transition(DownloadState::dispatching);
        run_single_stream(stoken, size);
    }
}

void DownloadEngine::run_parallel(std::stop_token stoken, std::uint64_t total_size) noexcept {
    enum class Outcome { done, exhausted, stopped };

    std::uint32_t chunk_count = 0;
    try {
        const auto hint = effective_chunk_size(options_.chunk_policy, total_size,
                                               options_.chunk_size, options_.connections);
        ChunkCoordinator coordinator(partition(total_size, hint, options_.connections),
                                     options_.max_retries);
        chunk_count = coordinator.size();
        progress_.start(chunk_count);

        spdlog::info("Downloading {} bytes in {} chunks over {} connections",
                     total_size, chunk_count, options_.connections);

        Outcome outcome = Outcome::stopped;
        {
            WorkerPool pool(options_.connections, "chunk", options_.worker_poll_interval);

            while (true) {
                if (stoken.stop_requested()) {
                    outcome = Outcome::stopped;
                    break;
                }
                if (coordinator.all_done()) {
                    outcome = Outcome::done;
                    break;
                }
                if (coordinator.exhausted()) {
                    outcome = Outcome::exhausted;
                    break;
                }
                if (progress_.idle_for() > options_.stall_threshold) {
                    handle_stall(coordinator);
                }
                dispatch_pending(coordinator, pool);
                pause_for(stoken, options_.poll_interval);
            }

            // Queued fetches are dropped; running ones finish before join returns
            pool.shutdown(outcome == Outcome::done);
            pool.join();
        }

        switch (outcome) {
            case Outcome::done:
                merge_chunks(chunk_count, total_size);
                break;
            case Outcome::exhausted: {
                const auto counts = coordinator.counts();
                spdlog::error("{} of {} chunks failed after {} retries",
                              counts.failed_permanently, chunk_count, options_.max_retries);
                cleanup_parts(chunk_count);
                finish(DownloadState::failed, make_error_code(DownloadErrc::chunk_failed));
                break;
            }
            case Outcome::stopped:
                cleanup_parts(chunk_count);
                finish(DownloadState::stopped, make_error_code(DownloadErrc::cancelled));
                break;
        }
    } catch (const std::system_error& e) {
        spdlog::error("Parallel download aborted: {}", e.what());
        cleanup_parts(chunk_count);
        finish(DownloadState::failed, e.code());
    } catch (const std::exception& e) {
        spdlog::error("Parallel download aborted: {}", e.what());
        cleanup_parts(chunk_count);
        finish(DownloadState::failed, std::make_error_code(std::errc::not_enough_memory));
    }
}

void DownloadEngine::run_single_stream(std::stop_token stoken,
                                       std::optional<std::uint64_t> expected_size) noexcept {
    progress_.start(1);

    const auto started = std::chrono::steady_clock::now();
    auto ec = transport_->fetch_range(url_.str(), 0, std::nullopt, output_path_,
        [this](std::uint64_t n) { progress_.add_bytes(0, n); });
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;

    std::uint64_t actual = 0;
    if (!ec) {
        std::error_code fs_ec;
        actual = std::filesystem::file_size(output_path_, fs_ec);
        if (fs_ec) {
            ec = make_error_code(DownloadErrc::write_failed);
        } else if (expected_size && *expected_size > 0 && actual != *expected_size) {
            spdlog::error("Size mismatch. Expected: {}, Got: {}", *expected_size, actual);
            ec = make_error_code(DownloadErrc::size_mismatch);
        }
    }

    progress_.record(0, !ec, actual, elapsed);

    if (ec || stoken.stop_requested()) {
        std::error_code rm_ec;
        std::filesystem::remove(output_path_, rm_ec);
        if (ec) {
            finish(DownloadState::failed, ec);
        } else {
            finish(DownloadState::stopped, make_error_code(DownloadErrc::cancelled));
        }
        return;
    }

    finish(DownloadState::completed);
}

void DownloadEngine::dispatch_pending(ChunkCoordinator& coordinator, WorkerPool& pool) {
    while (auto claim = coordinator.claim_next()) {
        std::error_code ec;
        try {
            ec = pool.submit([this, &coordinator, c = *claim] {
                fetch_chunk(coordinator, c);
            });
        } catch (const std::exception& e) {
            spdlog::error("Cannot queue chunk {}: {}", claim->index, e.what());
            ec = std::make_error_code(std::errc::not_enough_memory);
        }
        if (ec) {
            // Back to pending without charging a retry
            coordinator.release(claim->index);
            spdlog::debug("Chunk {} not dispatched: {}", claim->index, ec.message());
            return;
        }
    }
}

void DownloadEngine::fetch_chunk(ChunkCoordinator& coordinator, const ChunkClaim& claim) noexcept {
    try {
        const auto path = part_path(output_path_, claim.index);
        spdlog::debug("Chunk {}: bytes {}-{}", claim.index, claim.start, claim.end);

        auto ec = transport_->fetch_range(url_.str(), claim.start, claim.end, path,
            [this, index = claim.index](std::uint64_t n) { progress_.add_bytes(index, n); });

        std::uint64_t actual = 0;
        if (!ec) {
            std::error_code fs_ec;
            actual = std::filesystem::file_size(path, fs_ec);
            if (fs_ec) {
                ec = make_error_code(DownloadErrc::write_failed);
            } else if (actual != claim.size()) {
                spdlog::warn("Chunk {} size mismatch. Expected: {}, Got: {}",
                             claim.index, claim.size(), actual);
                ec = make_error_code(DownloadErrc::size_mismatch);
            }
        }

        if (ec) {
            spdlog::warn("Chunk {} failed: {}", claim.index, ec.message());
            chunk_failed(coordinator, claim);
            return;
        }

        // Progress first: once the coordinator says all_done, every record is in
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - claim.claimed_at;
        progress_.record(claim.index, true, actual, elapsed);
        coordinator.mark_completed(claim.index);
    } catch (const std::exception& e) {
        spdlog::error("Chunk {} aborted: {}", claim.index, e.what());
        chunk_failed(coordinator, claim);
    }
}

void DownloadEngine::chunk_failed(ChunkCoordinator& coordinator, const ChunkClaim& claim) noexcept {
    try {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - claim.claimed_at;
        progress_.record(claim.index, false, 0, elapsed);
    } catch (const std::exception& e) {
        spdlog::error("Cannot record failure of chunk {}: {}", claim.index, e.what());
    }
    // Always reaches the coordinator so the retry budget is charged
    coordinator.mark_failed(claim.index);
}

void DownloadEngine::handle_stall(const ChunkCoordinator& coordinator) noexcept {
    try {
        const auto claimed = coordinator.claimed_indices();
        std::string list;
        for (auto index : claimed) {
            if (!list.empty()) {
                list += ", ";
            }
            list += std::to_string(index);
        }
        spdlog::warn("No progress for {}s; chunks in flight: [{}]",
                     std::chrono::duration_cast<std::chrono::seconds>(options_.stall_threshold).count(),
                     list);
    } catch (const std::exception& e) {
        spdlog::warn("No progress; cannot list chunks in flight: {}", e.what());
    }
    // Stuck transfers are aborted by the transport's low-speed timeout
    progress_.touch();
}

void DownloadEngine::merge_chunks(std::uint32_t chunk_count, std::uint64_t total_size) noexcept {
    if (!transition(DownloadState::merging)) {
        // Stopped between the last chunk and the merge
        cleanup_parts(chunk_count);
        return;
    }

    std::vector<std::string> paths;
    try {
        paths.reserve(chunk_count);
        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            paths.push_back(part_path(output_path_, i));
        }
    } catch (const std::exception& e) {
        spdlog::error("Cannot list chunk files: {}", e.what());
        cleanup_parts(chunk_count);
        finish(DownloadState::failed, std::make_error_code(std::errc::not_enough_memory));
        return;
    }

    disk::ChunkMerger merger(options_.merge_buffer_size);
    // Size is checked on the temp file so a short merge never replaces the destination
    auto ec = merger.merge(paths, output_path_, total_size);
    cleanup_parts(chunk_count);

    if (ec) {
        finish(DownloadState::failed, ec);
        return;
    }
    finish(DownloadState::completed);
}

void DownloadEngine::cleanup_parts(std::uint32_t chunk_count) const noexcept {
    for (std::uint32_t i = 0; i < chunk_count; ++i) {
        std::error_code ec;
        try {
            std::filesystem::remove(part_path(output_path_, i), ec);
        } catch (const std::exception& e) {
            spdlog::warn("Cannot remove chunk file {}: {}", i, e.what());
            continue;
        }
        if (ec) {
            spdlog::warn("Cannot remove chunk file {}: {}", i, ec.message());
        }
    }
}

//=============================================================================
// Reporting
//=============================================================================

void DownloadEngine::report_loop(std::stop_token stoken) noexcept {
    report_thread_id_.store(std::this_thread::get_id(), std::memory_order_release);
    const auto finished = [this] { return is_terminal(state()); };

    while (!finished()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            if (stoken.stop_requested()) {
                // Session thread is winding down; finish() wakes us
                wake_.wait(lock, finished);
            } else {
                (void)wake_.wait_for(lock, stoken, options_.report_interval, finished);
            }
        }
        if (finished()) {
            break;
        }

        const auto r = report();
        if (r.total_chunks > 0) {
            spdlog::debug("Progress {:.1f}% ({}/{} chunks, {} failed, {} bytes)",
                          r.progress * 100.0, r.completed_chunks, r.total_chunks,
                          r.failed_chunks, r.downloaded_bytes);
        }
        emit_report();
    }

    // Final state
    emit_report();
}

void DownloadEngine::emit_report() noexcept {
    try {
        // Called without the lock so the callback may re-enter the engine
        ReportCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = callback_;
        }
        if (cb) {
            cb(report());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback threw: {}", e.what());
    }
}

//=============================================================================
// Helpers
//=============================================================================

const char* to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::init: return "init";
        case DownloadState::probing: return "probing";
        case DownloadState::dispatching: return "dispatching";
        case DownloadState::merging: return "merging";
        case DownloadState::completed: return "completed";
        case DownloadState::failed: return "failed";
        case DownloadState::stopped: return "stopped";
    }
    return "unknown";
}

const char* to_string(DownloadMode mode) noexcept {
    switch (mode) {
        case DownloadMode::undecided: return "undecided";
        case DownloadMode::parallel: return "parallel";
        case DownloadMode::single_stream: return "single_stream";
    }
    return "unknown";
}

} // namespace paraloader::core
