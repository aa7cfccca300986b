// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/config.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace paraloader::core {

// Fixed-size pool of threads draining one FIFO of fire-and-forget tasks.
// Tasks report their own outcome; anything they throw is logged and dropped.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::uint32_t num_workers,
                        std::string name = "worker",
                        std::chrono::milliseconds poll_interval = WORKER_POLL_INTERVAL);
    ~WorkerPool();

    // Non-copyable, non-movable (workers capture this)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // Enqueue a task. pool_shutting_down once shutdown() has been called.
    [[nodiscard]] std::error_code submit(Task task);

    // Stop accepting work. With wait, block until the queue is drained and
    // nothing is running; without, drop whatever is still queued.
    void shutdown(bool wait = true);

    // Stop the workers and join them. In-flight tasks run to completion.
    void join();

    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::uint32_t active() const;
    [[nodiscard]] std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(workers_.size()); }
    [[nodiscard]] bool is_shutting_down() const;

private:
    void worker_loop(std::stop_token stoken, std::uint32_t worker_id);

    std::string name_;
    std::chrono::milliseconds poll_interval_;

    std::deque<Task> queue_;
    std::uint32_t active_{0};
    bool shutting_down_{false};

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    std::vector<std::jthread> workers_;
};

} // namespace paraloader::core
