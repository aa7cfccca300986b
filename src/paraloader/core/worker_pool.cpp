// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/worker_pool.hpp>
#include <paraloader/core/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace paraloader::core {

WorkerPool::WorkerPool(std::uint32_t num_workers,
                       std::string name,
                       std::chrono::milliseconds poll_interval)
    : name_(std::move(name))
    , poll_interval_(poll_interval) {
    const auto count = std::max<std::uint32_t>(num_workers, 1);
    workers_.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        workers_.emplace_back([this, i](std::stop_token stoken) {
            worker_loop(stoken, i);
        });
    }
    spdlog::debug("Started {} {} threads", count, name_);
}

WorkerPool::~WorkerPool() {
    join();
}

std::error_code WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return make_error_code(DownloadErrc::pool_shutting_down);
        }
        queue_.push_back(std::move(task));
    }
    work_available_.notify_one();
    return {};
}

void WorkerPool::shutdown(bool wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    shutting_down_ = true;

    if (wait) {
        idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
    } else if (!queue_.empty()) {
        spdlog::debug("{} pool dropping {} queued tasks", name_, queue_.size());
        queue_.clear();
        lock.unlock();
        // A draining shutdown() may be waiting on the queue alone
        idle_.notify_all();
    }
}

void WorkerPool::join() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    {
        // Taking the lock orders the stop request before any waiter's predicate check
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    work_available_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint32_t WorkerPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool WorkerPool::is_shutting_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutting_down_;
}

void WorkerPool::worker_loop(std::stop_token stoken, std::uint32_t worker_id) {
    while (!stoken.stop_requested()) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Bounded wait so a stop request is seen even when no work arrives
            const bool ready = work_available_.wait_for(lock, poll_interval_, [&] {
                return !queue_.empty() || stoken.stop_requested();
            });
            if (!ready || stoken.stop_requested()) {
                continue;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("{}-{}: task failed: {}", name_, worker_id, e.what());
        } catch (...) {
            spdlog::error("{}-{}: task failed with a non-standard exception", name_, worker_id);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        idle_.notify_all();
    }
}

} // namespace paraloader::core
