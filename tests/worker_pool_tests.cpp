// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <paraloader/core/error.hpp>
#include <paraloader/core/worker_pool.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace paraloader::core;
using namespace std::chrono_literals;

TEST_CASE("WorkerPool - runs submitted tasks", "[pool]") {
    std::atomic<int> counter{0};

    WorkerPool pool(4, "test", 10ms);
    CHECK(pool.size() == 4);

    for (int i = 0; i < 100; ++i) {
        REQUIRE_FALSE(pool.submit([&] { counter.fetch_add(1); }));
    }

    pool.shutdown(true);
    CHECK(counter.load() == 100);
    CHECK(pool.pending() == 0);
    CHECK(pool.active() == 0);
}

TEST_CASE("WorkerPool - at least one worker", "[pool]") {
    WorkerPool pool(0, "test", 10ms);
    CHECK(pool.size() == 1);
}

TEST_CASE("WorkerPool - rejects work after shutdown", "[pool]") {
    WorkerPool pool(2, "test", 10ms);
    pool.shutdown(true);

    CHECK(pool.is_shutting_down());
    auto ec = pool.submit([] {});
    CHECK(ec == make_error_code(DownloadErrc::pool_shutting_down));
}

TEST_CASE("WorkerPool - shutdown without wait drops queued tasks", "[pool]") {
    std::atomic<int> started{0};
    std::atomic<bool> release{false};

    WorkerPool pool(1, "test", 10ms);

    // Occupy the only worker
    REQUIRE_FALSE(pool.submit([&] {
        started.fetch_add(1);
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    }));
    while (started.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    for (int i = 0; i < 10; ++i) {
        REQUIRE_FALSE(pool.submit([&] { started.fetch_add(1); }));
    }
    CHECK(pool.pending() == 10);

    pool.shutdown(false);
    CHECK(pool.pending() == 0);

    release.store(true);
    pool.join();

    // The in-flight task finished, none of the queued ones ran
    CHECK(started.load() == 1);
}

TEST_CASE("WorkerPool - a throwing task does not kill its worker", "[pool]") {
    std::atomic<int> counter{0};

    WorkerPool pool(1, "test", 10ms);
    REQUIRE_FALSE(pool.submit([] { throw std::runtime_error("boom"); }));
    REQUIRE_FALSE(pool.submit([&] { counter.fetch_add(1); }));

    pool.shutdown(true);
    CHECK(counter.load() == 1);
}

TEST_CASE("WorkerPool - tasks run in parallel", "[pool][concurrency]") {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    WorkerPool pool(4, "test", 10ms);
    for (int i = 0; i < 4; ++i) {
        REQUIRE_FALSE(pool.submit([&] {
            const int now = running.fetch_add(1) + 1;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {
            }
            std::this_thread::sleep_for(50ms);
            running.fetch_sub(1);
        }));
    }

    pool.shutdown(true);
    CHECK(peak.load() > 1);
}

TEST_CASE("WorkerPool - destructor joins idle workers", "[pool]") {
    const auto start = std::chrono::steady_clock::now();
    {
        WorkerPool pool(8, "test", 10ms);
    }
    CHECK(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("WorkerPool - dropping the queue wakes a draining shutdown", "[pool][concurrency]") {
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    WorkerPool pool(1, "test", 10ms);
    REQUIRE_FALSE(pool.submit([&] {
        started.store(true);
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    }));
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    for (int i = 0; i < 3; ++i) {
        REQUIRE_FALSE(pool.submit([] {}));
    }

    // Stop the only worker with work still queued
    {
        std::jthread joiner([&pool] { pool.join(); });
        while (!pool.is_shutting_down()) {
            std::this_thread::sleep_for(1ms);
        }
        release.store(true);
    }
    REQUIRE(pool.pending() == 3);
    REQUIRE(pool.active() == 0);

    auto draining = std::async(std::launch::async, [&pool] { pool.shutdown(true); });
    CHECK(draining.wait_for(50ms) == std::future_status::timeout);

    pool.shutdown(false);
    CHECK(draining.wait_for(2s) == std::future_status::ready);
}
