// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <paraloader/core/progress_tracker.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace paraloader::core;
using namespace std::chrono_literals;
using Catch::Approx;

TEST_CASE("ProgressTracker - chunk-count progress", "[progress]") {
    ProgressTracker tracker;

    SECTION("Empty before start") {
        CHECK(tracker.overall_progress() == 0.0);
        CHECK(tracker.average_throughput() == 0.0);
    }

    SECTION("Completed over total") {
        tracker.start(4);
        tracker.record(0, true, 1000, 1s);
        CHECK(tracker.overall_progress() == Approx(0.25));
        tracker.record(1, true, 10, 1s);
        CHECK(tracker.overall_progress() == Approx(0.5));
        CHECK(tracker.completed_count() == 2);
    }

    SECTION("Duplicate success does not double count") {
        tracker.start(2);
        tracker.record(0, true, 1000, 1s);
        tracker.record(0, true, 1000, 1s);
        CHECK(tracker.completed_count() == 1);
        CHECK(tracker.overall_progress() == Approx(0.5));
        CHECK(tracker.downloaded_bytes() == 1000);
    }

    SECTION("Start resets everything") {
        tracker.start(2);
        tracker.record(0, true, 1000, 1s);
        tracker.record(1, false, 0, 1s);
        tracker.start(3);
        CHECK(tracker.completed_count() == 0);
        CHECK(tracker.failed_count() == 0);
        CHECK(tracker.downloaded_bytes() == 0);
    }
}

TEST_CASE("ProgressTracker - failures are cleared by a later success", "[progress]") {
    ProgressTracker tracker;
    tracker.start(4);

    tracker.record(2, false, 0, 1s);
    tracker.record(2, false, 0, 1s);
    CHECK(tracker.failed_count() == 1);

    tracker.record(2, true, 512, 1s);
    CHECK(tracker.failed_count() == 0);
    CHECK(tracker.completed_count() == 1);
}

TEST_CASE("ProgressTracker - average throughput", "[progress]") {
    ProgressTracker tracker;
    tracker.start(3);

    // Unweighted mean of per-chunk speeds: (1000 + 3000) / 2
    tracker.record(0, true, 1000, 1s);
    tracker.record(1, true, 6000, 2s);
    CHECK(tracker.average_throughput() == Approx(2000.0));

    SECTION("Zero elapsed reports no speed") {
        tracker.record(2, true, 5000, 0s);
        CHECK(tracker.average_throughput() == Approx(2000.0));
    }
}

TEST_CASE("ProgressTracker - streaming bytes", "[progress]") {
    ProgressTracker tracker;
    tracker.start(2);

    tracker.add_bytes(0, 100);
    tracker.add_bytes(0, 150);
    tracker.add_bytes(1, 50);
    CHECK(tracker.downloaded_bytes() == 300);

    SECTION("Success replaces the streamed count") {
        tracker.record(0, true, 250, 1s);
        CHECK(tracker.downloaded_bytes() == 300);
    }

    SECTION("Failure discards the attempt's bytes") {
        tracker.record(1, false, 0, 1s);
        CHECK(tracker.downloaded_bytes() == 250);
    }
}

TEST_CASE("ProgressTracker - idle time", "[progress]") {
    ProgressTracker tracker;
    tracker.start(1);

    std::this_thread::sleep_for(30ms);
    CHECK(tracker.idle_for() >= 30ms);

    tracker.add_bytes(0, 1);
    CHECK(tracker.idle_for() < 30ms);

    std::this_thread::sleep_for(30ms);
    tracker.touch();
    CHECK(tracker.idle_for() < 30ms);
}

TEST_CASE("ProgressTracker - snapshot", "[progress]") {
    ProgressTracker tracker;
    tracker.start(4);
    tracker.record(0, true, 100, 1s);
    tracker.record(1, false, 0, 1s);

    const auto snap = tracker.snapshot();
    CHECK(snap.total_chunks == 4);
    CHECK(snap.completed_chunks == 1);
    CHECK(snap.failed_chunks == 1);
    CHECK(snap.downloaded_bytes == 100);
    CHECK(snap.overall_progress == Approx(0.25));
    CHECK(snap.average_throughput == Approx(100.0));
}

TEST_CASE("ProgressTracker - concurrent records", "[progress][concurrency]") {
    ProgressTracker tracker;
    tracker.start(64);

    {
        std::vector<std::jthread> threads;
        for (std::uint32_t t = 0; t < 8; ++t) {
            threads.emplace_back([&tracker, t] {
                for (std::uint32_t i = t * 8; i < (t + 1) * 8; ++i) {
                    tracker.add_bytes(i, 10);
                    tracker.record(i, true, 10, 1ms);
                }
            });
        }
    }

    CHECK(tracker.completed_count() == 64);
    CHECK(tracker.overall_progress() == Approx(1.0));
    CHECK(tracker.downloaded_bytes() == 640);
}
