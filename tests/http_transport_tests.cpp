// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <paraloader/core/error.hpp>
#include <paraloader/core/http_transport.hpp>
#include "test_support.hpp"
#include <filesystem>

using namespace paraloader::core;

TEST_CASE("error_from_status", "[http]") {
    CHECK_FALSE(error_from_status(200));
    CHECK_FALSE(error_from_status(206));
    CHECK_FALSE(error_from_status(304));
    CHECK(error_from_status(404) == make_error_code(DownloadErrc::not_found));
    CHECK(error_from_status(410) == make_error_code(DownloadErrc::not_found));
    CHECK(error_from_status(401) == make_error_code(DownloadErrc::permission_denied));
    CHECK(error_from_status(403) == make_error_code(DownloadErrc::permission_denied));
    CHECK(error_from_status(500) == make_error_code(DownloadErrc::server_error));
    CHECK(error_from_status(503) == make_error_code(DownloadErrc::server_error));
    CHECK(error_from_status(429) == make_error_code(DownloadErrc::network_error));
}

TEST_CASE("HttpOptions defaults", "[http]") {
    HttpTransport transport;
    CHECK(transport.options().connect_timeout_sec == CONNECTION_TIMEOUT_SEC);
    CHECK(transport.options().low_speed_time_sec == STALL_TIMEOUT_SEC);
    CHECK(transport.options().max_redirects == MAX_REDIRECTS);
}

TEST_CASE("HttpTransport - unreachable host", "[http]") {
    HttpTransport::global_init();

    HttpOptions options;
    options.connect_timeout_sec = 2;
    HttpTransport transport(options);
    paraloader::test::TempDir dir;

    // Nothing listens on port 1 of the loopback interface
    SECTION("Probe fails") {
        auto probe = transport.probe("http://127.0.0.1:1/file.bin");
        REQUIRE_FALSE(probe.has_value());
    }

    SECTION("Fetch fails") {
        auto ec = transport.fetch_range("http://127.0.0.1:1/file.bin", 0, 99, dir.file("out"));
        CHECK(ec);
    }

    HttpTransport::global_cleanup();
}

TEST_CASE("HttpTransport - inverted range is rejected before any request", "[http]") {
    HttpTransport transport;
    paraloader::test::TempDir dir;
    const auto dest = dir.file("out");

    auto ec = transport.fetch_range("http://127.0.0.1:1/file.bin", 100, 10, dest);
    CHECK(ec == make_error_code(DownloadErrc::invalid_range));
    CHECK_FALSE(std::filesystem::exists(dest));
}
