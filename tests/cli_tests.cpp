// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <paraloader/cli/commands.hpp>
#include <paraloader/cli/progress_bar.hpp>
#include <string>
#include <vector>

using namespace paraloader::cli;

namespace {

// argv as main() would see it
CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "paraloader");
    std::vector<char*> argv;
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args - positional arguments", "[cli]") {
    auto args = parse({"https://example.com/a.iso", "out/a.iso"});
    CHECK(args.error.empty());
    CHECK(args.url == "https://example.com/a.iso");
    CHECK(args.output == "out/a.iso");
    CHECK_FALSE(args.connections.has_value());
    CHECK_FALSE(args.chunk_size.has_value());
    CHECK(args.config_path == paraloader::core::DEFAULT_CONFIG_FILE);

    SECTION("Too many") {
        auto extra = parse({"https://example.com/a", "a", "b"});
        CHECK_FALSE(extra.error.empty());
    }
}

TEST_CASE("parse_args - options", "[cli]") {
    auto args = parse({"-c", "8", "--chunk-size", "4096", "--fixed-chunks",
                       "--config", "my.json", "-V", "https://example.com/a", "a"});
    REQUIRE(args.error.empty());
    CHECK(args.connections == 8u);
    CHECK(args.chunk_size == 4096u);
    CHECK(args.fixed_chunks);
    CHECK(args.config_path == "my.json");
    CHECK(args.verbose);
    CHECK_FALSE(args.quiet);

    SECTION("Long and short forms") {
        auto other = parse({"--connections", "2", "-s", "2048", "-q", "-i", "https://example.com/a"});
        REQUIRE(other.error.empty());
        CHECK(other.connections == 2u);
        CHECK(other.chunk_size == 2048u);
        CHECK(other.quiet);
        CHECK(other.info_only);
        CHECK(other.output.empty());
    }
}

TEST_CASE("parse_args - help and version win", "[cli]") {
    CHECK(parse({"--bogus", "-h"}).error == "Unknown option: --bogus");
    CHECK(parse({"-h", "--bogus"}).help);
    CHECK(parse({"--version"}).version);
}

TEST_CASE("parse_args - errors", "[cli]") {
    CHECK_FALSE(parse({"-c"}).error.empty());
    CHECK_FALSE(parse({"-c", "many"}).error.empty());
    CHECK_FALSE(parse({"-c", "-1"}).error.empty());
    CHECK_FALSE(parse({"-c", "99999999999"}).error.empty());
    CHECK_FALSE(parse({"-s", "12k"}).error.empty());
    CHECK_FALSE(parse({"--unknown"}).error.empty());
}

TEST_CASE("parse_args - range checks are left to the engine", "[cli]") {
    // Out of range but well formed: the engine rejects it with a proper error
    auto args = parse({"-c", "64", "https://example.com/a", "a"});
    CHECK(args.error.empty());
    CHECK(args.connections == 64u);
}

TEST_CASE("format_bytes", "[cli]") {
    CHECK(format_bytes(0) == "0 B");
    CHECK(format_bytes(512) == "512 B");
    CHECK(format_bytes(2048) == "2 KB");
    CHECK(format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    CHECK(format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
}

TEST_CASE("format_speed", "[cli]") {
    CHECK(format_speed(100) == "100 B/s");
    CHECK(format_speed(10 * 1024 * 1024) == "10.0 MB/s");
}

TEST_CASE("format_time", "[cli]") {
    CHECK(format_time(5) == "5s");
    CHECK(format_time(125) == "2m 5s");
    CHECK(format_time(3600 + 60 * 4 + 9) == "1h 04m 09s");
}

TEST_CASE("ProgressBar::render", "[cli]") {
    ProgressBar bar(1000, "Downloading");

    SECTION("Half way") {
        bar.chunks(2, 4);
        auto line = bar.render(500, 100);
        CHECK(line.starts_with("Downloading: ["));
        CHECK(line.find(" 50%") != std::string::npos);
        CHECK(line.find("(500 B/1000 B)") != std::string::npos);
        CHECK(line.find("[2/4 chunks]") != std::string::npos);
        CHECK(line.find("@ 100 B/s") != std::string::npos);
        CHECK(line.find("ETA: 5s") != std::string::npos);
    }

    SECTION("Complete") {
        auto line = bar.render(1000, 0);
        CHECK(line.find("100%") != std::string::npos);
        CHECK(line.find("==============================]") != std::string::npos);
        CHECK(line.find("ETA") == std::string::npos);
    }

    SECTION("Overshoot is clamped") {
        auto line = bar.render(5000, 0);
        CHECK(line.find("100%") != std::string::npos);
        CHECK(line.find("(1000 B/1000 B)") != std::string::npos);
    }

    SECTION("Unknown total renders nothing") {
        ProgressBar unknown(0);
        CHECK(unknown.render(10, 10).empty());
    }
}
