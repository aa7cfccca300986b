// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <paraloader/core/chunk.hpp>
#include <paraloader/disk/chunk_merger.hpp>
#include <paraloader/disk/error.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <filesystem>

using namespace paraloader;
using namespace paraloader::disk;
using paraloader::test::TempDir;
using paraloader::test::read_file;
using paraloader::test::write_file;

TEST_CASE("ChunkMerger - orders chunks by index", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");

    write_file(core::part_path(output, 2), "C");
    write_file(core::part_path(output, 0), "A");
    write_file(core::part_path(output, 1), "B");

    // Deliberately out of order
    std::vector<std::string> paths{
        core::part_path(output, 2),
        core::part_path(output, 0),
        core::part_path(output, 1),
    };

    ChunkMerger merger;
    REQUIRE_FALSE(merger.merge(paths, output));
    CHECK(read_file(output) == "ABC");
    CHECK_FALSE(std::filesystem::exists(temp_path(output)));
}

TEST_CASE("ChunkMerger - numeric, not lexical, order", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");

    std::vector<std::string> paths;
    std::string expected;
    for (std::uint32_t i = 0; i < 12; ++i) {
        const std::string piece(1, static_cast<char>('a' + i));
        write_file(core::part_path(output, i), piece);
        paths.push_back(core::part_path(output, i));
        expected += piece;
    }
    // part10 and part11 sort before part2 as strings
    std::sort(paths.begin(), paths.end());

    ChunkMerger merger;
    REQUIRE_FALSE(merger.merge(paths, output));
    CHECK(read_file(output) == expected);
}

TEST_CASE("ChunkMerger - skips missing and empty chunks", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");

    write_file(core::part_path(output, 0), "first");
    write_file(core::part_path(output, 1), "");
    write_file(core::part_path(output, 3), "-last");

    std::vector<std::string> paths{
        core::part_path(output, 0),
        core::part_path(output, 1),
        core::part_path(output, 2),  // never written
        core::part_path(output, 3),
    };

    ChunkMerger merger;
    REQUIRE_FALSE(merger.merge(paths, output));
    CHECK(read_file(output) == "first-last");
}

TEST_CASE("ChunkMerger - nothing usable", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");

    SECTION("All missing leaves no output") {
        std::vector<std::string> paths{core::part_path(output, 0), core::part_path(output, 1)};
        ChunkMerger merger;
        CHECK(merger.merge(paths, output) == make_error_code(DiskErrc::no_valid_chunks));
        CHECK_FALSE(std::filesystem::exists(output));
        CHECK_FALSE(std::filesystem::exists(temp_path(output)));
    }

    SECTION("Existing destination is left alone") {
        write_file(output, "previous");
        write_file(core::part_path(output, 0), "");
        ChunkMerger merger;
        CHECK(merger.merge({core::part_path(output, 0)}, output) == make_error_code(DiskErrc::no_valid_chunks));
        CHECK(read_file(output) == "previous");
    }

    SECTION("Empty list") {
        ChunkMerger merger;
        CHECK(merger.merge({}, output) == make_error_code(DiskErrc::no_valid_chunks));
    }
}

TEST_CASE("ChunkMerger - unparseable suffix counts as index zero", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");
    const auto odd = dir.file("stray-chunk");

    write_file(odd, "X");
    write_file(core::part_path(output, 1), "Y");

    ChunkMerger merger;
    REQUIRE_FALSE(merger.merge({core::part_path(output, 1), odd}, output));
    CHECK(read_file(output) == "XY");
}

TEST_CASE("ChunkMerger - buffer smaller than the chunks", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");
    const auto payload = test::make_payload(10'000);

    write_file(core::part_path(output, 0), std::string_view(payload).substr(0, 4'000));
    write_file(core::part_path(output, 1), std::string_view(payload).substr(4'000));

    ChunkMerger merger(7);
    CHECK(merger.buffer_size() == 7);
    REQUIRE_FALSE(merger.merge({core::part_path(output, 0), core::part_path(output, 1)}, output));
    CHECK(read_file(output) == payload);
}

TEST_CASE("ChunkMerger - zero buffer size falls back to the default", "[merger]") {
    ChunkMerger merger(0);
    CHECK(merger.buffer_size() == core::MERGE_BUFFER_SIZE);
}

TEST_CASE("ChunkMerger::verify_size", "[merger]") {
    TempDir dir;
    const auto path = dir.file("file.bin");
    write_file(path, "12345");

    CHECK_FALSE(ChunkMerger::verify_size(path, 5));
    CHECK(ChunkMerger::verify_size(path, 6) == make_error_code(DiskErrc::size_mismatch));
    CHECK(ChunkMerger::verify_size(dir.file("missing"), 5) == make_error_code(DiskErrc::file_not_found));
}

TEST_CASE("temp_path", "[merger]") {
    CHECK(temp_path("out.bin") == "out.bin.tmp");
}

TEST_CASE("ChunkMerger - expected size", "[merger]") {
    TempDir dir;
    const auto output = dir.file("out.bin");
    write_file(output, "previous");
    write_file(core::part_path(output, 0), "AB");
    write_file(core::part_path(output, 1), "CD");
    const std::vector<std::string> paths{core::part_path(output, 0), core::part_path(output, 1)};

    ChunkMerger merger;

    SECTION("Mismatch keeps the destination") {
        CHECK(merger.merge(paths, output, 5) == make_error_code(DiskErrc::size_mismatch));
        CHECK(read_file(output) == "previous");
        CHECK_FALSE(std::filesystem::exists(temp_path(output)));
    }

    SECTION("Match replaces the destination") {
        REQUIRE_FALSE(merger.merge(paths, output, 4));
        CHECK(read_file(output) == "ABCD");
    }
}
