// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace paraloader::core {

// Session parameter bounds
constexpr std::uint32_t MIN_CONNECTIONS = 1;
constexpr std::uint32_t MAX_CONNECTIONS = 16;
constexpr std::uint32_t DEFAULT_CONNECTIONS = 4;

constexpr std::uint64_t MIN_CHUNK_SIZE = 1024;                      // 1 KiB
constexpr std::uint64_t MAX_CHUNK_SIZE = 100 * 1024 * 1024;         // 100 MiB
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;           // 1 MiB

constexpr std::uint32_t MAX_RETRIES = 3;
constexpr std::uint32_t MAX_RETRY_LIMIT = 10;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Accepted ranges for values read from the settings file
constexpr std::uint32_t MIN_TIMEOUT_SEC = 1;
constexpr std::uint32_t MAX_TIMEOUT_SEC = 600;
constexpr std::uint32_t MIN_STALL_TIMEOUT_SEC = 1;
constexpr std::uint32_t MAX_STALL_TIMEOUT_SEC = 3600;
constexpr std::uint32_t MIN_POLL_INTERVAL_MS = 10;
constexpr std::uint32_t MAX_POLL_INTERVAL_MS = 10'000;
constexpr std::uint64_t MIN_MERGE_BUFFER_SIZE = 4 * 1024;                // 4 KiB
constexpr std::uint64_t MAX_MERGE_BUFFER_SIZE = 16 * 1024 * 1024;        // 16 MiB

constexpr std::chrono::milliseconds DISPATCH_INTERVAL{500};
constexpr std::chrono::milliseconds REPORT_INTERVAL{2000};
constexpr std::chrono::milliseconds WORKER_POLL_INTERVAL{1000};

constexpr std::size_t MERGE_BUFFER_SIZE = 64 * 1024;                // 64 KiB
constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KiB

constexpr const char* PART_SUFFIX = ".part";
constexpr const char* TEMP_SUFFIX = ".tmp";
constexpr const char* DEFAULT_CONFIG_FILE = "paraloader.json";

} // namespace paraloader::core
