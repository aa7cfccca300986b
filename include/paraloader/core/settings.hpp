// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/config.hpp>
#include <paraloader/core/download_engine.hpp>
#include <paraloader/core/http_transport.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace paraloader::core {

// User settings persisted as JSON (paraloader.json by default). Keys missing
// from the file keep their defaults; unknown keys are ignored.
struct Settings {
    std::uint32_t default_connections{DEFAULT_CONNECTIONS};
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t timeout{CONNECTION_TIMEOUT_SEC};          // seconds
    std::uint32_t max_retries{MAX_RETRIES};
    std::string user_agent;
    std::uint64_t buffer_size{MERGE_BUFFER_SIZE};
    std::uint32_t stall_threshold{STALL_TIMEOUT_SEC};       // seconds
    std::uint32_t poll_interval_ms{static_cast<std::uint32_t>(DISPATCH_INTERVAL.count())};
    bool balanced_chunks{true};

    Settings();

    // Read settings from a JSON file
    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(std::string_view path) noexcept;

    // Load path; defaults (with a warning) if it cannot be parsed, and write
    // the defaults out if it does not exist yet
    [[nodiscard]] static Settings load_or_create(std::string_view path) noexcept;

    // Write settings as indented JSON
    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    [[nodiscard]] DownloadOptions to_options() const noexcept;
    [[nodiscard]] HttpOptions to_http_options() const;
};

} // namespace paraloader::core
