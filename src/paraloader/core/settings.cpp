// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/settings.hpp>
#include <paraloader/disk/error.hpp>
#include <paraloader/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <fstream>

namespace paraloader::core {

namespace {

using json = nlohmann::json;

json to_json(const Settings& s) {
    json j;
    j["default_connections"] = s.default_connections;
    j["chunk_size"] = s.chunk_size;
    j["timeout"] = s.timeout;
    j["max_retries"] = s.max_retries;
    j["user_agent"] = s.user_agent;
    j["buffer_size"] = s.buffer_size;
    j["stall_threshold"] = s.stall_threshold;
    j["poll_interval_ms"] = s.poll_interval_ms;
    j["balanced_chunks"] = s.balanced_chunks;
    return j;
}

// Integer setting clamped to [lo, hi]. Non-numbers throw json::type_error.
template<typename T>
T bounded(const json& j, const char* key, T fallback, T lo, T hi) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (it->is_number() && it->get<double>() < 0) {
        spdlog::warn("Setting {} = {} is below {}, using {}", key, it->dump(), lo, lo);
        return lo;
    }

    const auto value = it->get<std::uint64_t>();
    if (value < lo) {
        spdlog::warn("Setting {} = {} is below {}, using {}", key, value, lo, lo);
        return lo;
    }
    if (value > hi) {
        spdlog::warn("Setting {} = {} is above {}, using {}", key, value, hi, hi);
        return hi;
    }
    return static_cast<T>(value);
}

Settings from_json(const json& j) {
    Settings s;
    // Connections and chunk size are range checked by the engine on start()
    s.default_connections = j.value("default_connections", s.default_connections);
    s.chunk_size = j.value("chunk_size", s.chunk_size);
    s.timeout = bounded(j, "timeout", s.timeout, MIN_TIMEOUT_SEC, MAX_TIMEOUT_SEC);
    s.max_retries = bounded(j, "max_retries", s.max_retries, std::uint32_t{0}, MAX_RETRY_LIMIT);
    s.user_agent = j.value("user_agent", s.user_agent);
    s.buffer_size = bounded(j, "buffer_size", s.buffer_size, MIN_MERGE_BUFFER_SIZE, MAX_MERGE_BUFFER_SIZE);
    s.stall_threshold = bounded(j, "stall_threshold", s.stall_threshold,
                                MIN_STALL_TIMEOUT_SEC, MAX_STALL_TIMEOUT_SEC);
    s.poll_interval_ms = bounded(j, "poll_interval_ms", s.poll_interval_ms,
                                 MIN_POLL_INTERVAL_MS, MAX_POLL_INTERVAL_MS);
    s.balanced_chunks = j.value("balanced_chunks", s.balanced_chunks);
    return s;
}

} // namespace

Settings::Settings()
    : user_agent("paraloader/" + version.to_string()) {}

std::expected<Settings, std::error_code> Settings::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        auto j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }
        return from_json(j);
    } catch (const json::exception& e) {
        spdlog::debug("Invalid settings in {}: {}", path, e.what());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    } catch (const std::exception& e) {
        spdlog::debug("Cannot read settings from {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

Settings Settings::load_or_create(std::string_view path) noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec)) {
        Settings defaults;
        if (auto save_ec = defaults.save(path)) {
            spdlog::error("Failed to save config {}: {}", path, save_ec.message());
        }
        return defaults;
    }

    auto loaded = load(path);
    if (!loaded) {
        spdlog::warn("Failed to load config {}, using defaults: {}", path, loaded.error().message());
        return Settings{};
    }

    spdlog::info("Loaded configuration from {}", path);
    return std::move(*loaded);
}

std::error_code Settings::save(std::string_view path) const noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::ofstream file(p, std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << to_json(*this).dump(2) << '\n';
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::debug("Cannot write settings to {}: {}", path, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

DownloadOptions Settings::to_options() const noexcept {
    DownloadOptions options;
    options.connections = default_connections;
    options.chunk_size = chunk_size;
    options.chunk_policy = balanced_chunks ? ChunkSizePolicy::balanced : ChunkSizePolicy::fixed;
    options.max_retries = max_retries;
    options.stall_threshold = std::chrono::seconds{stall_threshold};
    options.poll_interval = std::chrono::milliseconds{poll_interval_ms};
    options.merge_buffer_size = static_cast<std::size_t>(buffer_size);
    return options;
}

HttpOptions Settings::to_http_options() const {
    HttpOptions options;
    options.connect_timeout_sec = timeout;
    options.low_speed_time_sec = stall_threshold;
    options.user_agent = user_agent;
    return options;
}

} // namespace paraloader::core
