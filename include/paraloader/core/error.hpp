// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace paraloader::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    invalid_range,
    invalid_connections,
    invalid_chunk_size,
    invalid_output_path,
    invalid_option,
    range_not_honored,
    size_mismatch,
    chunk_failed,
    pool_shutting_down,
    already_started,
    cancelled,
    write_failed,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "paraloader::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:             return "Success";
            case DownloadErrc::network_error:       return "Network error";
            case DownloadErrc::timeout:             return "Operation timed out";
            case DownloadErrc::not_found:           return "Resource not found (404)";
            case DownloadErrc::server_error:        return "Server error (5xx)";
            case DownloadErrc::permission_denied:   return "Permission denied";
            case DownloadErrc::invalid_url:         return "Invalid URL";
            case DownloadErrc::invalid_range:       return "Invalid byte range";
            case DownloadErrc::invalid_connections: return "Connection count out of range";
            case DownloadErrc::invalid_chunk_size:  return "Chunk size out of range";
            case DownloadErrc::invalid_output_path: return "Invalid output path";
            case DownloadErrc::invalid_option:      return "Download option out of range";
            case DownloadErrc::range_not_honored:   return "Server ignored the byte range";
            case DownloadErrc::size_mismatch:       return "Downloaded size does not match the requested range";
            case DownloadErrc::chunk_failed:        return "Chunk failed after exhausting its retries";
            case DownloadErrc::pool_shutting_down:  return "Worker pool is shutting down";
            case DownloadErrc::already_started:     return "Download already started";
            case DownloadErrc::cancelled:           return "Download stopped";
            case DownloadErrc::write_failed:        return "Failed to write downloaded data";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace paraloader::core

namespace std {

template<>
struct is_error_code_enum<paraloader::core::DownloadErrc> : true_type {};

} // namespace std
