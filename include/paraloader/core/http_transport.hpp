// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/config.hpp>
#include <paraloader/core/transport.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace paraloader::core {

// Raw response metadata from a HEAD request
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lower-cased names
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string content_type;
};

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_time_sec{STALL_TIMEOUT_SEC};  // Abort when below 1 B/s this long
    std::uint32_t max_redirects{MAX_REDIRECTS};
    std::string user_agent{"paraloader"};
};

// libcurl-backed Transport. Each call uses its own easy handle, so one
// instance can be shared by all workers.
class HttpTransport final : public Transport {
public:
    HttpTransport() = default;
    explicit HttpTransport(HttpOptions options) : options_(std::move(options)) {}

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(const std::string& url) noexcept override;

    [[nodiscard]] std::error_code
    fetch_range(const std::string& url,
                std::uint64_t start,
                std::optional<std::uint64_t> end,
                const std::string& destination,
                const BytesCallback& on_bytes = {}) noexcept override;

    // HEAD request with header capture
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

// Map an HTTP status code to an error; empty for 1xx-3xx
[[nodiscard]] std::error_code error_from_status(long http_code) noexcept;

} // namespace paraloader::core
