// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace paraloader::core {

class Url {
public:
    // Split a URL into its components. Requires "scheme://" and a host.
    [[nodiscard]] static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    // Original string as given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// http/https with a well-formed host name and, if present, a numeric port
[[nodiscard]] bool is_supported_url(const Url& url) noexcept;

// Parse and check in one step; invalid_url on any failure
[[nodiscard]] std::expected<Url, std::error_code> validate_url(std::string_view url_str) noexcept;

} // namespace paraloader::core
