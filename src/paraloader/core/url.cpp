// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

namespace paraloader::core {

namespace {

bool is_valid_domain(std::string_view host) {
    static const std::regex domain_pattern(
        R"(^[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(\.[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$)");
    return std::regex_match(host.begin(), host.end(), domain_pattern);
}

bool is_valid_ipv6_literal(std::string_view host) {
    if (host.size() < 3 || host.front() != '[' || host.back() != ']') {
        return false;
    }
    auto inner = host.substr(1, host.size() - 2);
    return std::all_of(inner.begin(), inner.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
    });
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    // Skip user:pass@ if present
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        // IPv6 literal [::1]:port
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
        auto ipv6_colon = url_str.find(':', bracket_end);
        if (ipv6_colon != std::string_view::npos && ipv6_colon < host_end) {
            url.port_ = std::string(url_str.substr(ipv6_colon + 1, host_end - ipv6_colon - 1));
        }
    } else {
        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto filename = path_.substr(last_slash + 1);
    // Directory URLs (path ends with /) default to index.html
    if (filename.empty()) {
        return "index.html";
    }
    return filename;
}

bool is_supported_url(const Url& url) noexcept {
    if (url.scheme() != "http" && url.scheme() != "https") {
        return false;
    }

    if (!url.port().empty()) {
        const auto port = url.port();
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(),
                [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return false;
        }
        if (std::stoul(std::string(port)) > 65535) {
            return false;
        }
    }

    try {
        return is_valid_domain(url.host()) || is_valid_ipv6_literal(url.host());
    } catch (const std::regex_error&) {
        return false;
    }
}

std::expected<Url, std::error_code> validate_url(std::string_view url_str) noexcept {
    auto parsed = Url::parse(url_str);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (!is_supported_url(*parsed)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    return parsed;
}

} // namespace paraloader::core
