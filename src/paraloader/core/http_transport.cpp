// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/http_transport.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string>

namespace paraloader::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

// Header callback: lower-cased name -> trimmed value. A new status line
// (after a redirect) starts a fresh header set.
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// State shared with the GET write callback
struct WriteContext {
    CURL* curl{nullptr};
    std::ofstream* out{nullptr};
    const BytesCallback* on_bytes{nullptr};
    bool ranged{false};
    bool checked_status{false};
    bool range_ignored{false};
    bool write_failed{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!ctx->checked_status) {
        ctx->checked_status = true;
        long http_code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
        // A 200 to a ranged request is the whole file: abort before writing it
        if (ctx->ranged && http_code == 200) {
            ctx->range_ignored = true;
            return 0;
        }
    }

    ctx->out->write(ptr, static_cast<std::streamsize>(bytes));
    if (!*ctx->out) {
        ctx->write_failed = true;
        return 0;
    }

    if (ctx->on_bytes && *ctx->on_bytes) {
        (*ctx->on_bytes)(bytes);
    }
    return bytes;
}

std::error_code error_from_curl(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                  return {};
        case CURLE_OPERATION_TIMEDOUT:  return make_error_code(DownloadErrc::timeout);
        case CURLE_URL_MALFORMAT:       return make_error_code(DownloadErrc::invalid_url);
        case CURLE_WRITE_ERROR:         return make_error_code(DownloadErrc::write_failed);
        default:                        return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, const HttpOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    // Workers run transfers on their own threads
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (!options.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    }
}

} // namespace

//=============================================================================
// HttpTransport
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpTransport::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    apply_common_options(curl.ptr, url, options_);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(error_from_curl(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = error_from_status(http_code)) {
        return std::unexpected(ec);
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not filled for HEAD; read the header
    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end() && !cl_it->second.empty()) {
        const auto& text = cl_it->second;
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            response.content_length = value;
        }
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
                           && ar_it->second.find("bytes") != std::string::npos;

    return response;
}

std::expected<ProbeResult, std::error_code>
HttpTransport::probe(const std::string& url) noexcept {
    auto response = head(url);
    if (!response) {
        return std::unexpected(response.error());
    }

    ProbeResult result;
    result.size = response->content_length;
    result.range_supported = response->accepts_ranges;
    return result;
}

std::error_code HttpTransport::fetch_range(const std::string& url,
                                           std::uint64_t start,
                                           std::optional<std::uint64_t> end,
                                           const std::string& destination,
                                           const BytesCallback& on_bytes) noexcept {
    if (end && *end < start) {
        return make_error_code(DownloadErrc::invalid_range);
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Cannot open {} for writing", destination);
        return make_error_code(DownloadErrc::write_failed);
    }

    WriteContext ctx;
    ctx.curl = curl.ptr;
    ctx.out = &out;
    ctx.on_bytes = &on_bytes;
    ctx.ranged = end.has_value();

    apply_common_options(curl.ptr, url, options_);

    std::string range;
    if (end) {
        range = std::to_string(start) + "-" + std::to_string(*end);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    // Abort transfers that stall instead of hanging a worker forever
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    // A zero time would switch the abort off
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(std::max<std::uint32_t>(options_.low_speed_time_sec, 1)));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);
    out.close();

    if (ctx.range_ignored) {
        return make_error_code(DownloadErrc::range_not_honored);
    }
    if (ctx.write_failed || (result == CURLE_OK && !out)) {
        return make_error_code(DownloadErrc::write_failed);
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} [{}] failed: {}", url, range.empty() ? "full" : range,
                      curl_easy_strerror(result));
        return error_from_curl(result);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code == 416) {
        return make_error_code(DownloadErrc::invalid_range);
    }
    return error_from_status(http_code);
}

std::error_code error_from_status(long http_code) noexcept {
    if (http_code < 400) {
        return {};
    }
    if (http_code == 404 || http_code == 410) {
        return make_error_code(DownloadErrc::not_found);
    }
    if (http_code == 401 || http_code == 403) {
        return make_error_code(DownloadErrc::permission_denied);
    }
    if (http_code >= 500) {
        return make_error_code(DownloadErrc::server_error);
    }
    return make_error_code(DownloadErrc::network_error);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpTransport::global_init() noexcept {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::error("Failed to initialize libcurl");
    }
}

void HttpTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace paraloader::core
