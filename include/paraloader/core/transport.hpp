// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace paraloader::core {

// What a capability probe learned about the resource
struct ProbeResult {
    std::optional<std::uint64_t> size;   // Empty when the server did not say
    bool range_supported{false};
};

// Called with each block of bytes as it lands in the destination
using BytesCallback = std::function<void(std::uint64_t bytes)>;

// Network access used by the engine. Implementations must be safe to call
// from several worker threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Total size and byte-range support of url
    [[nodiscard]] virtual std::expected<ProbeResult, std::error_code>
    probe(const std::string& url) noexcept = 0;

    // Write bytes [start, *end] of url to destination, replacing the file.
    // An empty end fetches the whole resource with no Range header.
    [[nodiscard]] virtual std::error_code
    fetch_range(const std::string& url,
                std::uint64_t start,
                std::optional<std::uint64_t> end,
                const std::string& destination,
                const BytesCallback& on_bytes = {}) noexcept = 0;
};

} // namespace paraloader::core
