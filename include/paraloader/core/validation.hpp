// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <paraloader/core/error.hpp>
#include <cstdint>
#include <string_view>

namespace paraloader::core {

// Parallel connections in [MIN_CONNECTIONS, MAX_CONNECTIONS]
[[nodiscard]] bool validate_connections(std::uint32_t connections) noexcept;

// Chunk size hint in [MIN_CHUNK_SIZE, MAX_CHUNK_SIZE]
[[nodiscard]] bool validate_chunk_size(std::uint64_t chunk_size) noexcept;

// Retry budget in [0, MAX_RETRY_LIMIT]
[[nodiscard]] bool validate_max_retries(std::uint32_t max_retries) noexcept;

// File name is non-empty, free of <>:"/\|?* and not a reserved device name
[[nodiscard]] bool is_valid_filename(std::string_view filename) noexcept;

// Output path ends in a valid file name
[[nodiscard]] bool validate_output_path(std::string_view path) noexcept;

// Create the parent directory of path if it does not exist
[[nodiscard]] std::error_code ensure_parent_directory(std::string_view path) noexcept;

} // namespace paraloader::core
