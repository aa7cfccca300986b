// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace paraloader::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    invalid_path,
    write_error,
    read_error,
    rename_failed,
    no_valid_chunks,
    size_mismatch,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "paraloader::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:          return "Success";
            case DiskErrc::file_not_found:   return "File not found";
            case DiskErrc::access_denied:    return "Access denied";
            case DiskErrc::invalid_path:     return "Invalid path";
            case DiskErrc::write_error:      return "Write error";
            case DiskErrc::read_error:       return "Read error";
            case DiskErrc::rename_failed:    return "Could not move the merged file into place";
            case DiskErrc::no_valid_chunks:  return "No valid chunk files to merge";
            case DiskErrc::size_mismatch:    return "Merged file has an unexpected size";
            default:                         return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace paraloader::disk

namespace std {

template<>
struct is_error_code_enum<paraloader::disk::DiskErrc> : true_type {};

} // namespace std
