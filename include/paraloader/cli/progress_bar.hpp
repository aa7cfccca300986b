// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace paraloader::cli {

// Single-line progress bar for the terminal
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total, std::string_view label = {});

    // Redraw with the current byte count and speed
    void update(std::uint64_t current, std::uint64_t speed_bps = 0) noexcept;

    // Chunk counters shown after the byte counts
    void chunks(std::uint32_t completed, std::uint32_t total) noexcept {
        completed_chunks_ = completed;
        total_chunks_ = total;
    }

    // Draw the bar full and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    // Status line without the leading carriage return
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const noexcept;

private:
    [[nodiscard]] static std::string render_bar(double percent) noexcept;

    std::uint64_t total_{0};
    std::uint32_t completed_chunks_{0};
    std::uint32_t total_chunks_{0};
    std::string label_;
    std::size_t last_width_{0};
    bool finished_{false};
};

// Spinner for downloads of unknown size
class Spinner {
public:
    enum class Style { dots, line, arrow };

    explicit Spinner(Style style = Style::line) noexcept;

    // Advance one frame; shows the byte count when non-zero
    void update(std::uint64_t current = 0) noexcept;
    void finish() noexcept;
    void clear() noexcept;

private:
    std::size_t frame_{0};
    Style style_;
};

[[nodiscard]] std::string format_speed(std::uint64_t bps) noexcept;
[[nodiscard]] std::string format_bytes(std::uint64_t bytes) noexcept;
[[nodiscard]] std::string format_time(std::uint64_t seconds) noexcept;

} // namespace paraloader::cli
