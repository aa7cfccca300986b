// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace paraloader::cli {

namespace {

const char* const LINE_FRAMES[] = {"-", "\\", "|", "/"};
const char* const DOTS_FRAMES[] = {".  ", ".. ", "...", "   "};
const char* const ARROW_FRAMES[] = {">  ", " > ", "  >", " < "};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(Style style) noexcept
    : style_(style) {}

void Spinner::update(std::uint64_t current) noexcept {
    const char* const* frames = LINE_FRAMES;
    if (style_ == Style::dots) {
        frames = DOTS_FRAMES;
    } else if (style_ == Style::arrow) {
        frames = ARROW_FRAMES;
    }

    std::cout << "\r" << frames[frame_ % 4] << " ";
    if (current > 0) {
        std::cout << format_bytes(current) << "   ";
    }
    std::cout << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    std::cout << "\r done" << std::string(20, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    std::cout << "\r" << std::string(30, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0) return;

    auto line = render(current, speed_bps);

    // Pad over whatever the previous line left behind
    const auto width = line.size();
    if (width < last_width_) {
        line += std::string(last_width_ - width, ' ');
    }
    last_width_ = width;

    std::cout << "\r" << line << std::flush;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const noexcept {
    if (total_ == 0) return {};

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    // Percentage, right aligned to three digits
    const int pct_int = static_cast<int>(percent);
    line += " ";
    if (pct_int < 100) line += " ";
    if (pct_int < 10) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += format_bytes(std::min(current, total_));
    line += "/";
    line += format_bytes(total_);
    line += ")";

    if (total_chunks_ > 0) {
        line += " [";
        line += std::to_string(completed_chunks_);
        line += "/";
        line += std::to_string(total_chunks_);
        line += " chunks]";
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }

    // ETA
    const std::uint64_t remaining = current < total_ ? total_ - current : 0;
    if (speed_bps > 0 && remaining > 0) {
        line += " ETA: ";
        line += format_time(remaining / speed_bps);
    }

    return line;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    completed_chunks_ = total_chunks_;
    update(total_, 0);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(std::max<std::size_t>(last_width_, 50), ' ') << "\r" << std::flush;
    last_width_ = 0;
}

std::string ProgressBar::render_bar(double percent) noexcept {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

//=============================================================================
// Formatting
//=============================================================================

std::string format_speed(std::uint64_t bps) noexcept {
    return format_bytes(bps) + "/s";
}

std::string format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    } else if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string format_time(std::uint64_t seconds) noexcept {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace paraloader::cli
