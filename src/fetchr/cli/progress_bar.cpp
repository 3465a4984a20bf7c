// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fetchr::cli {

namespace {

constexpr int BAR_WIDTH = 30;

std::string scaled(double value, int precision, const char* unit) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << ' ' << unit;
    return ss.str();
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    // Unknown size: redraw every time with bytes only
    std::uint64_t percent = total_ == 0 ? 0 : std::min<std::uint64_t>(current * 100 / total_, 100);

    // Only redraw if significant progress (every 1%)
    if (total_ != 0 && drawn_ && percent <= last_percent_ && !finished_) return;
    last_percent_ = percent;
    drawn_ = true;

    try {
        std::cout << render_line(current, speed_bps) << std::flush;
    } catch (const std::exception&) {
        // Terminal output is best effort
    }
}

std::string ProgressBar::render_line(std::uint64_t current, std::uint64_t speed_bps) const {
    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total_ > 0) {
        double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);
        line += render_bar(percent);

        auto pct_int = static_cast<int>(percent);
        line += ' ';
        if (pct_int < 10) line += ' ';
        if (pct_int < 100) line += ' ';
        line += std::to_string(pct_int) + "%";

        line += " (";
        line += format_bytes(current);
        line += "/";
        line += format_bytes(total_);
        line += ")";
    } else {
        line += format_bytes(current);
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }

    if (speed_bps > 0 && total_ > current) {
        line += " ETA: ";
        line += format_time((total_ - current) / speed_bps);
    }

    // Clear rest of line
    line += std::string(10, ' ');
    return line;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_, 0);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) noexcept {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    bar += ']';
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) return scaled(static_cast<double>(bps) / GB, 1, "GB/s");
    if (bps >= MB) return scaled(static_cast<double>(bps) / MB, 1, "MB/s");
    if (bps >= KB) return scaled(static_cast<double>(bps) / KB, 1, "KB/s");
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) noexcept {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return scaled(static_cast<double>(bytes) / TB, 2, "TB");
    if (bytes >= GB) return scaled(static_cast<double>(bytes) / GB, 2, "GB");
    if (bytes >= MB) return scaled(static_cast<double>(bytes) / MB, 1, "MB");
    if (bytes >= KB) return scaled(static_cast<double>(bytes) / KB, 0, "KB");
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) noexcept {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m " << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace fetchr::cli
