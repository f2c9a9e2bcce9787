// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace surge::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total, double speed_bps,
                         std::size_t done, std::size_t count) noexcept {
    if (finished_) return;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    // Unknown size: spin instead of drawing a bar
    if (total == 0) {
        line += SPINNER_FRAMES[frame_++ % 4];
        line += " ";
        line += format_bytes(current);
        if (speed_bps > 0) {
            line += " @ " + format_speed(speed_bps);
        }
        line += " [" + std::to_string(done) + "/" + std::to_string(count) + " done]";
    } else {
        line += render(current, total, speed_bps, done, count);
    }

    // Pad over leftovers of a longer previous line
    std::string padded = line;
    if (last_line_.size() > line.size()) {
        padded += std::string(last_line_.size() - line.size(), ' ');
    }
    last_line_ = line;

    std::cout << padded << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    if (!last_line_.empty()) {
        std::cout << std::endl;
    }
}

void ProgressBar::clear() noexcept {
    if (last_line_.empty()) return;
    std::cout << "\r" << std::string(last_line_.size(), ' ') << "\r" << std::flush;
    last_line_.clear();
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t total,
                                double speed_bps, std::size_t done, std::size_t count) {
    double percent = total == 0 ? 0.0
                   : static_cast<double>(current) * 100.0 / static_cast<double>(total);
    percent = std::clamp(percent, 0.0, 100.0);

    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string line = "[";
    line += std::string(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        line += '>';
        line += std::string(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    line += "] ";

    int pct_int = static_cast<int>(percent);
    if (pct_int < 10) line += " ";
    if (pct_int < 100) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (" + format_bytes(current) + "/" + format_bytes(total) + ")";

    if (speed_bps > 0) {
        line += " @ " + format_speed(speed_bps);

        std::uint64_t remaining = current < total ? total - current : 0;
        if (remaining > 0) {
            line += " ETA: " + format_time(static_cast<std::uint64_t>(static_cast<double>(remaining) / speed_bps));
        }
    }

    line += " [" + std::to_string(done) + "/" + std::to_string(count) + " done]";
    return line;
}

std::string ProgressBar::format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    if (bps >= GB) return fixed(bps / GB, 1) + " GB/s";
    if (bps >= MB) return fixed(bps / MB, 1) + " MB/s";
    if (bps >= KB) return fixed(bps / KB, 1) + " KB/s";
    return std::to_string(static_cast<std::uint64_t>(bps)) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    if (bytes >= GB) return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    if (bytes >= MB) return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    if (bytes >= KB) return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace surge::cli
