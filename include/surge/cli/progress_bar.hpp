// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace surge::cli {

// Single-line aggregate progress bar for the CLI
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw with the combined totals of every tracked task
    void update(std::uint64_t current, std::uint64_t total, double speed_bps,
                std::size_t done, std::size_t count) noexcept;

    void finish() noexcept;

    // Erase the bar so a log line can be printed in its place
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] static std::string render(std::uint64_t current, std::uint64_t total,
                                            double speed_bps, std::size_t done, std::size_t count);
    [[nodiscard]] static std::string format_speed(double bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::string label_;
    std::string last_line_;
    std::size_t frame_{0};
    bool finished_{false};
};

} // namespace surge::cli
