// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <compare>
#include <cstdint>
#include <string>

// Normally set by the build from the project version
#ifndef SURGE_VERSION_MAJOR
#define SURGE_VERSION_MAJOR 0
#define SURGE_VERSION_MINOR 3
#define SURGE_VERSION_PATCH 0
#endif

namespace surge {

struct Version {
    std::uint32_t major{0};
    std::uint32_t minor{0};
    std::uint32_t patch{0};

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] constexpr std::uint64_t to_number() const noexcept {
        return (static_cast<std::uint64_t>(major) << 32)
             | (static_cast<std::uint64_t>(minor) << 16)
             | static_cast<std::uint64_t>(patch);
    }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

inline constexpr Version version{SURGE_VERSION_MAJOR, SURGE_VERSION_MINOR, SURGE_VERSION_PATCH};

// "surge/<version>", sent as the HTTP User-Agent
[[nodiscard]] inline std::string user_agent() {
    return "surge/" + version.to_string();
}

// Compiler date and time of the translation unit that asks
[[nodiscard]] inline std::string build_stamp() {
    return std::string(__DATE__) + " " + __TIME__;
}

} // namespace surge
