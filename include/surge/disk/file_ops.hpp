// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <system_error>

namespace surge::disk {

// Free bytes available to this process on the volume holding a path
using SpaceProbe = std::function<std::expected<std::uint64_t, std::error_code>(const std::filesystem::path&)>;

// Probe the volume of path, or of its nearest existing ancestor
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
available_space(const std::filesystem::path& path) noexcept;

// Move a finished download to its destination, creating parent directories.
// Falls back to copy + remove across filesystems; an existing file is replaced.
[[nodiscard]] std::error_code move_into_place(const std::filesystem::path& from,
                                              const std::filesystem::path& to) noexcept;

// Remove a file; a missing file is not an error
[[nodiscard]] std::error_code remove_file(const std::filesystem::path& path) noexcept;

} // namespace surge::disk
