// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace surge::core {

class Url;

// Textual UUID, unique across process lifetimes
using TaskId = std::string;

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

enum class DownloadState : std::uint8_t {
    queued,      // Waiting for a capacity slot
    downloading, // Owned by the transport
    paused,      // Suspended by user or connectivity loss
    completed,   // File moved into the download directory
    failed,      // Transport or file error, see DownloadTask::error
    cancelled    // Cancelled by user
};

// Ordered for queue placement only
enum class DownloadPriority : std::uint8_t {
    low = 0,
    normal = 1,
    high = 2,
    critical = 3
};

[[nodiscard]] std::string_view to_string(DownloadState state) noexcept;
[[nodiscard]] std::string_view to_string(DownloadPriority priority) noexcept;
[[nodiscard]] std::optional<DownloadState> parse_state(std::string_view text) noexcept;
[[nodiscard]] std::optional<DownloadPriority> parse_priority(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_terminal(DownloadState state) noexcept {
    return state == DownloadState::completed
        || state == DownloadState::failed
        || state == DownloadState::cancelled;
}

// Relative weight handed to transports that support prioritisation (0.25 .. 1.0)
[[nodiscard]] constexpr double transport_weight(DownloadPriority priority) noexcept {
    switch (priority) {
        case DownloadPriority::low:      return 0.25;
        case DownloadPriority::normal:   return 0.5;
        case DownloadPriority::high:     return 0.75;
        case DownloadPriority::critical: return 1.0;
    }
    return 0.5;
}

// One requested transfer and its mutable state
struct DownloadTask {
    TaskId id;
    std::string source;
    std::string file_name;
    DownloadPriority priority{DownloadPriority::normal};
    DownloadState state{DownloadState::queued};
    double progress{0.0};                 // [0.0, 1.0]
    std::uint64_t expected_bytes{0};
    std::uint64_t downloaded_bytes{0};
    double speed{0.0};                    // Bytes per second, informational
    Timestamp created_at{};
    std::optional<std::string> error;     // Only set when state == failed

    // New queued task; file_name defaults to the last path segment of source
    [[nodiscard]] static DownloadTask create(const Url& source,
                                             std::string_view file_name = {},
                                             DownloadPriority priority = DownloadPriority::normal);

    bool operator==(const DownloadTask&) const = default;
};

// Random version-4 UUID in canonical 8-4-4-4-12 form
[[nodiscard]] TaskId generate_task_id();

// Where the transport keeps the in-progress bytes for a task
[[nodiscard]] std::filesystem::path partial_file_path(const std::filesystem::path& temporary_directory,
                                                      const DownloadTask& task);

void to_json(nlohmann::json& j, const DownloadTask& task);
void from_json(const nlohmann::json& j, DownloadTask& task);

} // namespace surge::core
