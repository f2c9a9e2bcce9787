// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace surge::core {

constexpr std::uint32_t DEFAULT_MAX_CONCURRENT_DOWNLOADS = 3;
constexpr std::size_t DEFAULT_MAX_QUEUE_SIZE = 100;
constexpr std::uint32_t DEFAULT_MAX_RETRY_ATTEMPTS = 3;
constexpr std::uint64_t DEFAULT_MIN_FREE_DISK_SPACE = 1024ULL * 1024 * 1024;   // 1 GiB
constexpr std::chrono::seconds DEFAULT_TIMEOUT{60};

constexpr std::chrono::milliseconds ADMISSION_POLL_INTERVAL{1000};
constexpr std::chrono::seconds PROGRESS_PERSIST_INTERVAL{5};
constexpr std::chrono::milliseconds PROGRESS_REPORT_INTERVAL{250};
constexpr std::chrono::seconds CONNECTIVITY_PROBE_INTERVAL{5};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;
constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;           // 256 KB

constexpr std::string_view LEDGER_FILE_NAME = "downloads.json";
constexpr std::string_view PARTIAL_EXTENSION = ".part";

// Runtime options for the download manager
struct ManagerConfig {
    std::uint32_t max_concurrent_downloads{DEFAULT_MAX_CONCURRENT_DOWNLOADS};
    std::size_t max_queue_size{DEFAULT_MAX_QUEUE_SIZE};
    std::uint32_t max_retry_attempts{DEFAULT_MAX_RETRY_ATTEMPTS};  // Declared only, no automatic retry
    bool allows_cellular_access{true};
    std::filesystem::path download_directory;
    std::filesystem::path temporary_directory;
    std::filesystem::path ledger_path;
    std::uint64_t min_free_disk_space{DEFAULT_MIN_FREE_DISK_SPACE};
    std::chrono::seconds timeout_interval{DEFAULT_TIMEOUT};
    std::chrono::milliseconds poll_interval{ADMISSION_POLL_INTERVAL};

    // Defaults with platform-standard directories filled in
    [[nodiscard]] static ManagerConfig defaults();
};

// Overlay a JSON config file on top of ManagerConfig::defaults()
[[nodiscard]] std::expected<ManagerConfig, std::error_code>
load_config(const std::filesystem::path& path) noexcept;

// Overlay a JSON document (already read) on top of base
[[nodiscard]] std::expected<ManagerConfig, std::error_code>
parse_config(std::string_view json, ManagerConfig base) noexcept;

} // namespace surge::core
