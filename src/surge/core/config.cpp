// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/config.hpp>
#include <surge/core/error.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace surge::core {

namespace {

namespace fs = std::filesystem;

fs::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return {};
    }
    return fs::path(value);
}

fs::path default_download_directory() {
    if (auto xdg = env_path("XDG_DOWNLOAD_DIR"); !xdg.empty()) {
        return xdg;
    }
    if (auto home = env_path("HOME"); !home.empty()) {
        return home / "Downloads";
    }
    return fs::current_path();
}

fs::path default_temporary_directory() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "surge";
}

fs::path default_ledger_path() {
    if (auto data = env_path("XDG_DATA_HOME"); !data.empty()) {
        return data / "surge" / LEDGER_FILE_NAME;
    }
    if (auto home = env_path("HOME"); !home.empty()) {
        return home / ".local" / "share" / "surge" / LEDGER_FILE_NAME;
    }
    return fs::path(LEDGER_FILE_NAME);
}

} // namespace

ManagerConfig ManagerConfig::defaults() {
    ManagerConfig cfg;
    cfg.download_directory = default_download_directory();
    cfg.temporary_directory = default_temporary_directory();
    cfg.ledger_path = default_ledger_path();
    return cfg;
}

std::expected<ManagerConfig, std::error_code>
parse_config(std::string_view json, ManagerConfig base) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(disk::DiskErrc::corrupt_record));
        }

        if (j.contains("maxConcurrentDownloads")) {
            base.max_concurrent_downloads = j["maxConcurrentDownloads"].get<std::uint32_t>();
        }
        if (j.contains("maxQueueSize")) {
            base.max_queue_size = j["maxQueueSize"].get<std::size_t>();
        }
        if (j.contains("maxRetryAttempts")) {
            base.max_retry_attempts = j["maxRetryAttempts"].get<std::uint32_t>();
        }
        if (j.contains("allowsCellularAccess")) {
            base.allows_cellular_access = j["allowsCellularAccess"].get<bool>();
        }
        if (j.contains("downloadDirectory")) {
            base.download_directory = j["downloadDirectory"].get<std::string>();
        }
        if (j.contains("temporaryDirectory")) {
            base.temporary_directory = j["temporaryDirectory"].get<std::string>();
        }
        if (j.contains("ledgerPath")) {
            base.ledger_path = j["ledgerPath"].get<std::string>();
        }
        if (j.contains("minFreeDiskSpace")) {
            base.min_free_disk_space = j["minFreeDiskSpace"].get<std::uint64_t>();
        }
        if (j.contains("timeoutInterval")) {
            base.timeout_interval = std::chrono::seconds{j["timeoutInterval"].get<std::int64_t>()};
        }
        if (j.contains("pollIntervalMs")) {
            base.poll_interval = std::chrono::milliseconds{j["pollIntervalMs"].get<std::int64_t>()};
        }

        if (base.max_concurrent_downloads == 0 || base.max_queue_size == 0) {
            spdlog::error("config: maxConcurrentDownloads and maxQueueSize must be at least 1");
            return std::unexpected(make_error_code(disk::DiskErrc::corrupt_record));
        }

        return base;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::corrupt_record));
    }
}

std::expected<ManagerConfig, std::error_code>
load_config(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_config(ss.str(), ManagerConfig::defaults());
    } catch (const std::exception& e) {
        spdlog::error("config: failed to read {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace surge::core
