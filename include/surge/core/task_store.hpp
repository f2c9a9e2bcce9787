// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/download_task.hpp>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <system_error>
#include <vector>

namespace surge::core {

// Durable ledger of every known task, one JSON document on disk.
//
// Every mutation rewrites the whole document through a temporary file and an
// atomic rename, then updates the in-memory cache. If the process dies between
// the two, the file on disk is what the next load_tasks() sees.
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path ledger_path);

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // Append a task; a record with the same id is replaced
    [[nodiscard]] std::error_code save_task(const DownloadTask& task);

    // All persisted tasks; an unreadable or corrupt ledger yields an empty list
    [[nodiscard]] std::vector<DownloadTask> load_tasks();

    // Replace the record with task.id; unknown ids are ignored
    [[nodiscard]] std::error_code update_task(const DownloadTask& task);

    [[nodiscard]] std::error_code remove_task(const TaskId& id);

    [[nodiscard]] std::error_code clear_all();

    [[nodiscard]] std::optional<DownloadTask> find(const TaskId& id);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Current on-disk encoding version
    static constexpr int FORMAT_VERSION = 1;

private:
    // Populate cache_ from disk if needed (caller holds the unique lock)
    std::vector<DownloadTask>& cached_locked();

    // Persist tasks durably, then adopt them as the cache (caller holds the unique lock)
    [[nodiscard]] std::error_code commit_locked(std::vector<DownloadTask> tasks);

    [[nodiscard]] std::vector<DownloadTask> read_file() const;
    [[nodiscard]] std::error_code write_file(const std::vector<DownloadTask>& tasks) const;

    std::filesystem::path path_;
    std::optional<std::vector<DownloadTask>> cache_;
    mutable std::shared_mutex mutex_;
};

} // namespace surge::core
