// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/task_store.hpp>
#include <surge/core/error.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <mutex>

namespace surge::core {

namespace fs = std::filesystem;

TaskStore::TaskStore(fs::path ledger_path)
    : path_(std::move(ledger_path)) {}

std::error_code TaskStore::save_task(const DownloadTask& task) {
    std::unique_lock lock(mutex_);
    auto tasks = cached_locked();

    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const DownloadTask& t) { return t.id == task.id; });
    if (it != tasks.end()) {
        *it = task;
    } else {
        tasks.push_back(task);
    }
    return commit_locked(std::move(tasks));
}

std::vector<DownloadTask> TaskStore::load_tasks() {
    {
        std::shared_lock lock(mutex_);
        if (cache_) {
            return *cache_;
        }
    }
    std::unique_lock lock(mutex_);
    return cached_locked();
}

std::error_code TaskStore::update_task(const DownloadTask& task) {
    std::unique_lock lock(mutex_);
    auto tasks = cached_locked();

    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const DownloadTask& t) { return t.id == task.id; });
    if (it == tasks.end()) {
        return {};
    }
    *it = task;
    return commit_locked(std::move(tasks));
}

std::error_code TaskStore::remove_task(const TaskId& id) {
    std::unique_lock lock(mutex_);
    auto tasks = cached_locked();

    auto removed = std::erase_if(tasks, [&](const DownloadTask& t) { return t.id == id; });
    if (removed == 0) {
        return {};
    }
    return commit_locked(std::move(tasks));
}

std::error_code TaskStore::clear_all() {
    std::unique_lock lock(mutex_);
    return commit_locked({});
}

std::optional<DownloadTask> TaskStore::find(const TaskId& id) {
    auto tasks = load_tasks();
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const DownloadTask& t) { return t.id == id; });
    if (it == tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<DownloadTask>& TaskStore::cached_locked() {
    if (!cache_) {
        cache_ = read_file();
    }
    return *cache_;
}

std::error_code TaskStore::commit_locked(std::vector<DownloadTask> tasks) {
    auto ec = write_file(tasks);
    if (ec) {
        spdlog::error("ledger: write to {} failed: {}", path_.string(), ec.message());
        return ec;
    }
    cache_ = std::move(tasks);
    return {};
}

std::vector<DownloadTask> TaskStore::read_file() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return {};
    }

    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            spdlog::warn("ledger: {} is unreadable, starting empty", path_.string());
            return {};
        }

        auto j = nlohmann::json::parse(file);
        const auto& records = j.is_array() ? j : j.at("tasks");

        std::vector<DownloadTask> tasks;
        tasks.reserve(records.size());
        for (const auto& record : records) {
            tasks.push_back(record.get<DownloadTask>());
        }
        spdlog::debug("ledger: loaded {} task(s) from {}", tasks.size(), path_.string());
        return tasks;
    } catch (const std::exception& e) {
        spdlog::warn("ledger: {} is corrupt ({}), starting empty", path_.string(), e.what());
        return {};
    }
}

std::error_code TaskStore::write_file(const std::vector<DownloadTask>& tasks) const {
    try {
        if (path_.has_parent_path()) {
            std::error_code dir_ec;
            fs::create_directories(path_.parent_path(), dir_ec);
            if (dir_ec) {
                return disk::from_system(dir_ec, disk::DiskErrc::invalid_path);
            }
        }

        nlohmann::json j;
        j["version"] = FORMAT_VERSION;
        j["tasks"] = tasks;
        const std::string body = j.dump(2);

        auto tmp_path = path_;
        tmp_path += ".tmp";
        {
            std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << body;
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::error_code rename_ec;
        fs::rename(tmp_path, path_, rename_ec);
        if (rename_ec) {
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            return disk::from_system(rename_ec, disk::DiskErrc::rename_failed);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("ledger: encoding failed: {}", e.what());
        return make_error_code(DownloadErrc::storage_error);
    }
}

} // namespace surge::core
