// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/download_task.hpp>
#include <cstddef>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace surge::core {

// Bounded list of pending tasks, highest priority first, FIFO within a priority.
// There is no aging: low priority entries wait as long as higher ones keep arriving.
class DownloadQueue {
public:
    explicit DownloadQueue(std::size_t max_size = DEFAULT_MAX_QUEUE_SIZE) noexcept;

    DownloadQueue(const DownloadQueue&) = delete;
    DownloadQueue& operator=(const DownloadQueue&) = delete;

    // Insert before the first entry of strictly lower priority.
    // Returns false (and leaves the queue unchanged) when the queue is full.
    // An entry with the same id is replaced.
    bool enqueue(DownloadTask task);

    [[nodiscard]] std::optional<DownloadTask> dequeue();

    // Drop the entry with this id; returns false if there was none
    bool remove(const TaskId& id);

    // Overwrite the entry with task.id in place; returns false if absent
    bool update_task(const DownloadTask& task);

    [[nodiscard]] std::vector<DownloadTask> tasks() const;
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return max_size_; }

    void clear();

private:
    std::deque<DownloadTask> entries_;
    std::size_t max_size_;
    mutable std::shared_mutex mutex_;
};

} // namespace surge::core
