// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_queue.hpp>
#include <algorithm>
#include <mutex>

namespace surge::core {

DownloadQueue::DownloadQueue(std::size_t max_size) noexcept
    : max_size_(max_size) {}

bool DownloadQueue::enqueue(DownloadTask task) {
    std::unique_lock lock(mutex_);

    auto same_id = [&](const DownloadTask& t) { return t.id == task.id; };
    auto existing = std::find_if(entries_.begin(), entries_.end(), same_id);

    // A replacement never grows the queue, so only a new id can hit the bound
    if (existing == entries_.end() && entries_.size() >= max_size_) {
        return false;
    }
    if (existing != entries_.end()) {
        entries_.erase(existing);
    }

    auto position = std::find_if(entries_.begin(), entries_.end(), [&](const DownloadTask& t) {
        return static_cast<int>(t.priority) < static_cast<int>(task.priority);
    });
    entries_.insert(position, std::move(task));
    return true;
}

std::optional<DownloadTask> DownloadQueue::dequeue() {
    std::unique_lock lock(mutex_);
    if (entries_.empty()) {
        return std::nullopt;
    }
    DownloadTask front = std::move(entries_.front());
    entries_.pop_front();
    return front;
}

bool DownloadQueue::remove(const TaskId& id) {
    std::unique_lock lock(mutex_);
    return std::erase_if(entries_, [&](const DownloadTask& t) { return t.id == id; }) > 0;
}

bool DownloadQueue::update_task(const DownloadTask& task) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const DownloadTask& t) { return t.id == task.id; });
    if (it == entries_.end()) {
        return false;
    }
    *it = task;
    return true;
}

std::vector<DownloadTask> DownloadQueue::tasks() const {
    std::shared_lock lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

bool DownloadQueue::contains(const TaskId& id) const {
    std::shared_lock lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const DownloadTask& t) { return t.id == id; });
}

std::size_t DownloadQueue::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool DownloadQueue::empty() const {
    std::shared_lock lock(mutex_);
    return entries_.empty();
}

void DownloadQueue::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

} // namespace surge::core
