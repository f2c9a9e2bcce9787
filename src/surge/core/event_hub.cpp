// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/event_hub.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace surge::core {

//=============================================================================
// Registry
//=============================================================================

struct EventHub::Registry {
    // Held for the whole delivery of one event so deliveries never interleave.
    // Recursive so a handler may emit, mutate or unsubscribe on its own thread.
    std::recursive_mutex dispatch_mutex;

    std::mutex handlers_mutex;
    std::uint64_t next_id{1};
    std::map<std::uint64_t, EventHandler> event_handlers;
    std::map<std::uint64_t, SnapshotHandler> snapshot_handlers;

    void release(std::uint64_t id) {
        std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex);
        std::lock_guard<std::mutex> lock(handlers_mutex);
        event_handlers.erase(id);
        snapshot_handlers.erase(id);
    }
};

namespace {

template<typename Handler, typename Arg>
void deliver(const std::vector<Handler>& handlers, const Arg& arg) {
    for (const auto& handler : handlers) {
        try {
            handler(arg);
        } catch (const std::exception& e) {
            spdlog::warn("event hub: subscriber threw: {}", e.what());
        }
    }
}

} // namespace

std::optional<TaskId> event_task_id(const DownloadEvent& event) {
    return std::visit([](const auto& e) -> std::optional<TaskId> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, QueueUpdatedEvent>) {
            return std::nullopt;
        } else {
            return e.id;
        }
    }, event);
}

void Subscription::reset() noexcept {
    if (release_) {
        auto release = std::exchange(release_, nullptr);
        release();
    }
}

//=============================================================================
// EventHub
//=============================================================================

EventHub::EventHub()
    : registry_(std::make_shared<Registry>()) {}

EventHub::~EventHub() = default;

template<typename Mutation>
void EventHub::mutate(Mutation&& mutation) {
    std::lock_guard<std::recursive_mutex> dispatch(registry_->dispatch_mutex);

    std::vector<DownloadTask> snapshot;
    {
        std::unique_lock lock(tasks_mutex_);
        mutation(tasks_);
        snapshot = ordered_locked();
    }

    std::vector<SnapshotHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(registry_->handlers_mutex);
        handlers.reserve(registry_->snapshot_handlers.size());
        for (const auto& [id, handler] : registry_->snapshot_handlers) {
            handlers.push_back(handler);
        }
    }
    deliver(handlers, snapshot);
}

Subscription EventHub::subscribe(EventHandler handler) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(registry_->handlers_mutex);
        id = registry_->next_id++;
        registry_->event_handlers.emplace(id, std::move(handler));
    }

    std::weak_ptr<Registry> weak = registry_;
    return Subscription([weak, id] {
        if (auto registry = weak.lock()) {
            registry->release(id);
        }
    });
}

Subscription EventHub::subscribe_snapshot(SnapshotHandler handler) {
    std::lock_guard<std::recursive_mutex> dispatch(registry_->dispatch_mutex);

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(registry_->handlers_mutex);
        id = registry_->next_id++;
        registry_->snapshot_handlers.emplace(id, handler);
    }

    // Current value first, like a value subject
    deliver(std::vector<SnapshotHandler>{handler}, all_tasks());

    std::weak_ptr<Registry> weak = registry_;
    return Subscription([weak, id] {
        if (auto registry = weak.lock()) {
            registry->release(id);
        }
    });
}

void EventHub::emit_progress(const TaskId& id, double progress, double speed) {
    publish(ProgressEvent{id, progress, speed});
}

void EventHub::emit_state_change(const TaskId& id, DownloadState state) {
    publish(StateChangeEvent{id, state});
}

void EventHub::emit_error(const TaskId& id, std::string message) {
    publish(ErrorEvent{id, std::move(message)});
}

void EventHub::emit_queue_updated(std::vector<DownloadTask> tasks) {
    publish(QueueUpdatedEvent{std::move(tasks)});
}

void EventHub::update_task(const DownloadTask& task) {
    mutate([&](std::map<TaskId, DownloadTask>& tasks) {
        tasks.insert_or_assign(task.id, task);
    });
}

void EventHub::update_tasks(const std::vector<DownloadTask>& updates) {
    mutate([&](std::map<TaskId, DownloadTask>& tasks) {
        for (const auto& task : updates) {
            tasks.insert_or_assign(task.id, task);
        }
    });
}

void EventHub::remove_task(const TaskId& id) {
    mutate([&](std::map<TaskId, DownloadTask>& tasks) {
        tasks.erase(id);
    });
}

void EventHub::remove_tasks(const std::vector<TaskId>& ids) {
    mutate([&](std::map<TaskId, DownloadTask>& tasks) {
        for (const auto& id : ids) {
            tasks.erase(id);
        }
    });
}

void EventHub::clear_all_tasks() {
    mutate([](std::map<TaskId, DownloadTask>& tasks) {
        tasks.clear();
    });
}

std::optional<DownloadTask> EventHub::modify_task(const TaskId& id, const TaskMutation& mutation) {
    std::optional<DownloadTask> result;
    mutate([&](std::map<TaskId, DownloadTask>& tasks) {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return;
        }
        DownloadTask candidate = it->second;
        if (mutation(candidate)) {
            it->second = candidate;
            result = std::move(candidate);
        }
    });
    return result;
}

std::vector<DownloadTask> EventHub::all_tasks() const {
    std::shared_lock lock(tasks_mutex_);
    return ordered_locked();
}

std::vector<DownloadTask> EventHub::tasks_in_state(DownloadState state) const {
    auto tasks = all_tasks();
    std::erase_if(tasks, [state](const DownloadTask& t) { return t.state != state; });
    return tasks;
}

std::optional<DownloadTask> EventHub::task(const TaskId& id) const {
    std::shared_lock lock(tasks_mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool EventHub::has_task(const TaskId& id) const {
    std::shared_lock lock(tasks_mutex_);
    return tasks_.contains(id);
}

std::size_t EventHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(registry_->handlers_mutex);
    return registry_->event_handlers.size() + registry_->snapshot_handlers.size();
}

void EventHub::publish(const DownloadEvent& event) {
    std::lock_guard<std::recursive_mutex> dispatch(registry_->dispatch_mutex);

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(registry_->handlers_mutex);
        handlers.reserve(registry_->event_handlers.size());
        for (const auto& [id, handler] : registry_->event_handlers) {
            handlers.push_back(handler);
        }
    }
    deliver(handlers, event);
}

std::vector<DownloadTask> EventHub::ordered_locked() const {
    std::vector<DownloadTask> result;
    result.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        result.push_back(task);
    }
    std::stable_sort(result.begin(), result.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.created_at < b.created_at;
    });
    return result;
}

} // namespace surge::core
