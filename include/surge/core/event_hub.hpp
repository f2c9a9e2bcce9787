// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/download_task.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace surge::core {

struct ProgressEvent {
    TaskId id;
    double progress{0.0};
    double speed{0.0};

    bool operator==(const ProgressEvent&) const = default;
};

struct StateChangeEvent {
    TaskId id;
    DownloadState state{DownloadState::queued};

    bool operator==(const StateChangeEvent&) const = default;
};

struct ErrorEvent {
    TaskId id;
    std::string message;

    bool operator==(const ErrorEvent&) const = default;
};

struct QueueUpdatedEvent {
    std::vector<DownloadTask> tasks;

    bool operator==(const QueueUpdatedEvent&) const = default;
};

using DownloadEvent = std::variant<ProgressEvent, StateChangeEvent, ErrorEvent, QueueUpdatedEvent>;

// Id of the task an event refers to; empty for queue-wide events
[[nodiscard]] std::optional<TaskId> event_task_id(const DownloadEvent& event);

// Keeps a handler registered until destroyed or reset
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release) noexcept
        : release_(std::move(release)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept
        : release_(std::exchange(other.release_, nullptr)) {}
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            release_ = std::exchange(other.release_, nullptr);
        }
        return *this;
    }

    // After reset() returns the handler is never called again
    void reset() noexcept;

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

// Broadcast channel of download events plus the live snapshot of all known tasks.
//
// Events reach every current subscriber in emission order and are not replayed
// to later subscribers. Snapshot subscribers get the current snapshot on
// subscription and again after every task mutation. The task map is the
// authoritative in-memory view of task state.
class EventHub {
public:
    using EventHandler = std::function<void(const DownloadEvent&)>;
    using SnapshotHandler = std::function<void(const std::vector<DownloadTask>&)>;
    using TaskMutation = std::function<bool(DownloadTask&)>;

    EventHub();
    ~EventHub();

    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    [[nodiscard]] Subscription subscribe(EventHandler handler);
    [[nodiscard]] Subscription subscribe_snapshot(SnapshotHandler handler);

    void emit_progress(const TaskId& id, double progress, double speed);
    void emit_state_change(const TaskId& id, DownloadState state);
    void emit_error(const TaskId& id, std::string message);
    void emit_queue_updated(std::vector<DownloadTask> tasks);

    // Snapshot mutations
    void update_task(const DownloadTask& task);
    void update_tasks(const std::vector<DownloadTask>& tasks);
    void remove_task(const TaskId& id);
    void remove_tasks(const std::vector<TaskId>& ids);
    void clear_all_tasks();

    // Read-modify-write of one task under the snapshot lock. The mutation
    // returns false to leave the task untouched. Returns the stored value, or
    // nothing if the task is unknown or the mutation declined.
    std::optional<DownloadTask> modify_task(const TaskId& id, const TaskMutation& mutation);

    // Snapshot queries, ordered by creation time
    [[nodiscard]] std::vector<DownloadTask> all_tasks() const;
    [[nodiscard]] std::vector<DownloadTask> tasks_in_state(DownloadState state) const;
    [[nodiscard]] std::optional<DownloadTask> task(const TaskId& id) const;
    [[nodiscard]] bool has_task(const TaskId& id) const;

    [[nodiscard]] std::size_t subscriber_count() const;

private:
    struct Registry;

    void publish(const DownloadEvent& event);

    // Apply a mutation to the task map and notify snapshot subscribers
    template<typename Mutation>
    void mutate(Mutation&& mutation);

    [[nodiscard]] std::vector<DownloadTask> ordered_locked() const;

    std::shared_ptr<Registry> registry_;
    std::map<TaskId, DownloadTask> tasks_;
    mutable std::shared_mutex tasks_mutex_;
};

} // namespace surge::core
