// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/channel.hpp>
#include <surge/core/config.hpp>
#include <surge/core/download_queue.hpp>
#include <surge/core/download_task.hpp>
#include <surge/core/error.hpp>
#include <surge/core/event_hub.hpp>
#include <surge/core/task_store.hpp>
#include <surge/core/transport.hpp>
#include <surge/core/url.hpp>
#include <surge/disk/file_ops.hpp>
#include <surge/net/connectivity.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <stop_token>
#include <variant>
#include <vector>

namespace surge::core {

// One entry of a batch submission
struct DownloadRequest {
    std::string source;
    std::string file_name;    // Empty: derive from source
    DownloadPriority priority{DownloadPriority::normal};
};

// Coordinates the task lifecycle across the ledger, the pending queue, the
// event hub and the transport.
//
// The manager owns none of its collaborators; they must outlive it. Transport
// and connectivity notifications are posted to an internal channel and applied
// by the message pump, so task records are only ever advanced here.
class DownloadManager {
public:
    using ProgressHandler = std::function<void(double progress, double speed)>;
    using StateHandler = std::function<void(DownloadState state)>;
    using ErrorHandler = std::function<void(const std::string& message)>;
    using TaskHandler = std::function<void(const DownloadTask& task)>;

    // Reconciles the persisted ledger before returning
    DownloadManager(ManagerConfig config,
                    TaskStore& store,
                    DownloadQueue& queue,
                    EventHub& events,
                    Transport& transport,
                    net::ConnectivityMonitor* connectivity = nullptr,
                    disk::SpaceProbe space_probe = disk::available_space);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;
    DownloadManager(DownloadManager&&) = delete;
    DownloadManager& operator=(DownloadManager&&) = delete;

    // Launch the admission loop and the message pump
    void start();

    // Stop both loops; in-flight transfers are left to the transport
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    //-------------------------------------------------------------------------
    // Submission and control
    //-------------------------------------------------------------------------

    // Validate, persist, enqueue and publish a new task.
    // Fails with invalid_url for unparsable or non-https sources and with
    // insufficient_storage when the download volume is below the free-space floor.
    [[nodiscard]] std::expected<DownloadTask, std::error_code>
    submit(std::string_view source,
           std::string_view file_name = {},
           DownloadPriority priority = DownloadPriority::normal,
           ProgressHandler on_progress = {});

    // Submit every request concurrently; results are in request order
    [[nodiscard]] std::vector<std::expected<DownloadTask, std::error_code>>
    download_multiple(const std::vector<DownloadRequest>& requests);

    // No-op unless the task is downloading
    [[nodiscard]] std::error_code pause(const TaskId& id);

    // No-op unless the task is paused
    [[nodiscard]] std::error_code resume(const TaskId& id);

    // No-op for unknown or terminal tasks
    [[nodiscard]] std::error_code cancel(const TaskId& id);

    [[nodiscard]] std::error_code remove_completed_downloads();

    //-------------------------------------------------------------------------
    // Observation
    //-------------------------------------------------------------------------

    [[nodiscard]] Subscription subscribe(EventHub::EventHandler handler);
    [[nodiscard]] Subscription subscribe_snapshot(EventHub::SnapshotHandler handler);
    [[nodiscard]] Subscription subscribe_task(const TaskId& id, TaskHandler handler);
    [[nodiscard]] Subscription subscribe_progress(const TaskId& id, ProgressHandler handler);
    [[nodiscard]] Subscription subscribe_state(const TaskId& id, StateHandler handler);
    [[nodiscard]] Subscription subscribe_errors(const TaskId& id, ErrorHandler handler);

    [[nodiscard]] std::vector<DownloadTask> snapshot() const { return events_.all_tasks(); }
    [[nodiscard]] std::optional<DownloadTask> task(const TaskId& id) const { return events_.task(id); }

    [[nodiscard]] std::size_t active_count() const;
    [[nodiscard]] bool online() const noexcept { return online_.load(std::memory_order_acquire); }
    [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

    //-------------------------------------------------------------------------
    // Single steps of the background loops
    //-------------------------------------------------------------------------

    // One admission tick. Returns true if a task was handed to the transport.
    bool admit_next();

    // Apply every pending transport and connectivity message; returns how many
    std::size_t process_messages();

private:
    struct ConnectivityChanged {
        bool online{true};
    };

    using Message = std::variant<TransferProgress, TransferFinished, TransferFailed, ConnectivityChanged>;

    struct ActiveTransfer {
        TransferHandle handle{0};
        std::chrono::steady_clock::time_point last_progress;
        std::chrono::steady_clock::time_point last_persist;
    };

    void restore_session();

    [[nodiscard]] std::expected<Url, std::error_code> validate(std::string_view source) const;

    // Hand a dequeued task to the transport (or wake its suspended transfer)
    void start_transfer(const DownloadTask& task);

    // Drive a task to failed with message; terminal tasks are left alone
    void fail_task(const TaskId& id, const std::string& message);

    // Write the hub's current value of id to the ledger
    [[nodiscard]] std::error_code persist(const TaskId& id);

    void handle(Message message);
    void on_progress(const TransferProgress& message);
    void on_finished(const TransferFinished& message);
    void on_failed(const TransferFailed& message);
    void on_connectivity(bool online);

    // Claim the transfer of id, running or suspended; empty if it has none
    [[nodiscard]] std::optional<TransferHandle> claim_transfer(const TaskId& id);

    void publish_queue();

    // Enqueue a task the hub already holds as queued and announce it
    void announce_queued(const DownloadTask& task);
    void keep_subscription(const TaskId& id, Subscription subscription);
    void drop_subscriptions(const TaskId& id);

    void admission_loop(std::stop_token stoken);
    void pump_loop(std::stop_token stoken);

    ManagerConfig config_;
    TaskStore& store_;
    DownloadQueue& queue_;
    EventHub& events_;
    Transport& transport_;
    net::ConnectivityMonitor* connectivity_;
    disk::SpaceProbe space_probe_;

    Channel<Message> inbox_;

    std::map<TaskId, ActiveTransfer> active_;
    std::map<TaskId, TransferHandle> suspended_;
    mutable std::mutex transfers_mutex_;

    std::mutex admission_mutex_;   // One admission tick at a time

    std::map<TaskId, std::vector<Subscription>> task_subscriptions_;
    std::mutex subscriptions_mutex_;

    std::atomic<bool> online_{true};
    std::atomic<bool> running_{false};

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread admission_thread_;
    std::jthread pump_thread_;
};

} // namespace surge::core
