// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_manager.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <future>

namespace surge::core {

namespace fs = std::filesystem;

namespace {

// Strip any directory part a caller put into a file name
std::string sanitize_file_name(std::string_view file_name) {
    if (file_name.empty()) {
        return {};
    }
    auto name = fs::path(std::string(file_name)).filename().string();
    if (name == "." || name == "..") {
        return {};
    }
    return name;
}

} // namespace

//=============================================================================
// DownloadManager
//=============================================================================

DownloadManager::DownloadManager(ManagerConfig config,
                                 TaskStore& store,
                                 DownloadQueue& queue,
                                 EventHub& events,
                                 Transport& transport,
                                 net::ConnectivityMonitor* connectivity,
                                 disk::SpaceProbe space_probe)
    : config_(std::move(config))
    , store_(store)
    , queue_(queue)
    , events_(events)
    , transport_(transport)
    , connectivity_(connectivity)
    , space_probe_(std::move(space_probe)) {
    if (config_.max_concurrent_downloads == 0) {
        config_.max_concurrent_downloads = 1;
    }

    transport_.bind([this](TransportMessage message) {
        std::visit([this](auto&& m) { inbox_.push(Message{std::move(m)}); }, std::move(message));
    });

    if (connectivity_) {
        online_.store(connectivity_->online(), std::memory_order_release);
        connectivity_->set_listener([this](bool online) {
            inbox_.push(ConnectivityChanged{online});
        });
    }

    restore_session();
}

DownloadManager::~DownloadManager() {
    stop();
    if (connectivity_) {
        connectivity_->set_listener({});
    }
    transport_.bind({});
    inbox_.close();
}

void DownloadManager::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pump_thread_ = std::jthread([this](std::stop_token stoken) {
        pump_loop(stoken);
    });
    admission_thread_ = std::jthread([this](std::stop_token stoken) {
        admission_loop(stoken);
    });
    spdlog::debug("manager: started (max {} concurrent, poll {} ms)",
                  config_.max_concurrent_downloads, config_.poll_interval.count());
}

void DownloadManager::stop() noexcept {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    admission_thread_.request_stop();
    pump_thread_.request_stop();
    if (admission_thread_.joinable()) {
        admission_thread_.join();
    }
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }
}

//=============================================================================
// Reconciliation
//=============================================================================

void DownloadManager::restore_session() {
    auto persisted = store_.load_tasks();
    std::vector<DownloadTask> known;
    std::vector<DownloadTask> pending;
    known.reserve(persisted.size());

    for (auto& task : persisted) {
        switch (task.state) {
            case DownloadState::downloading:
            case DownloadState::queued:
                task.state = DownloadState::queued;
                task.speed = 0.0;
                break;
            case DownloadState::paused:
                break;
            case DownloadState::completed: {
                std::error_code ec;
                if (fs::exists(config_.download_directory / task.file_name, ec)) {
                    known.push_back(task);
                    continue;
                }
                spdlog::info("manager: {} is missing, downloading {} again", task.file_name, task.id);
                task.state = DownloadState::queued;
                task.progress = 0.0;
                task.downloaded_bytes = 0;
                task.speed = 0.0;
                break;
            }
            case DownloadState::failed:
            case DownloadState::cancelled:
                if (auto ec = store_.remove_task(task.id)) {
                    spdlog::error("manager: could not drop {} from the ledger: {}", task.id, ec.message());
                }
                continue;
        }

        if (auto ec = store_.update_task(task)) {
            spdlog::error("manager: could not persist restored task {}: {}", task.id, ec.message());
        }
        pending.push_back(task);
        known.push_back(task);
    }

    // The hub must know a task before admission can dequeue it
    events_.update_tasks(known);
    for (const auto& task : pending) {
        if (!queue_.enqueue(task)) {
            spdlog::warn("manager: queue full, restored task {} stays {}", task.id, to_string(task.state));
        }
    }
    if (!known.empty()) {
        spdlog::info("manager: restored {} task(s), {} pending", known.size(), queue_.size());
        publish_queue();
    }
}

//=============================================================================
// Submission
//=============================================================================

std::expected<Url, std::error_code> DownloadManager::validate(std::string_view source) const {
    auto url = Url::parse(source);
    if (!url || !url->is_secure()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto space = space_probe_(config_.download_directory);
    if (!space) {
        return std::unexpected(space.error());
    }
    if (*space <= config_.min_free_disk_space) {
        return std::unexpected(make_error_code(DownloadErrc::insufficient_storage));
    }
    return url;
}

std::expected<DownloadTask, std::error_code>
DownloadManager::submit(std::string_view source,
                        std::string_view file_name,
                        DownloadPriority priority,
                        ProgressHandler on_progress) {
    auto url = validate(source);
    if (!url) {
        spdlog::warn("manager: rejected {}: {}", source, url.error().message());
        return std::unexpected(url.error());
    }
    auto task = DownloadTask::create(*url, sanitize_file_name(file_name), priority);

    if (store_.save_task(task)) {
        return std::unexpected(make_error_code(DownloadErrc::storage_error));
    }

    if (on_progress) {
        keep_subscription(task.id, subscribe_progress(task.id, std::move(on_progress)));
    }

    events_.update_task(task);
    announce_queued(task);

    spdlog::info("manager: queued {} ({}, {} priority)", task.file_name, task.id, to_string(priority));
    return task;
}

std::vector<std::expected<DownloadTask, std::error_code>>
DownloadManager::download_multiple(const std::vector<DownloadRequest>& requests) {
    std::vector<std::future<std::expected<DownloadTask, std::error_code>>> pending;
    pending.reserve(requests.size());

    for (const auto& request : requests) {
        try {
            pending.push_back(std::async(std::launch::async, [this, &request] {
                return submit(request.source, request.file_name, request.priority);
            }));
        } catch (const std::system_error& e) {
            spdlog::debug("manager: no thread for batch submission ({}), submitting inline", e.what());
            std::promise<std::expected<DownloadTask, std::error_code>> inline_result;
            inline_result.set_value(submit(request.source, request.file_name, request.priority));
            pending.push_back(inline_result.get_future());
        }
    }

    std::vector<std::expected<DownloadTask, std::error_code>> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        try {
            results.push_back(future.get());
        } catch (const std::exception& e) {
            spdlog::error("manager: batch submission failed: {}", e.what());
            results.push_back(std::unexpected(make_error_code(DownloadErrc::unknown)));
        }
    }
    return results;
}

//=============================================================================
// Control
//=============================================================================

std::error_code DownloadManager::pause(const TaskId& id) {
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = active_.find(id);
        if (it == active_.end()) {
            return {};
        }
        TransferHandle handle = it->second.handle;
        active_.erase(it);
        suspended_[id] = handle;
        transport_.suspend(handle);
    }

    auto updated = events_.modify_task(id, [](DownloadTask& task) {
        if (task.state != DownloadState::downloading) {
            return false;
        }
        task.state = DownloadState::paused;
        task.speed = 0.0;
        return true;
    });
    if (!updated) {
        return {};
    }

    auto ec = persist(id);
    events_.emit_state_change(id, DownloadState::paused);
    spdlog::info("manager: paused {}", id);
    return ec;
}

std::error_code DownloadManager::resume(const TaskId& id) {
    auto updated = events_.modify_task(id, [](DownloadTask& task) {
        if (task.state != DownloadState::paused) {
            return false;
        }
        task.state = DownloadState::queued;
        return true;
    });
    if (!updated) {
        return {};
    }

    auto ec = persist(id);
    announce_queued(*updated);
    spdlog::info("manager: resumed {}", id);
    return ec;
}

std::error_code DownloadManager::cancel(const TaskId& id) {
    auto current = events_.task(id);
    if (!current || is_terminal(current->state)) {
        return {};
    }

    std::optional<TransferHandle> handle;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        if (auto it = active_.find(id); it != active_.end()) {
            handle = it->second.handle;
            active_.erase(it);
        }
        if (auto it = suspended_.find(id); it != suspended_.end()) {
            handle = it->second;
            suspended_.erase(it);
        }
        if (handle) {
            transport_.cancel(*handle);
        }
    }
    queue_.remove(id);

    auto updated = events_.modify_task(id, [](DownloadTask& task) {
        if (is_terminal(task.state)) {
            return false;
        }
        task.state = DownloadState::cancelled;
        task.speed = 0.0;
        return true;
    });
    if (!updated) {
        return {};
    }

    auto ec = persist(id);
    events_.emit_state_change(id, DownloadState::cancelled);
    publish_queue();

    if (auto rm = disk::remove_file(partial_file_path(config_.temporary_directory, *updated))) {
        spdlog::warn("manager: could not remove partial file of {}: {}", id, rm.message());
    }
    drop_subscriptions(id);
    spdlog::info("manager: cancelled {}", id);
    return ec;
}

std::error_code DownloadManager::remove_completed_downloads() {
    std::vector<TaskId> pruned;
    std::error_code result;

    for (const auto& task : events_.tasks_in_state(DownloadState::completed)) {
        if (store_.remove_task(task.id)) {
            result = make_error_code(DownloadErrc::storage_error);
            break;
        }
        pruned.push_back(task.id);
    }

    events_.remove_tasks(pruned);
    for (const auto& id : pruned) {
        drop_subscriptions(id);
    }
    if (!pruned.empty()) {
        spdlog::info("manager: pruned {} completed task(s)", pruned.size());
    }
    return result;
}

//=============================================================================
// Observation
//=============================================================================

Subscription DownloadManager::subscribe(EventHub::EventHandler handler) {
    return events_.subscribe(std::move(handler));
}

Subscription DownloadManager::subscribe_snapshot(EventHub::SnapshotHandler handler) {
    return events_.subscribe_snapshot(std::move(handler));
}

Subscription DownloadManager::subscribe_task(const TaskId& id, TaskHandler handler) {
    return events_.subscribe_snapshot(
        [id, handler = std::move(handler)](const std::vector<DownloadTask>& tasks) {
            auto it = std::find_if(tasks.begin(), tasks.end(),
                                   [&](const DownloadTask& task) { return task.id == id; });
            if (it != tasks.end()) {
                handler(*it);
            }
        });
}

Subscription DownloadManager::subscribe_progress(const TaskId& id, ProgressHandler handler) {
    return events_.subscribe([id, handler = std::move(handler)](const DownloadEvent& event) {
        if (const auto* progress = std::get_if<ProgressEvent>(&event); progress && progress->id == id) {
            handler(progress->progress, progress->speed);
        }
    });
}

Subscription DownloadManager::subscribe_state(const TaskId& id, StateHandler handler) {
    return events_.subscribe([id, handler = std::move(handler)](const DownloadEvent& event) {
        if (const auto* change = std::get_if<StateChangeEvent>(&event); change && change->id == id) {
            handler(change->state);
        }
    });
}

Subscription DownloadManager::subscribe_errors(const TaskId& id, ErrorHandler handler) {
    return events_.subscribe([id, handler = std::move(handler)](const DownloadEvent& event) {
        if (const auto* error = std::get_if<ErrorEvent>(&event); error && error->id == id) {
            handler(error->message);
        }
    });
}

std::size_t DownloadManager::active_count() const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    return active_.size();
}

//=============================================================================
// Admission
//=============================================================================

bool DownloadManager::admit_next() {
    std::lock_guard<std::mutex> admission(admission_mutex_);

    if (!online()) {
        return false;
    }

    while (true) {
        if (active_count() >= config_.max_concurrent_downloads) {
            return false;
        }

        auto next = queue_.dequeue();
        if (!next) {
            return false;
        }

        // The queue entry may be stale; the hub holds the current record.
        // Tasks reach the hub before the queue, so an unknown id was removed.
        auto current = events_.task(next->id);
        if (!current || is_terminal(current->state)
            || current->state == DownloadState::downloading) {
            spdlog::debug("manager: skipping stale queue entry {}", next->id);
            continue;
        }

        publish_queue();
        start_transfer(*current);
        return true;
    }
}

void DownloadManager::start_transfer(const DownloadTask& task) {
    auto updated = events_.modify_task(task.id, [](DownloadTask& t) {
        if (t.state != DownloadState::queued && t.state != DownloadState::paused) {
            return false;
        }
        t.state = DownloadState::downloading;
        t.error.reset();
        t.speed = 0.0;
        return true;
    });
    if (!updated) {
        return;
    }

    if (auto ec = persist(task.id)) {
        fail_task(task.id, "Could not record download start: " + ec.message());
        return;
    }
    events_.emit_state_change(task.id, DownloadState::downloading);

    std::string failure;
    try {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto now = std::chrono::steady_clock::now();
        if (auto it = suspended_.find(task.id); it != suspended_.end()) {
            TransferHandle handle = it->second;
            suspended_.erase(it);
            transport_.resume(handle);
            active_[task.id] = ActiveTransfer{handle, now, now};
            spdlog::info("manager: continuing {} (handle {})", task.id, handle);
        } else {
            auto handle = transport_.start(*updated);
            if (handle) {
                active_[task.id] = ActiveTransfer{*handle, now, now};
                spdlog::info("manager: downloading {} (handle {})", task.id, *handle);
            } else {
                failure = handle.error().message();
            }
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!failure.empty()) {
        fail_task(task.id, failure);
    }
}

void DownloadManager::fail_task(const TaskId& id, const std::string& message) {
    auto updated = events_.modify_task(id, [&](DownloadTask& task) {
        if (is_terminal(task.state)) {
            return false;
        }
        task.state = DownloadState::failed;
        task.error = message;
        task.speed = 0.0;
        return true;
    });
    if (!updated) {
        return;
    }

    if (auto ec = persist(id)) {
        spdlog::error("manager: failure of {} not recorded: {}", id, ec.message());
    }
    events_.emit_error(id, message);
    events_.emit_state_change(id, DownloadState::failed);
    drop_subscriptions(id);
    spdlog::error("manager: {} failed: {}", id, message);
}

std::error_code DownloadManager::persist(const TaskId& id) {
    auto current = events_.task(id);
    if (!current) {
        return {};
    }
    if (store_.update_task(*current)) {
        return make_error_code(DownloadErrc::storage_error);
    }
    return {};
}

//=============================================================================
// Messages
//=============================================================================

std::size_t DownloadManager::process_messages() {
    std::size_t count = 0;
    while (auto message = inbox_.try_pop()) {
        handle(std::move(*message));
        ++count;
    }
    return count;
}

void DownloadManager::handle(Message message) {
    std::visit([this](auto&& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ConnectivityChanged>) {
            on_connectivity(m.online);
        } else {
            try {
                if constexpr (std::is_same_v<T, TransferProgress>) {
                    on_progress(m);
                } else if constexpr (std::is_same_v<T, TransferFinished>) {
                    on_finished(m);
                } else {
                    on_failed(m);
                }
            } catch (const std::exception& e) {
                fail_task(m.id, e.what());
            }
        }
    }, std::move(message));
}

std::optional<TransferHandle> DownloadManager::claim_transfer(const TaskId& id) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (auto it = active_.find(id); it != active_.end()) {
        TransferHandle handle = it->second.handle;
        active_.erase(it);
        return handle;
    }
    // A transfer can end after pause asked it to suspend
    if (auto it = suspended_.find(id); it != suspended_.end()) {
        TransferHandle handle = it->second;
        suspended_.erase(it);
        return handle;
    }
    return std::nullopt;
}

void DownloadManager::on_progress(const TransferProgress& message) {
    double elapsed = 0.0;
    bool persist_now = false;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = active_.find(message.id);
        if (it == active_.end()) {
            spdlog::debug("manager: ignoring progress for inactive {}", message.id);
            return;
        }
        auto now = std::chrono::steady_clock::now();
        elapsed = std::chrono::duration<double>(now - it->second.last_progress).count();
        it->second.last_progress = now;
        if (now - it->second.last_persist >= PROGRESS_PERSIST_INTERVAL) {
            it->second.last_persist = now;
            persist_now = true;
        }
    }

    auto updated = events_.modify_task(message.id, [&](DownloadTask& task) {
        if (task.state != DownloadState::downloading) {
            return false;
        }
        task.downloaded_bytes = message.total_written;
        if (message.total_expected > 0) {
            task.expected_bytes = message.total_expected;
        }
        if (task.expected_bytes > 0) {
            double fraction = static_cast<double>(task.downloaded_bytes)
                            / static_cast<double>(task.expected_bytes);
            task.progress = std::max(task.progress, std::min(fraction, 1.0));
        }
        if (elapsed > 0.0) {
            task.speed = static_cast<double>(message.bytes_written) / elapsed;
        }
        return true;
    });
    if (!updated) {
        return;
    }

    events_.emit_progress(message.id, updated->progress, updated->speed);
    if (persist_now) {
        if (auto ec = persist(message.id)) {
            spdlog::warn("manager: progress of {} not recorded: {}", message.id, ec.message());
        } else {
            spdlog::debug("manager: recorded progress of {} ({:.1f}%)", message.id, updated->progress * 100.0);
        }
    }
}

void DownloadManager::on_finished(const TransferFinished& message) {
    if (!claim_transfer(message.id)) {
        auto current = events_.task(message.id);
        if (current && current->state == DownloadState::cancelled) {
            if (auto ec = disk::remove_file(message.location)) {
                spdlog::warn("manager: could not remove late delivery for {}: {}", message.id, ec.message());
            }
        }
        spdlog::debug("manager: ignoring completion for inactive {}", message.id);
        return;
    }

    auto current = events_.task(message.id);
    if (!current) {
        return;
    }
    if (queue_.remove(current->id)) {
        publish_queue();
    }

    auto destination = config_.download_directory / current->file_name;
    if (auto ec = disk::move_into_place(message.location, destination)) {
        fail_task(message.id, "Could not move download into place: " + ec.message());
        return;
    }

    std::error_code size_ec;
    auto size = fs::file_size(destination, size_ec);

    auto updated = events_.modify_task(message.id, [&](DownloadTask& task) {
        if (is_terminal(task.state)) {
            return false;
        }
        task.state = DownloadState::completed;
        task.progress = 1.0;
        task.speed = 0.0;
        if (!size_ec) {
            task.downloaded_bytes = size;
            if (task.expected_bytes == 0) {
                task.expected_bytes = size;
            }
        }
        return true;
    });
    if (!updated) {
        return;
    }

    if (auto ec = persist(message.id)) {
        spdlog::error("manager: completion of {} not recorded: {}", message.id, ec.message());
    }
    events_.emit_progress(message.id, 1.0, 0.0);
    events_.emit_state_change(message.id, DownloadState::completed);
    drop_subscriptions(message.id);
    spdlog::info("manager: completed {} -> {}", message.id, destination.string());
}

void DownloadManager::on_failed(const TransferFailed& message) {
    if (!claim_transfer(message.id)) {
        spdlog::debug("manager: ignoring failure for inactive {}", message.id);
        return;
    }
    if (queue_.remove(message.id)) {
        publish_queue();
    }
    fail_task(message.id, message.message.empty() ? message.error.message() : message.message);
}

void DownloadManager::on_connectivity(bool online) {
    if (online_.exchange(online, std::memory_order_acq_rel) == online) {
        return;
    }

    if (!online) {
        spdlog::warn("manager: connectivity lost, pausing active downloads");
        for (const auto& task : events_.tasks_in_state(DownloadState::downloading)) {
            if (auto ec = pause(task.id)) {
                spdlog::error("manager: pause of {} not recorded: {}", task.id, ec.message());
            }
        }
    } else {
        spdlog::info("manager: connectivity restored, resuming paused downloads");
        for (const auto& task : events_.tasks_in_state(DownloadState::paused)) {
            if (auto ec = resume(task.id)) {
                spdlog::error("manager: resume of {} not recorded: {}", task.id, ec.message());
            }
        }
    }
}

//=============================================================================
// Helpers
//=============================================================================

void DownloadManager::publish_queue() {
    events_.emit_queue_updated(queue_.tasks());
}

void DownloadManager::announce_queued(const DownloadTask& task) {
    // Held so admission cannot report the task downloading before it is announced queued
    std::lock_guard<std::mutex> admission(admission_mutex_);
    if (!queue_.enqueue(task)) {
        spdlog::warn("manager: queue full ({}), {} stays queued", queue_.capacity(), task.id);
    }
    events_.emit_state_change(task.id, DownloadState::queued);
    publish_queue();
}

void DownloadManager::keep_subscription(const TaskId& id, Subscription subscription) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    task_subscriptions_[id].push_back(std::move(subscription));
}

void DownloadManager::drop_subscriptions(const TaskId& id) {
    std::vector<Subscription> released;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto it = task_subscriptions_.find(id);
        if (it == task_subscriptions_.end()) {
            return;
        }
        released = std::move(it->second);
        task_subscriptions_.erase(it);
    }
    // Released outside the lock; reset may wait for a delivery in progress
}

//=============================================================================
// Background loops
//=============================================================================

void DownloadManager::admission_loop(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        try {
            // Fill every free slot this tick
            while (admit_next()) {
            }
        } catch (const std::exception& e) {
            spdlog::error("manager: admission tick failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, stoken, config_.poll_interval, [] { return false; });
    }
}

void DownloadManager::pump_loop(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        auto message = inbox_.pop(stoken);
        if (!message) {
            if (inbox_.closed()) {
                break;
            }
            continue;
        }
        try {
            handle(std::move(*message));
        } catch (const std::exception& e) {
            spdlog::error("manager: message handling failed: {}", e.what());
        }
    }
}

} // namespace surge::core
