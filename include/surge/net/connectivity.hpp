// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <stop_token>

namespace surge::net {

// Source of the host's reachability signal
class ConnectivityMonitor {
public:
    using Listener = std::function<void(bool online)>;

    virtual ~ConnectivityMonitor() = default;

    // Install (or with an empty listener, remove) the receiver of transitions.
    // Removing waits for a notification in progress to return.
    void set_listener(Listener listener);

    [[nodiscard]] virtual bool online() const noexcept = 0;

protected:
    // Deliver a transition to the current listener, if any
    void notify(bool online);

private:
    Listener listener_;
    std::mutex listener_mutex_;
};

// Connectivity changed explicitly by its owner
class ManualConnectivity final : public ConnectivityMonitor {
public:
    explicit ManualConnectivity(bool online = true) noexcept : online_(online) {}

    // Notifies only when the value changes
    void set_online(bool online);

    [[nodiscard]] bool online() const noexcept override { return online_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> online_;
};

// Periodic libcurl connect-only probe against a well known host
class ProbeConnectivity final : public ConnectivityMonitor {
public:
    static constexpr const char* DEFAULT_PROBE_URL = "https://www.google.com";

    explicit ProbeConnectivity(std::string probe_url = DEFAULT_PROBE_URL,
                               std::chrono::milliseconds interval = core::CONNECTIVITY_PROBE_INTERVAL);
    ~ProbeConnectivity() override;

    ProbeConnectivity(const ProbeConnectivity&) = delete;
    ProbeConnectivity& operator=(const ProbeConnectivity&) = delete;

    void start();
    void stop() noexcept;

    [[nodiscard]] bool online() const noexcept override { return online_.load(std::memory_order_acquire); }

    // One blocking probe; true if a connection could be established
    [[nodiscard]] bool probe_once() const noexcept;

private:
    void probe_loop(std::stop_token stoken);

    std::string probe_url_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> online_{true};
    std::jthread probe_thread_;
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
};

} // namespace surge::net
