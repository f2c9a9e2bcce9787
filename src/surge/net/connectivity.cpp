// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/net/connectivity.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace surge::net {

//=============================================================================
// ConnectivityMonitor
//=============================================================================

void ConnectivityMonitor::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ConnectivityMonitor::notify(bool online) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (listener_) {
        listener_(online);
    }
}

//=============================================================================
// ManualConnectivity
//=============================================================================

void ManualConnectivity::set_online(bool online) {
    if (online_.exchange(online, std::memory_order_acq_rel) != online) {
        notify(online);
    }
}

//=============================================================================
// ProbeConnectivity
//=============================================================================

ProbeConnectivity::ProbeConnectivity(std::string probe_url, std::chrono::milliseconds interval)
    : probe_url_(std::move(probe_url))
    , interval_(interval) {}

ProbeConnectivity::~ProbeConnectivity() {
    stop();
}

void ProbeConnectivity::start() {
    if (probe_thread_.joinable()) {
        return;
    }
    probe_thread_ = std::jthread([this](std::stop_token stoken) {
        probe_loop(stoken);
    });
}

void ProbeConnectivity::stop() noexcept {
    if (probe_thread_.joinable()) {
        probe_thread_.request_stop();
        probe_thread_.join();
    }
}

bool ProbeConnectivity::probe_once() const noexcept {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, probe_url_.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    return res == CURLE_OK;
}

void ProbeConnectivity::probe_loop(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        bool now_online = probe_once();
        bool was_online = online_.exchange(now_online, std::memory_order_acq_rel);
        if (was_online != now_online) {
            spdlog::info("connectivity: {}", now_online ? "online" : "offline");
            notify(now_online);
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, stoken, interval_, [] { return false; });
    }
}

} // namespace surge::net
