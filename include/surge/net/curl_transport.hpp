// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/transport.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <stop_token>

namespace surge::net {

// Map a libcurl result (and the HTTP status, when there is one) to DownloadErrc
[[nodiscard]] std::error_code curl_error(int curl_code, long http_status) noexcept;

// Transport backed by libcurl, one worker thread per transfer.
//
// Bytes land in <temporary_directory>/<id>.part. A transfer whose partial file
// already exists continues from its size with a ranged request. Suspending
// aborts the request and keeps the partial file; resuming issues a new ranged
// request on the same handle.
class CurlTransport final : public core::Transport {
public:
    explicit CurlTransport(std::filesystem::path temporary_directory,
                           std::chrono::seconds timeout = core::DEFAULT_TIMEOUT);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    void bind(core::TransportSink sink) override;

    [[nodiscard]] std::expected<core::TransferHandle, std::error_code>
    start(const core::DownloadTask& task) override;

    void suspend(core::TransferHandle handle) override;
    void resume(core::TransferHandle handle) override;
    void cancel(core::TransferHandle handle) override;

    // Transfers whose worker has not exited yet
    [[nodiscard]] std::size_t transfer_count() const;

    // Process-wide libcurl setup; call once before any transfer
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    struct Transfer;

    void run(Transfer& transfer, std::stop_token stoken);

    // One HTTP request continuing from the current partial file size
    [[nodiscard]] std::error_code perform(Transfer& transfer, std::stop_token stoken);

    void deliver(core::TransportMessage message);

    // Join and drop transfers whose worker has exited (caller holds transfers_mutex_)
    void reap_locked();

    std::filesystem::path temporary_directory_;
    std::chrono::seconds timeout_;

    std::map<core::TransferHandle, std::unique_ptr<Transfer>> transfers_;
    mutable std::mutex transfers_mutex_;
    std::atomic<core::TransferHandle> next_handle_{1};

    core::TransportSink sink_;
    std::mutex sink_mutex_;
};

} // namespace surge::net
