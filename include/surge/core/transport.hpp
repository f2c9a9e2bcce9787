// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/download_task.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <variant>

namespace surge::core {

using TransferHandle = std::uint64_t;

// Bytes arrived for a transfer
struct TransferProgress {
    TaskId id;
    std::uint64_t bytes_written{0};    // Since the previous report
    std::uint64_t total_written{0};
    std::uint64_t total_expected{0};   // 0 when the server did not say
};

// Transfer finished; the payload sits at location
struct TransferFinished {
    TaskId id;
    std::filesystem::path location;
};

struct TransferFailed {
    TaskId id;
    std::error_code error;
    std::string message;
};

using TransportMessage = std::variant<TransferProgress, TransferFinished, TransferFailed>;

// Where a transport delivers its messages. Must be safe to call from any thread.
using TransportSink = std::function<void(TransportMessage)>;

// Performs the network transfer for a task.
//
// Calls are fire-and-forget: outcomes arrive later through the sink. After
// cancel() the transport may still deliver a late message for the handle;
// receivers must tolerate that.
class Transport {
public:
    virtual ~Transport() = default;

    // Install (or with an empty sink, remove) the message receiver.
    // Removing waits for any delivery in progress to return.
    virtual void bind(TransportSink sink) = 0;

    [[nodiscard]] virtual std::expected<TransferHandle, std::error_code>
    start(const DownloadTask& task) = 0;

    virtual void suspend(TransferHandle handle) = 0;
    virtual void resume(TransferHandle handle) = 0;
    virtual void cancel(TransferHandle handle) = 0;
};

} // namespace surge::core
