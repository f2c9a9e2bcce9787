// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/net/curl_transport.hpp>
#include <surge/core/error.hpp>
#include <surge/disk/file_writer.hpp>
#include <surge/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <string>
#include <thread>

namespace surge::net {

using core::DownloadErrc;
using core::TransferHandle;

//=============================================================================
// Transfer
//=============================================================================

struct CurlTransport::Transfer {
    TransferHandle handle{0};
    core::TaskId id;
    std::string url;
    std::filesystem::path partial_path;

    std::atomic<bool> paused{false};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> done{false};

    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    std::jthread worker;
};

namespace {

// State shared with the libcurl callbacks for one request
struct RequestContext {
    const std::atomic<bool>* paused{nullptr};
    const std::atomic<bool>* cancelled{nullptr};
    disk::FileWriter* writer{nullptr};
    std::stop_token stoken;
    std::error_code write_error;

    std::uint64_t offset{0};            // Bytes on disk before this request
    std::uint64_t unreported{0};
    std::uint64_t expected{0};
    std::chrono::steady_clock::time_point last_report;
};

// RAII curl easy handle
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() : ptr(curl_easy_init()) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<RequestContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (auto ec = ctx->writer->write(ptr, bytes)) {
        // Returning short aborts the request with CURLE_WRITE_ERROR
        ctx->write_error = ec;
        return 0;
    }
    ctx->unreported += bytes;
    return bytes;
}

// Aborts the request on cancel, suspend or shutdown
int xferinfo_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t ultotal, curl_off_t ulnow) noexcept {
    (void)dlnow; (void)ultotal; (void)ulnow;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (ctx->stoken.stop_requested()
        || ctx->cancelled->load(std::memory_order_acquire)
        || ctx->paused->load(std::memory_order_acquire)) {
        return 1;
    }
    if (dltotal > 0) {
        ctx->expected = ctx->offset + static_cast<std::uint64_t>(dltotal);
    }
    return 0;
}

} // namespace

//=============================================================================
// Error mapping
//=============================================================================

std::error_code curl_error(int curl_code, long http_status) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return {};
        case CURLE_HTTP_RETURNED_ERROR:
            if (http_status == 404 || http_status == 410) {
                return make_error_code(DownloadErrc::not_found);
            }
            if (http_status == 416) {
                return make_error_code(DownloadErrc::invalid_range);
            }
            if (http_status >= 500) {
                return make_error_code(DownloadErrc::server_error);
            }
            return make_error_code(DownloadErrc::network_error);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_RANGE_ERROR:
            return make_error_code(DownloadErrc::invalid_range);
        case CURLE_WRITE_ERROR:
            return make_error_code(DownloadErrc::file_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

//=============================================================================
// CurlTransport
//=============================================================================

CurlTransport::CurlTransport(std::filesystem::path temporary_directory, std::chrono::seconds timeout)
    : temporary_directory_(std::move(temporary_directory))
    , timeout_(timeout) {}

CurlTransport::~CurlTransport() {
    std::map<TransferHandle, std::unique_ptr<Transfer>> transfers;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        transfers.swap(transfers_);
    }
    for (auto& [handle, transfer] : transfers) {
        transfer->cancelled.store(true, std::memory_order_release);
        transfer->worker.request_stop();
        transfer->wait_cv.notify_all();
    }
    // Workers join as the map goes out of scope
}

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

void CurlTransport::bind(core::TransportSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void CurlTransport::deliver(core::TransportMessage message) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
        sink_(std::move(message));
    }
}

std::expected<TransferHandle, std::error_code> CurlTransport::start(const core::DownloadTask& task) {
    auto transfer = std::make_unique<Transfer>();
    transfer->handle = next_handle_.fetch_add(1, std::memory_order_relaxed);
    transfer->id = task.id;
    transfer->url = task.source;
    transfer->partial_path = core::partial_file_path(temporary_directory_, task);

    std::lock_guard<std::mutex> lock(transfers_mutex_);
    reap_locked();

    auto* raw = transfer.get();
    try {
        raw->worker = std::jthread([this, raw](std::stop_token stoken) {
            run(*raw, stoken);
        });
    } catch (const std::system_error& e) {
        spdlog::error("curl: cannot start worker for {}: {}", task.id, e.what());
        return std::unexpected(make_error_code(DownloadErrc::unknown));
    }

    auto handle = raw->handle;
    transfers_.emplace(handle, std::move(transfer));
    spdlog::debug("curl: transfer {} for {} (weight {})", handle, task.id,
                  core::transport_weight(task.priority));
    return handle;
}

void CurlTransport::suspend(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (auto it = transfers_.find(handle); it != transfers_.end()) {
        it->second->paused.store(true, std::memory_order_release);
    }
}

void CurlTransport::resume(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (auto it = transfers_.find(handle); it != transfers_.end()) {
        it->second->paused.store(false, std::memory_order_release);
        it->second->wait_cv.notify_all();
    }
}

void CurlTransport::cancel(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (auto it = transfers_.find(handle); it != transfers_.end()) {
        it->second->cancelled.store(true, std::memory_order_release);
        it->second->wait_cv.notify_all();
    }
}

std::size_t CurlTransport::transfer_count() const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    std::size_t count = 0;
    for (const auto& [handle, transfer] : transfers_) {
        if (!transfer->done.load(std::memory_order_acquire)) {
            ++count;
        }
    }
    return count;
}

void CurlTransport::reap_locked() {
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (it->second->done.load(std::memory_order_acquire)) {
            it = transfers_.erase(it);
        } else {
            ++it;
        }
    }
}

//=============================================================================
// Worker
//=============================================================================

void CurlTransport::run(Transfer& transfer, std::stop_token stoken) {
    while (true) {
        auto ec = perform(transfer, stoken);

        if (transfer.cancelled.load(std::memory_order_acquire) || stoken.stop_requested()) {
            spdlog::debug("curl: transfer {} cancelled", transfer.handle);
            break;
        }

        if (transfer.paused.load(std::memory_order_acquire)) {
            spdlog::debug("curl: transfer {} suspended", transfer.handle);
            std::unique_lock<std::mutex> lock(transfer.wait_mutex);
            transfer.wait_cv.wait(lock, stoken, [&] {
                return !transfer.paused.load(std::memory_order_acquire)
                    || transfer.cancelled.load(std::memory_order_acquire);
            });
            continue;
        }

        if (!ec) {
            deliver(core::TransferFinished{transfer.id, transfer.partial_path});
        } else {
            spdlog::warn("curl: transfer {} failed: {}", transfer.handle, ec.message());
            deliver(core::TransferFailed{transfer.id, ec, ec.message()});
        }
        break;
    }
    transfer.done.store(true, std::memory_order_release);
}

std::error_code CurlTransport::perform(Transfer& transfer, std::stop_token stoken) {
    disk::FileWriter writer;
    if (auto ec = writer.open(transfer.partial_path, true)) {
        return make_error_code(DownloadErrc::file_error);
    }

    CurlHandle curl;
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    RequestContext ctx;
    ctx.paused = &transfer.paused;
    ctx.cancelled = &transfer.cancelled;
    ctx.writer = &writer;
    ctx.stoken = stoken;
    ctx.offset = writer.size();
    ctx.last_report = std::chrono::steady_clock::now();

    auto user_agent = surge::user_agent();

    curl_easy_setopt(curl.ptr, CURLOPT_URL, transfer.url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    // Timeouts
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);

    // SSL
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    // Redirects
    if (core::FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(core::WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    if (ctx.offset > 0) {
        curl_easy_setopt(curl.ptr, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(ctx.offset));
        spdlog::debug("curl: transfer {} continuing at byte {}", transfer.handle, ctx.offset);
    }

    auto report = [&](bool force) {
        auto now = std::chrono::steady_clock::now();
        if (!force && now - ctx.last_report < core::PROGRESS_REPORT_INTERVAL) {
            return;
        }
        if (ctx.unreported == 0 && !force) {
            return;
        }
        ctx.last_report = now;
        deliver(core::TransferProgress{transfer.id, ctx.unreported, writer.size(), ctx.expected});
        ctx.unreported = 0;
    };

    // Multi interface so progress can be reported between socket waits
    CURLM* multi = curl_multi_init();
    if (!multi) {
        return make_error_code(DownloadErrc::network_error);
    }
    curl_multi_add_handle(multi, curl.ptr);

    CURLcode result = CURLE_OK;
    int running = 1;
    while (running) {
        CURLMcode mc = curl_multi_perform(multi, &running);
        if (mc == CURLM_OK && running) {
            mc = curl_multi_poll(multi, nullptr, 0, 100, nullptr);
        }
        if (mc != CURLM_OK) {
            result = CURLE_RECV_ERROR;
            break;
        }
        report(false);

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                result = msg->data.result;
            }
        }
    }

    long http_status = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_status);
    curl_multi_remove_handle(multi, curl.ptr);
    curl_multi_cleanup(multi);

    if (auto ec = writer.flush()) {
        ctx.write_error = ec;
    }
    report(true);
    writer.close();

    if (ctx.write_error) {
        spdlog::error("curl: writing {} failed: {}", transfer.partial_path.string(), ctx.write_error.message());
        return make_error_code(DownloadErrc::file_error);
    }

    // A partial file that already holds the whole payload
    if (result == CURLE_HTTP_RETURNED_ERROR && http_status == 416 && ctx.offset > 0) {
        return {};
    }

    // The server ignored the range; start over from an empty partial file
    if (result == CURLE_RANGE_ERROR && ctx.offset > 0) {
        spdlog::info("curl: {} does not support ranges, restarting {}", transfer.url, transfer.id);
        disk::FileWriter truncate;
        if (truncate.open(transfer.partial_path, false)) {
            return make_error_code(DownloadErrc::file_error);
        }
        truncate.close();
        return perform(transfer, stoken);
    }

    return curl_error(result, http_status);
}

} // namespace surge::net
