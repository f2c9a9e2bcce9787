// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace surge::core {

enum class DownloadErrc {
    success = 0,
    invalid_url,
    insufficient_storage,
    network_error,
    file_error,
    cancelled,
    already_downloading,
    queue_full,
    storage_error,
    unknown,
    // Transport refinements of network_error
    timeout,
    not_found,
    server_error,
    invalid_range,
    ssl_error,
    dns_error,
    too_many_redirects,
    connection_lost,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::invalid_url:          return "Invalid or insecure URL";
            case DownloadErrc::insufficient_storage: return "Insufficient free storage";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::file_error:           return "File error";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::already_downloading:  return "Already downloading";
            case DownloadErrc::queue_full:           return "Download queue is full";
            case DownloadErrc::storage_error:        return "Task ledger storage error";
            case DownloadErrc::unknown:              return "Unknown error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::server_error:         return "Server error";
            case DownloadErrc::invalid_range:        return "Invalid byte range";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::connection_lost:      return "Connection lost";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace surge::core

namespace std {

template<>
struct is_error_code_enum<surge::core::DownloadErrc> : true_type {};

} // namespace std
