// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace surge::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    write_error,
    read_error,
    rename_failed,
    corrupt_record,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::disk_full:       return "Disk full";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::rename_failed:   return "Rename failed";
            case DiskErrc::corrupt_record:  return "Corrupt record";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Translate an OS-level error into the disk category where one matches
[[nodiscard]] inline std::error_code from_system(const std::error_code& ec,
                                                 DiskErrc fallback) noexcept {
    if (ec == std::errc::no_space_on_device) return make_error_code(DiskErrc::disk_full);
    if (ec == std::errc::permission_denied) return make_error_code(DiskErrc::access_denied);
    if (ec == std::errc::no_such_file_or_directory) return make_error_code(DiskErrc::file_not_found);
    return make_error_code(fallback);
}

} // namespace surge::disk

namespace std {

template<>
struct is_error_code_enum<surge::disk::DiskErrc> : true_type {};

} // namespace std
