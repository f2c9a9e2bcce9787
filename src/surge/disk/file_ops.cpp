// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_ops.hpp>

namespace surge::disk {

namespace fs = std::filesystem;

std::expected<std::uint64_t, std::error_code>
available_space(const fs::path& path) noexcept {
    try {
        fs::path probe = path.empty() ? fs::current_path() : fs::absolute(path);
        std::error_code ec;
        while (!fs::exists(probe, ec) && probe.has_parent_path() && probe != probe.parent_path()) {
            probe = probe.parent_path();
        }

        auto info = fs::space(probe, ec);
        if (ec) {
            return std::unexpected(from_system(ec, DiskErrc::read_error));
        }
        return static_cast<std::uint64_t>(info.available);
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(from_system(e.code(), DiskErrc::invalid_path));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::error_code move_into_place(const fs::path& from, const fs::path& to) noexcept {
    std::error_code ec;
    if (!fs::exists(from, ec)) {
        return make_error_code(DiskErrc::file_not_found);
    }

    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return from_system(ec, DiskErrc::invalid_path);
        }
    }

    fs::rename(from, to, ec);
    if (!ec) {
        return {};
    }

    if (ec != std::errc::cross_device_link) {
        return from_system(ec, DiskErrc::rename_failed);
    }

    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return from_system(ec, DiskErrc::write_error);
    }
    // The copy is in place; a leftover source only wastes temporary space
    fs::remove(from, ec);
    return {};
}

std::error_code remove_file(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return from_system(ec, DiskErrc::access_denied);
    }
    return {};
}

} // namespace surge::disk
