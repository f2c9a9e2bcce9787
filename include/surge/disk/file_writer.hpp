// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace surge::disk {

// Sequential writer for a partial download file.
// Owned by one transfer thread; not shared.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open for writing; with resume the existing bytes are kept and writes append
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, bool resume) noexcept;

    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Bytes in the file, including those present before open()
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

private:
    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    std::uint64_t size_{0};
};

} // namespace surge::disk
