// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_writer.hpp>
#include <cerrno>
#include <utility>

namespace surge::disk {

namespace {

std::error_code last_error(DiskErrc fallback) noexcept {
    return from_system(std::error_code(errno, std::generic_category()), fallback);
}

} // namespace

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : file_(std::exchange(other.file_, nullptr))
    , path_(std::move(other.path_))
    , size_(std::exchange(other.size_, 0)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        file_ = std::exchange(other.file_, nullptr);
        path_ = std::move(other.path_);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path, bool resume) noexcept {
    if (file_ != nullptr) {
        return make_error_code(DiskErrc::invalid_path);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return from_system(ec, DiskErrc::invalid_path);
        }
    }

    std::uint64_t existing = 0;
    if (resume) {
        auto current = std::filesystem::file_size(path, ec);
        existing = ec ? 0 : current;
    }

    file_ = std::fopen(path.c_str(), resume ? "ab" : "wb");
    if (file_ == nullptr) {
        return last_error(DiskErrc::write_error);
    }

    path_ = path;
    size_ = existing;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (file_ == nullptr) {
        return make_error_code(DiskErrc::write_error);
    }
    if (std::fwrite(data, 1, size, file_) != size) {
        return last_error(DiskErrc::write_error);
    }
    size_ += size;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (file_ == nullptr) {
        return make_error_code(DiskErrc::write_error);
    }
    if (std::fflush(file_) != 0) {
        return last_error(DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (file_ != nullptr) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

} // namespace surge::disk
