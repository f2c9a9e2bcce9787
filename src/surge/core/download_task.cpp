// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/download_task.hpp>
#include <surge/core/config.hpp>
#include <surge/core/url.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <mutex>
#include <random>
#include <stdexcept>

namespace surge::core {

namespace {

constexpr std::array<std::string_view, 6> STATE_NAMES = {
    "queued", "downloading", "paused", "completed", "failed", "cancelled"
};

constexpr std::array<std::string_view, 4> PRIORITY_NAMES = {
    "low", "normal", "high", "critical"
};

} // namespace

std::string_view to_string(DownloadState state) noexcept {
    auto index = static_cast<std::size_t>(state);
    return index < STATE_NAMES.size() ? STATE_NAMES[index] : "unknown";
}

std::string_view to_string(DownloadPriority priority) noexcept {
    auto index = static_cast<std::size_t>(priority);
    return index < PRIORITY_NAMES.size() ? PRIORITY_NAMES[index] : "unknown";
}

std::optional<DownloadState> parse_state(std::string_view text) noexcept {
    for (std::size_t i = 0; i < STATE_NAMES.size(); ++i) {
        if (STATE_NAMES[i] == text) {
            return static_cast<DownloadState>(i);
        }
    }
    return std::nullopt;
}

std::optional<DownloadPriority> parse_priority(std::string_view text) noexcept {
    for (std::size_t i = 0; i < PRIORITY_NAMES.size(); ++i) {
        if (PRIORITY_NAMES[i] == text) {
            return static_cast<DownloadPriority>(i);
        }
    }
    return std::nullopt;
}

DownloadTask DownloadTask::create(const Url& source,
                                  std::string_view file_name,
                                  DownloadPriority priority) {
    DownloadTask task;
    task.id = generate_task_id();
    task.source = source.full();
    task.file_name = file_name.empty() ? source.filename() : std::string(file_name);
    task.priority = priority;
    task.state = DownloadState::queued;
    task.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    return task;
}

TaskId generate_task_id() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = engine();
        lo = engine();
    }

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    constexpr char HEX[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    auto append = [&](std::uint64_t value, int nibbles_from, int nibbles_to) {
        for (int n = nibbles_from; n < nibbles_to; ++n) {
            id += HEX[(value >> (60 - 4 * n)) & 0xF];
        }
    };
    append(hi, 0, 8);
    id += '-';
    append(hi, 8, 12);
    id += '-';
    append(hi, 12, 16);
    id += '-';
    append(lo, 0, 4);
    id += '-';
    append(lo, 4, 16);
    return id;
}

std::filesystem::path partial_file_path(const std::filesystem::path& temporary_directory,
                                        const DownloadTask& task) {
    return temporary_directory / (task.id + std::string(PARTIAL_EXTENSION));
}

void to_json(nlohmann::json& j, const DownloadTask& task) {
    j = nlohmann::json{
        {"id", task.id},
        {"url", task.source},
        {"fileName", task.file_name},
        {"priority", to_string(task.priority)},
        {"state", to_string(task.state)},
        {"progress", task.progress},
        {"expectedBytes", task.expected_bytes},
        {"downloadedBytes", task.downloaded_bytes},
        {"speed", task.speed},
        {"createdAt", task.created_at.time_since_epoch().count()},
    };
    if (task.error) {
        j["error"] = *task.error;
    } else {
        j["error"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, DownloadTask& task) {
    j.at("id").get_to(task.id);
    j.at("url").get_to(task.source);
    j.at("fileName").get_to(task.file_name);

    auto priority = parse_priority(j.at("priority").get<std::string>());
    auto state = parse_state(j.at("state").get<std::string>());
    if (!priority || !state) {
        throw std::invalid_argument("unknown priority or state in task record");
    }
    task.priority = *priority;
    task.state = *state;

    j.at("progress").get_to(task.progress);
    j.at("expectedBytes").get_to(task.expected_bytes);
    j.at("downloadedBytes").get_to(task.downloaded_bytes);
    j.at("speed").get_to(task.speed);
    task.created_at = Timestamp{std::chrono::milliseconds{j.at("createdAt").get<std::int64_t>()}};

    if (auto it = j.find("error"); it != j.end() && !it->is_null()) {
        task.error = it->get<std::string>();
    } else {
        task.error.reset();
    }
}

} // namespace surge::core
