// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <surge/cli/progress_bar.hpp>
#include <surge/core/download_manager.hpp>
#include <surge/core/download_queue.hpp>
#include <surge/core/error.hpp>
#include <surge/core/event_hub.hpp>
#include <surge/core/task_store.hpp>
#include <surge/net/connectivity.hpp>
#include <surge/net/curl_transport.hpp>
#include <surge/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

namespace chrono = std::chrono;

namespace surge::cli {

using namespace surge::core;

namespace {

constexpr chrono::milliseconds REFRESH_INTERVAL{200};

// Value of an option that takes an argument, or an error entry
std::optional<std::string> option_value(int& i, int argc, char* argv[], CliArgs& args) {
    if (i + 1 >= argc) {
        args.errors.push_back(std::string("Missing value for ") + argv[i]);
        return std::nullopt;
    }
    return std::string(argv[++i]);
}

// libcurl global state for the duration of a command
struct CurlGlobal {
    CurlGlobal() { net::CurlTransport::global_init(); }
    ~CurlGlobal() { net::CurlTransport::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Ledger, queue, hub and transport wired to one manager for a CLI command
struct Session {
    explicit Session(const ManagerConfig& config)
        : store(config.ledger_path)
        , queue(config.max_queue_size)
        , transport(config.temporary_directory, config.timeout_interval) {}

    TaskStore store;
    DownloadQueue queue;
    EventHub events;
    net::CurlTransport transport;
};

struct Totals {
    std::uint64_t current{0};
    std::uint64_t total{0};
    double speed{0.0};
    std::size_t done{0};
    std::size_t completed{0};
};

Totals collect(const DownloadManager& manager, const std::set<TaskId>& tracked) {
    Totals totals;
    for (const auto& id : tracked) {
        auto task = manager.task(id);
        if (!task) {
            ++totals.done;
            continue;
        }
        totals.current += task->downloaded_bytes;
        totals.total += task->expected_bytes;
        if (task->state == DownloadState::downloading) {
            totals.speed += task->speed;
        }
        if (is_terminal(task->state)) {
            ++totals.done;
        }
        if (task->state == DownloadState::completed) {
            ++totals.completed;
        }
    }
    return totals;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-l" || arg == "--list") {
            args.list = true;
        } else if (arg == "--prune") {
            args.prune = true;
        } else if (arg == "--resume-all") {
            args.resume_all = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto value = option_value(i, argc, argv, args)) {
                args.directory = *value;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (auto value = option_value(i, argc, argv, args)) {
                args.config_path = *value;
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (auto value = option_value(i, argc, argv, args)) {
                char* end = nullptr;
                unsigned long jobs = std::strtoul(value->c_str(), &end, 10);
                if (end == nullptr || *end != '\0' || jobs == 0 || jobs > 64) {
                    args.errors.push_back("Invalid job count: " + *value);
                } else {
                    args.jobs = static_cast<std::uint32_t>(jobs);
                }
            }
        } else if (arg == "-p" || arg == "--priority") {
            if (auto value = option_value(i, argc, argv, args)) {
                if (auto priority = parse_priority(*value)) {
                    args.priority = *priority;
                } else {
                    args.errors.push_back("Invalid priority: " + *value);
                }
            }
        } else if (arg.starts_with("-")) {
            args.errors.push_back("Unknown option: " + arg);
        } else {
            args.urls.push_back(arg);
        }
    }

    return args;
}

void configure_logging(const CliArgs& args) {
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

std::expected<ManagerConfig, std::error_code> resolve_config(const CliArgs& args) {
    auto config = args.config_path.empty()
        ? std::expected<ManagerConfig, std::error_code>(ManagerConfig::defaults())
        : load_config(args.config_path);
    if (!config) {
        return config;
    }

    if (!args.directory.empty()) {
        config->download_directory = args.directory;
    }
    if (args.jobs > 0) {
        config->max_concurrent_downloads = args.jobs;
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult list(const ManagerConfig& config) {
    TaskStore store(config.ledger_path);
    auto tasks = store.load_tasks();
    std::sort(tasks.begin(), tasks.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.created_at < b.created_at;
    });

    if (tasks.empty()) {
        std::cout << "No downloads in " << store.path().string() << std::endl;
        return 0;
    }

    for (const auto& task : tasks) {
        std::cout << task.id << "  " << to_string(task.state)
                  << "  " << static_cast<int>(task.progress * 100.0) << "%"
                  << "  " << to_string(task.priority)
                  << "  " << task.file_name;
        if (task.error) {
            std::cout << "  (" << *task.error << ")";
        }
        std::cout << "\n";
    }
    std::cout << std::flush;
    return 0;
}

CliResult prune(const ManagerConfig& config) {
    CurlGlobal curl;
    Session session(config);
    DownloadManager manager(config, session.store, session.queue, session.events, session.transport);

    auto before = manager.snapshot().size();
    if (auto ec = manager.remove_completed_downloads()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    std::cout << "Removed " << (before - manager.snapshot().size())
              << " completed download(s)" << std::endl;
    return 0;
}

CliResult download(const CliArgs& args, const ManagerConfig& config) {
    CurlGlobal curl;
    int exit_code = 0;
    {
        Session session(config);
        net::ProbeConnectivity connectivity;
        DownloadManager manager(config, session.store, session.queue, session.events,
                                session.transport, &connectivity);

        std::set<TaskId> tracked;
        if (args.resume_all) {
            for (const auto& task : manager.snapshot()) {
                if (!is_terminal(task.state)) {
                    tracked.insert(task.id);
                }
            }
        }

        std::vector<DownloadRequest> requests;
        requests.reserve(args.urls.size());
        for (const auto& url : args.urls) {
            requests.push_back(DownloadRequest{url, {}, args.priority});
        }

        auto results = manager.download_multiple(requests);
        for (std::size_t i = 0; i < results.size(); ++i) {
            if (results[i]) {
                tracked.insert(results[i]->id);
            } else {
                std::cerr << "Error: " << requests[i].source << ": " << results[i].error().message() << std::endl;
                exit_code = 1;
            }
        }

        if (tracked.empty()) {
            if (results.empty()) {
                std::cout << "Nothing to download" << std::endl;
            }
            return exit_code;
        }

        ProgressBar bar("Downloading");
        std::mutex console_mutex;

        // One line per lifecycle change of a tracked task
        auto events = manager.subscribe([&](const DownloadEvent& event) {
            const auto* change = std::get_if<StateChangeEvent>(&event);
            if (change == nullptr || !tracked.contains(change->id)) {
                return;
            }
            if (change->state != DownloadState::completed && change->state != DownloadState::failed) {
                return;
            }
            auto task = manager.task(change->id);
            std::lock_guard<std::mutex> lock(console_mutex);
            if (!args.quiet) bar.clear();
            if (change->state == DownloadState::completed) {
                std::cout << "Completed: " << (task ? task->file_name : change->id) << std::endl;
            } else {
                std::cout << "Failed: " << (task ? task->file_name : change->id);
                if (task && task->error) {
                    std::cout << " (" << *task->error << ")";
                }
                std::cout << std::endl;
            }
        });

        connectivity.start();
        manager.start();

        while (true) {
            auto totals = collect(manager, tracked);
            if (!args.quiet) {
                std::lock_guard<std::mutex> lock(console_mutex);
                bar.update(totals.current, totals.total, totals.speed, totals.done, tracked.size());
            }
            if (totals.done == tracked.size()) {
                if (totals.completed != tracked.size()) {
                    exit_code = 1;
                }
                break;
            }
            std::this_thread::sleep_for(REFRESH_INTERVAL);
        }

        manager.stop();
        connectivity.stop();
        if (!args.quiet) bar.finish();

        auto totals = collect(manager, tracked);
        std::cout << totals.completed << " of " << tracked.size() << " download(s) completed" << std::endl;
    }
    return exit_code;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "surge " << version.to_string() << " - prioritised download manager\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Log queue and transfer details\n";
    std::cout << "  -q, --quiet             Only log warnings, no progress bar\n";
    std::cout << "  -d, --directory <DIR>   Save downloads to DIR\n";
    std::cout << "  -c, --config <FILE>     Read settings from a JSON file\n";
    std::cout << "  -j, --jobs <N>          Concurrent downloads (default: 3)\n";
    std::cout << "  -p, --priority <P>      low, normal, high or critical\n";
    std::cout << "  -l, --list              List downloads in the ledger\n";
    std::cout << "      --prune             Remove completed downloads from the ledger\n";
    std::cout << "      --resume-all        Finish every unfinished download in the ledger\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -p high -j 1 https://example.com/a.iso https://example.com/b.iso\n";
    std::cout << "  " << program_name << " --resume-all\n";
}

void print_version() noexcept {
    std::cout << "surge " << version.to_string() << std::endl;
    std::cout << "Built " << build_stamp() << " with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace surge::cli
