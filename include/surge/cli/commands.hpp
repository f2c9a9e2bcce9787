// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/download_task.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace surge::cli {

// Process exit code, or the error that stopped the command
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string directory;
    std::string config_path;
    std::uint32_t jobs{0};                      // 0: keep the configured value
    core::DownloadPriority priority{core::DownloadPriority::normal};
    bool list{false};
    bool prune{false};
    bool resume_all{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;            // Unusable arguments, one message each
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Apply --verbose / --quiet to the default spdlog logger
void configure_logging(const CliArgs& args);

// Configuration file (if any) with command line overrides applied
[[nodiscard]] std::expected<core::ManagerConfig, std::error_code> resolve_config(const CliArgs& args);

// Print every task in the ledger
[[nodiscard]] CliResult list(const core::ManagerConfig& config);

// Remove completed tasks from the ledger
[[nodiscard]] CliResult prune(const core::ManagerConfig& config);

// Download args.urls (and with --resume-all the ledger's pending tasks) to completion
[[nodiscard]] CliResult download(const CliArgs& args, const core::ManagerConfig& config);

void print_help(std::string_view program_name) noexcept;
void print_version() noexcept;

} // namespace surge::cli
