// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/cli/commands.hpp>
#include <surge/cli/progress_bar.hpp>
#include <surge/version.hpp>
#include "temp_directory.hpp"
#include <initializer_list>
#include <string>
#include <vector>

using namespace surge::cli;
using surge::core::DownloadPriority;

namespace {

// argv backed by owned strings
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "surge");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    [[nodiscard]] int argc() const { return static_cast<int>(pointers_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliArgs parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return parse_args(argv.argc(), argv.argv());
}

} // namespace

TEST_CASE("Version identity", "[cli][version]") {
    CHECK(surge::version.to_string() == std::to_string(SURGE_VERSION_MAJOR) + "."
                                        + std::to_string(SURGE_VERSION_MINOR) + "."
                                        + std::to_string(SURGE_VERSION_PATCH));
    CHECK(surge::user_agent() == "surge/" + surge::version.to_string());
    STATIC_REQUIRE(surge::Version{0, 3, 1} > surge::Version{0, 3, 0});
    STATIC_REQUIRE(surge::Version{1, 0, 0}.to_number() > surge::Version{0, 65535, 65535}.to_number());
}

TEST_CASE("parse_args", "[cli]") {
    SECTION("URLs and options") {
        auto args = parse({"-d", "/tmp/out", "-j", "2", "-p", "high", "https://a/x", "https://b/y"});
        CHECK(args.errors.empty());
        CHECK(args.directory == "/tmp/out");
        CHECK(args.jobs == 2);
        CHECK(args.priority == DownloadPriority::high);
        CHECK(args.urls == std::vector<std::string>{"https://a/x", "https://b/y"});
    }

    SECTION("Flags") {
        auto args = parse({"--list", "--prune", "--resume-all", "-V", "-q", "-c", "surge.json"});
        CHECK(args.list);
        CHECK(args.prune);
        CHECK(args.resume_all);
        CHECK(args.verbose);
        CHECK(args.quiet);
        CHECK(args.config_path == "surge.json");
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"-h", "--bogus"}).help);
        CHECK(parse({"--version"}).version);
        CHECK(parse({"-h", "--bogus"}).errors.empty());
    }

    SECTION("Bad values are reported") {
        CHECK(parse({"-j", "0"}).errors.size() == 1);
        CHECK(parse({"-j", "65"}).errors.size() == 1);
        CHECK(parse({"-j", "3x"}).errors.size() == 1);
        CHECK(parse({"-p", "urgent"}).errors.size() == 1);
        CHECK(parse({"-d"}).errors.size() == 1);
        CHECK(parse({"--frobnicate"}).errors == std::vector<std::string>{"Unknown option: --frobnicate"});
    }

    SECTION("Defaults") {
        auto args = parse({});
        CHECK(args.urls.empty());
        CHECK(args.jobs == 0);
        CHECK(args.priority == DownloadPriority::normal);
        CHECK_FALSE(args.list);
    }
}

TEST_CASE("resolve_config", "[cli]") {
    surge::test::TempDirectory dir;

    SECTION("Flags override the file") {
        surge::test::write_file(dir / "surge.json", R"({"maxConcurrentDownloads": 5, "downloadDirectory": "/from/file"})");
        CliArgs args;
        args.config_path = (dir / "surge.json").string();
        args.jobs = 2;

        auto cfg = resolve_config(args);
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_concurrent_downloads == 2);
        CHECK(cfg->download_directory == "/from/file");
    }

    SECTION("Directory flag") {
        CliArgs args;
        args.directory = (dir / "out").string();
        auto cfg = resolve_config(args);
        REQUIRE(cfg.has_value());
        CHECK(cfg->download_directory == dir / "out");
    }

    SECTION("Missing config file") {
        CliArgs args;
        args.config_path = (dir / "absent.json").string();
        CHECK_FALSE(resolve_config(args).has_value());
    }
}

TEST_CASE("Progress bar formatting", "[cli][progress]") {
    SECTION("Bytes") {
        CHECK(ProgressBar::format_bytes(512) == "512 B");
        CHECK(ProgressBar::format_bytes(2048) == "2 KB");
        CHECK(ProgressBar::format_bytes(5 * 1024 * 1024) == "5.0 MB");
        CHECK(ProgressBar::format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
    }

    SECTION("Speed") {
        CHECK(ProgressBar::format_speed(100) == "100 B/s");
        CHECK(ProgressBar::format_speed(1536) == "1.5 KB/s");
        CHECK(ProgressBar::format_speed(10.0 * 1024 * 1024) == "10.0 MB/s");
    }

    SECTION("Time") {
        CHECK(ProgressBar::format_time(42) == "42s");
        CHECK(ProgressBar::format_time(125) == "2m 5s");
        CHECK(ProgressBar::format_time(3600 + 5 * 60) == "1h 05m");
    }

    SECTION("Rendered line") {
        auto line = ProgressBar::render(50, 100, 0.0, 1, 3);
        CHECK(line.starts_with("[" + std::string(15, '=') + ">"));
        CHECK(line.find(" 50%") != std::string::npos);
        CHECK(line.find("(50 B/100 B)") != std::string::npos);
        CHECK(line.ends_with("[1/3 done]"));
        CHECK(line.find("ETA") == std::string::npos);

        auto full = ProgressBar::render(100, 100, 10.0, 3, 3);
        CHECK(full.starts_with("[" + std::string(30, '=') + "]"));
        CHECK(full.find("100%") != std::string::npos);

        auto eta = ProgressBar::render(0, 100, 10.0, 0, 1);
        CHECK(eta.find("ETA: 10s") != std::string::npos);
    }
}
