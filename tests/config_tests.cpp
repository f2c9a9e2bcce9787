// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include "temp_directory.hpp"

using namespace surge::core;
using surge::disk::DiskErrc;

TEST_CASE("ManagerConfig defaults", "[config]") {
    auto cfg = ManagerConfig::defaults();

    CHECK(cfg.max_concurrent_downloads == 3);
    CHECK(cfg.max_queue_size == 100);
    CHECK(cfg.max_retry_attempts == 3);
    CHECK(cfg.allows_cellular_access);
    CHECK(cfg.min_free_disk_space == 1024ULL * 1024 * 1024);
    CHECK(cfg.timeout_interval == std::chrono::seconds{60});
    CHECK_FALSE(cfg.download_directory.empty());
    CHECK_FALSE(cfg.temporary_directory.empty());
    CHECK(cfg.ledger_path.filename() == LEDGER_FILE_NAME);
}

TEST_CASE("parse_config overlays a JSON document", "[config]") {
    ManagerConfig base;
    base.download_directory = "/base/downloads";

    SECTION("Only present keys change") {
        auto cfg = parse_config(R"({"maxConcurrentDownloads": 5, "temporaryDirectory": "/tmp/x"})", base);
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_concurrent_downloads == 5);
        CHECK(cfg->temporary_directory == "/tmp/x");
        CHECK(cfg->download_directory == "/base/downloads");
        CHECK(cfg->max_queue_size == DEFAULT_MAX_QUEUE_SIZE);
    }

    SECTION("Durations") {
        auto cfg = parse_config(R"({"timeoutInterval": 15, "pollIntervalMs": 250})", base);
        REQUIRE(cfg.has_value());
        CHECK(cfg->timeout_interval == std::chrono::seconds{15});
        CHECK(cfg->poll_interval == std::chrono::milliseconds{250});
    }

    SECTION("Empty object keeps everything") {
        auto cfg = parse_config("{}", base);
        REQUIRE(cfg.has_value());
        CHECK(cfg->download_directory == base.download_directory);
    }

    SECTION("Wrong value type") {
        auto cfg = parse_config(R"({"maxQueueSize": "lots"})", base);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == DiskErrc::corrupt_record);
    }

    SECTION("Not an object") {
        CHECK(parse_config("[1, 2]", base).error() == DiskErrc::corrupt_record);
        CHECK(parse_config("not json", base).error() == DiskErrc::corrupt_record);
    }

    SECTION("Zero concurrency or queue size is rejected") {
        CHECK_FALSE(parse_config(R"({"maxConcurrentDownloads": 0})", base).has_value());
        CHECK_FALSE(parse_config(R"({"maxQueueSize": 0})", base).has_value());
    }
}

TEST_CASE("load_config", "[config]") {
    surge::test::TempDirectory dir;

    SECTION("Missing file") {
        auto cfg = load_config(dir / "absent.json");
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == DiskErrc::file_not_found);
    }

    SECTION("File on top of defaults") {
        surge::test::write_file(dir / "surge.json", R"({"minFreeDiskSpace": 4096, "allowsCellularAccess": false})");
        auto cfg = load_config(dir / "surge.json");
        REQUIRE(cfg.has_value());
        CHECK(cfg->min_free_disk_space == 4096);
        CHECK_FALSE(cfg->allows_cellular_access);
        CHECK(cfg->max_concurrent_downloads == DEFAULT_MAX_CONCURRENT_DOWNLOADS);
    }
}
