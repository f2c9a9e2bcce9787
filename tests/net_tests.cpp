// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/error.hpp>
#include <surge/core/url.hpp>
#include <surge/net/connectivity.hpp>
#include <surge/net/curl_transport.hpp>
#include "temp_directory.hpp"
#include <curl/curl.h>
#include <condition_variable>
#include <mutex>

using namespace surge::net;
using surge::core::DownloadErrc;

TEST_CASE("curl_error mapping", "[curl]") {
    CHECK_FALSE(curl_error(CURLE_OK, 200));

    SECTION("HTTP status refines CURLE_HTTP_RETURNED_ERROR") {
        CHECK(curl_error(CURLE_HTTP_RETURNED_ERROR, 404) == DownloadErrc::not_found);
        CHECK(curl_error(CURLE_HTTP_RETURNED_ERROR, 410) == DownloadErrc::not_found);
        CHECK(curl_error(CURLE_HTTP_RETURNED_ERROR, 416) == DownloadErrc::invalid_range);
        CHECK(curl_error(CURLE_HTTP_RETURNED_ERROR, 503) == DownloadErrc::server_error);
        CHECK(curl_error(CURLE_HTTP_RETURNED_ERROR, 403) == DownloadErrc::network_error);
    }

    SECTION("Transport level failures") {
        CHECK(curl_error(CURLE_COULDNT_RESOLVE_HOST, 0) == DownloadErrc::dns_error);
        CHECK(curl_error(CURLE_OPERATION_TIMEDOUT, 0) == DownloadErrc::timeout);
        CHECK(curl_error(CURLE_PEER_FAILED_VERIFICATION, 0) == DownloadErrc::ssl_error);
        CHECK(curl_error(CURLE_TOO_MANY_REDIRECTS, 0) == DownloadErrc::too_many_redirects);
        CHECK(curl_error(CURLE_WRITE_ERROR, 0) == DownloadErrc::file_error);
        CHECK(curl_error(CURLE_PARTIAL_FILE, 0) == DownloadErrc::connection_lost);
        CHECK(curl_error(CURLE_COULDNT_CONNECT, 0) == DownloadErrc::network_error);
    }
}

TEST_CASE("ManualConnectivity notifies on change only", "[connectivity]") {
    ManualConnectivity connectivity;
    CHECK(connectivity.online());

    std::vector<bool> seen;
    connectivity.set_listener([&](bool online) { seen.push_back(online); });

    connectivity.set_online(true);
    connectivity.set_online(false);
    connectivity.set_online(false);
    connectivity.set_online(true);
    CHECK(seen == std::vector<bool>{false, true});

    connectivity.set_listener({});
    connectivity.set_online(false);
    CHECK(seen.size() == 2);
    CHECK_FALSE(connectivity.online());
}

TEST_CASE("ProbeConnectivity can be stopped before it starts", "[connectivity]") {
    ProbeConnectivity probe("https://127.0.0.1:1", std::chrono::milliseconds{10});
    CHECK(probe.online());
    probe.stop();
}

TEST_CASE("CurlTransport reports a refused connection", "[curl][loopback]") {
    CurlTransport::global_init();
    surge::test::TempDirectory dir;

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<surge::core::TransferFailed> failure;
    {
        CurlTransport transport(dir.path(), std::chrono::seconds{5});
        transport.bind([&](surge::core::TransportMessage message) {
            if (auto* failed = std::get_if<surge::core::TransferFailed>(&message)) {
                std::lock_guard<std::mutex> lock(mutex);
                failure = *failed;
                cv.notify_all();
            }
        });

        // Nothing listens on port 1
        auto task = surge::core::DownloadTask::create(*surge::core::Url::parse("https://127.0.0.1:1/file.bin"));
        auto handle = transport.start(task);
        REQUIRE(handle.has_value());

        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds{10}, [&] { return failure.has_value(); }));
        CHECK(failure->id == task.id);
        CHECK(failure->error);

        lock.unlock();
        transport.bind({});
    }
    CurlTransport::global_cleanup();
}
