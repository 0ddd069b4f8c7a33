/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <catch2/catch.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "include/cli_renderer.hpp"
#include "include/librespeed_server.hpp"

namespace {

constexpr const char* kServerList = R"([
    {
        "id": 51,
        "name": "Frankfurt, Germany (Clouvider)",
        "server": "//fra.speedtest.example.net/",
        "dlURL": "garbage.php",
        "ulURL": "empty.php",
        "pingURL": "empty.php",
        "getIpURL": "getIP.php",
        "sponsorName": "Clouvider",
        "sponsorURL": "https://www.clouvider.co.uk/"
    },
    {
        "id": 7,
        "name": "Amsterdam",
        "server": "https://ams.speedtest.example.net/backend/",
        "dlURL": "garbage.php",
        "ulURL": "empty.php",
        "pingURL": "empty.php",
        "getIpURL": "getIP.php"
    }
])";

// Fails the way HttpClient does when curl_easy_init returns null.
class SessionlessServer : public LibreSpeedServer {
   public:
    using LibreSpeedServer::LibreSpeedServer;
    std::atomic<int> attempts{0};

   protected:
    std::unique_ptr<HttpClient> make_client(const HttpOptions&) override {
        ++attempts;
        throw std::runtime_error("curl_easy_init failed");
    }
};

}

TEST_CASE("server list parses LibreSpeed entries") {
    auto servers = parse_server_list(kServerList);
    REQUIRE(servers.has_value());
    REQUIRE(servers->size() == 2);

    const auto& fra = (*servers)[0];
    REQUIRE(fra.id == 51);
    REQUIRE(fra.name == "Frankfurt, Germany (Clouvider)");
    REQUIRE(fra.download_url == "garbage.php");
    REQUIRE(fra.upload_url == "empty.php");
    REQUIRE(fra.get_ip_url == "getIP.php");
    REQUIRE(fra.sponsor_url == "https://www.clouvider.co.uk/");
    REQUIRE((*servers)[1].sponsor_name.empty());
}

TEST_CASE("server list rejects malformed documents") {
    REQUIRE_FALSE(parse_server_list("{}").has_value());
    REQUIRE_FALSE(parse_server_list("[1, 2]").has_value());
    REQUIRE_FALSE(parse_server_list("[{\"id\": 1").has_value());

    auto no_url = parse_server_list(R"([{"id": 4, "name": "nowhere"}])");
    REQUIRE_FALSE(no_url.has_value());
    REQUIRE(no_url.error() == "Server 'nowhere' (id 4) has no URL");
}

TEST_CASE("missing server list file is an error") {
    REQUIRE_FALSE(load_server_list("/nonexistent/sepal/servers.json").has_value());
}

TEST_CASE("LibreSpeed server resolves URL and sponsor without network access") {
    auto servers = parse_server_list(kServerList);
    REQUIRE(servers.has_value());

    LibreSpeedServer fra((*servers)[0], HttpOptions{});
    REQUIRE(fra.name() == "Frankfurt, Germany (Clouvider)");
    REQUIRE(fra.resolve_url().value() == "https://fra.speedtest.example.net/");
    REQUIRE(fra.sponsor() == "Clouvider @ https://www.clouvider.co.uk/");

    LibreSpeedServer ams((*servers)[1], HttpOptions{});
    REQUIRE(ams.sponsor().empty());
}

TEST_CASE("a server without an HTTP session reports errors instead of throwing") {
    auto servers = parse_server_list(kServerList);
    REQUIRE(servers.has_value());
    SessionlessServer fra((*servers)[0], HttpOptions{});

    REQUIRE_FALSE(fra.is_up());

    auto isp = fra.lookup_isp_info(DistanceUnit::Kilometers);
    REQUIRE_FALSE(isp.has_value());
    REQUIRE(isp.error() == "Cannot open HTTP session: curl_easy_init failed");

    REQUIRE_FALSE(fra.ping_and_jitter(10, "", NetworkFamily::Any).has_value());

    TransferOptions transfer;
    transfer.concurrency = 2;
    transfer.duration = std::chrono::seconds(1);
    auto down = fra.download(transfer);
    REQUIRE_FALSE(down.has_value());
    REQUIRE(down.error() == "Cannot open HTTP session: curl_easy_init failed");

    transfer.no_preallocate = true;
    REQUIRE_FALSE(fra.upload(transfer).has_value());

    REQUIRE(fra.attempts.load() == 7);
}

TEST_CASE("server list lines show id, name, host and sponsor") {
    auto servers = parse_server_list(kServerList);
    REQUIRE(servers.has_value());
    REQUIRE(CliRenderer::format_server_line((*servers)[0]) ==
            "51: Frankfurt, Germany (Clouvider) (fra.speedtest.example.net) Sponsor: Clouvider");
    REQUIRE(CliRenderer::format_server_line((*servers)[1]) == "7: Amsterdam (ams.speedtest.example.net)");
}

TEST_CASE("ping is the mean and jitter is smoothed") {
    std::array<double, 4> samples{10.0, 20.0, 15.0, 15.0};
    PingResult r = compute_ping_jitter(samples);
    REQUIRE(r.ping_ms == Approx(15.0));
    REQUIRE(r.jitter_ms == Approx(5.95));
}

TEST_CASE("jitter rises slowly on a spike") {
    std::array<double, 3> samples{10.0, 11.0, 21.0};
    PingResult r = compute_ping_jitter(samples);
    REQUIRE(r.jitter_ms == Approx(10.0 * 0.2 + 1.0 * 0.8));
}

TEST_CASE("degenerate ping samples") {
    REQUIRE(compute_ping_jitter(std::vector<double>{}).ping_ms == 0.0);

    std::array<double, 1> one{42.0};
    PingResult r = compute_ping_jitter(one);
    REQUIRE(r.ping_ms == Approx(42.0));
    REQUIRE(r.jitter_ms == 0.0);
}
