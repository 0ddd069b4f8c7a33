/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <catch2/catch.hpp>

#include <chrono>

#include <nlohmann/json.hpp>

#include "include/results.hpp"

using json = nlohmann::json;
using namespace std::chrono;

TEST_CASE("round2 rounds to two decimals") {
    REQUIRE(round2(93.456) == Approx(93.46));
    REQUIRE(round2(12.344) == Approx(12.34));
    REQUIRE(round2(-1.236) == Approx(-1.24));
    REQUIRE(round2(0.0) == 0.0);
}

TEST_CASE("round2 is idempotent") {
    for (double v : {0.1, 1.005, 93.456, 1234.5678, 7.0}) {
        REQUIRE(round2(round2(v)) == round2(v));
    }
}

TEST_CASE("timestamps are UTC with milliseconds") {
    auto tp = sys_days{year{2024} / 1 / 2} + hours{3} + minutes{4} + seconds{5} + milliseconds{678};
    REQUIRE(format_timestamp(tp) == "2024-01-02T03:04:05.678Z");

    auto fine = tp + microseconds{999};
    REQUIRE(format_timestamp(fine) == "2024-01-02T03:04:05.678Z");
}

TEST_CASE("flatten copies report fields into CSV order") {
    Report rep;
    rep.server.name = "alpha";
    rep.server.url = "https://speed.example.net/";
    rep.client.ip = "203.0.113.7";
    rep.ping = 1.5;
    rep.download = 10.0;
    rep.share = "https://librespeed.org/results/?id=x";

    FlatReport flat = flatten(rep);
    REQUIRE(flat.name == "alpha");
    REQUIRE(flat.address == "https://speed.example.net/");
    REQUIRE(flat.ip == "203.0.113.7");
    REQUIRE(flat.ping == 1.5);
    REQUIRE(flat.download == 10.0);
    REQUIRE(flat.share == rep.share);
}

TEST_CASE("report JSON uses the documented keys") {
    Report rep;
    rep.server.name = "alpha";
    rep.bytes_sent = 10;
    rep.bytes_received = 20;

    json j = rep;
    for (const char* key : {"timestamp", "server", "client", "bytes_sent", "bytes_received",
                            "ping", "jitter", "upload", "download", "share"}) {
        REQUIRE(j.contains(key));
    }
    REQUIRE(j.size() == 10);
    REQUIRE(j["bytes_sent"] == 10);
    REQUIRE(j["bytes_received"] == 20);
    REQUIRE(j["server"]["name"] == "alpha");
}

TEST_CASE("client readme is omitted when empty") {
    IpInfoResponse info;
    info.ip = "203.0.113.7";
    json plain = info;
    REQUIRE_FALSE(plain.contains("readme"));

    info.readme = "https://ipinfo.io/missingauth";
    json with = info;
    REQUIRE(with["readme"] == "https://ipinfo.io/missingauth");
}

TEST_CASE("ISP info decodes the getIP response") {
    auto j = json::parse(R"json({
        "processedString": "203.0.113.7 - Example ISP, DE (12 km)",
        "rawIspInfo": {"ip": "203.0.113.7", "org": "AS64500 Example ISP", "country": "DE"}
    })json");
    auto info = j.get<IspInfo>();
    REQUIRE(info.processed_string == "203.0.113.7 - Example ISP, DE (12 km)");
    REQUIRE(info.raw_isp_info.org == "AS64500 Example ISP");
    REQUIRE(info.raw_isp_info.city.empty());
}

TEST_CASE("ISP info tolerates a non-object rawIspInfo") {
    auto j = json::parse(R"({"processedString": "203.0.113.7", "rawIspInfo": ""})");
    auto info = j.get<IspInfo>();
    REQUIRE(info.processed_string == "203.0.113.7");
    REQUIRE(info.raw_isp_info.ip.empty());
}
