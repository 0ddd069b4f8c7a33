// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

// Client-side network identity as returned by the ISP lookup endpoint.
struct IpInfoResponse {
    std::string ip;
    std::string hostname;
    std::string city;
    std::string region;
    std::string country;
    std::string loc;
    std::string org;
    std::string postal;
    std::string timezone;
    std::string readme;
};

struct IspInfo {
    std::string processed_string;
    IpInfoResponse raw_isp_info;
};

struct ServerInfo {
    std::string name;
    std::string url;
};

struct TelemetryExtra {
    std::string server_name;
    std::string extra;
};

struct Report {
    std::chrono::system_clock::time_point timestamp{};
    ServerInfo server;
    IpInfoResponse client;
    std::uint64_t bytes_sent = 0;
    std::uint64_t bytes_received = 0;
    double ping = 0.0;
    double jitter = 0.0;
    double upload = 0.0;
    double download = 0.0;
    std::string share;
};

// One CSV row; columns follow declaration order.
struct FlatReport {
    std::string timestamp;
    std::string name;
    std::string address;
    double ping = 0.0;
    double jitter = 0.0;
    double download = 0.0;
    double upload = 0.0;
    std::string share;
    std::string ip;
};

// Round half away from zero to two decimal places.
[[nodiscard]] double round2(double value) noexcept;

// RFC 3339, UTC, millisecond precision.
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

[[nodiscard]] FlatReport flatten(const Report& report);

void to_json(nlohmann::json& j, const IpInfoResponse& info);
void from_json(const nlohmann::json& j, IpInfoResponse& info);
void to_json(nlohmann::json& j, const IspInfo& info);
void from_json(const nlohmann::json& j, IspInfo& info);
void to_json(nlohmann::json& j, const ServerInfo& server);
void to_json(nlohmann::json& j, const TelemetryExtra& extra);
void to_json(nlohmann::json& j, const Report& report);
