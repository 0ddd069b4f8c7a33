/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/results.hpp"

#include <cmath>
#include <format>

using json = nlohmann::json;

double round2(double value) noexcept {
    return std::round(value * 100.0) / 100.0;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
    return std::format("{:%FT%T}Z", ms);
}

FlatReport flatten(const Report& report) {
    FlatReport flat;
    flat.timestamp = format_timestamp(report.timestamp);
    flat.name = report.server.name;
    flat.address = report.server.url;
    flat.ping = report.ping;
    flat.jitter = report.jitter;
    flat.download = report.download;
    flat.upload = report.upload;
    flat.share = report.share;
    flat.ip = report.client.ip;
    return flat;
}

void to_json(json& j, const IpInfoResponse& info) {
    j = json{
        {"ip", info.ip},
        {"hostname", info.hostname},
        {"city", info.city},
        {"region", info.region},
        {"country", info.country},
        {"loc", info.loc},
        {"org", info.org},
        {"postal", info.postal},
        {"timezone", info.timezone},
    };
    if (!info.readme.empty()) {
        j["readme"] = info.readme;
    }
}

void from_json(const json& j, IpInfoResponse& info) {
    info.ip = j.value("ip", "");
    info.hostname = j.value("hostname", "");
    info.city = j.value("city", "");
    info.region = j.value("region", "");
    info.country = j.value("country", "");
    info.loc = j.value("loc", "");
    info.org = j.value("org", "");
    info.postal = j.value("postal", "");
    info.timezone = j.value("timezone", "");
    info.readme = j.value("readme", "");
}

void to_json(json& j, const IspInfo& info) {
    j = json{{"processedString", info.processed_string}, {"rawIspInfo", info.raw_isp_info}};
}

void from_json(const json& j, IspInfo& info) {
    info.processed_string = j.value("processedString", "");

    // Backends without an ISP database send an empty string here.
    auto raw = j.find("rawIspInfo");
    if (raw != j.end() && raw->is_object()) {
        info.raw_isp_info = raw->get<IpInfoResponse>();
    } else {
        info.raw_isp_info = {};
    }
}

void to_json(json& j, const ServerInfo& server) {
    j = json{{"name", server.name}, {"url", server.url}};
}

void to_json(json& j, const TelemetryExtra& extra) {
    j = json{{"server", extra.server_name}};
    if (!extra.extra.empty()) {
        j["extra"] = extra.extra;
    }
}

void to_json(json& j, const Report& report) {
    j = json{
        {"timestamp", format_timestamp(report.timestamp)},
        {"server", report.server},
        {"client", report.client},
        {"bytes_sent", report.bytes_sent},
        {"bytes_received", report.bytes_received},
        {"ping", report.ping},
        {"jitter", report.jitter},
        {"upload", report.upload},
        {"download", report.download},
        {"share", report.share},
    };
}
