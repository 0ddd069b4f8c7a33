/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "http_client.hpp"
#include "results.hpp"
#include "test_options.hpp"

// Sends a multipart form and hands back the raw response body.
using FormPoster = std::function<std::expected<std::string, std::string>(
    const std::string& url, const std::vector<FormField>& fields, std::string_view user_agent)>;

struct TelemetryPayload {
    IspInfo isp;
    double download = 0.0;
    double upload = 0.0;
    double ping = 0.0;
    double jitter = 0.0;
    std::string log;
    TelemetryExtra extra;
};

std::expected<std::vector<FormField>, std::string> build_telemetry_form(const TelemetryPayload& payload);

// The endpoint answers "<token> <id>"; anything but exactly two tokens is rejected.
std::expected<std::string, std::string> parse_result_id(std::string_view body);

std::expected<std::string, std::string> build_share_url(const TelemetryServer& server, std::string_view id);

class TelemetryClient {
    TelemetryServer server_;
    FormPoster poster_;

   public:
    TelemetryClient(TelemetryServer server, FormPoster poster);

    int level() const noexcept { return server_.level_value(); }

    // Returns the share URL for the submitted result.
    std::expected<std::string, std::string> submit(const TelemetryPayload& payload) const;
};

FormPoster make_http_poster(HttpClient& http);
