/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/telemetry.hpp"

#include <format>
#include <utility>

#include <nlohmann/json.hpp>

#include "include/config.hpp"
#include "include/url.hpp"

using json = nlohmann::json;

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\v\f";

template <typename T>
std::expected<std::string, std::string> encode_json(std::string_view field, const T& value) {
    try {
        return json(value).dump();
    } catch (const json::exception& e) {
        return std::unexpected(std::format("Cannot encode form field '{}': {}", field, e.what()));
    }
}

std::string fixed2(double value) {
    return std::format("{:.2f}", value);
}

}

std::expected<std::vector<FormField>, std::string> build_telemetry_form(const TelemetryPayload& payload) {
    auto isp = encode_json("ispinfo", payload.isp);
    if (!isp) return std::unexpected(isp.error());

    auto extra = encode_json("extra", payload.extra);
    if (!extra) return std::unexpected(extra.error());

    return std::vector<FormField>{
        {"ispinfo", std::move(*isp)},
        {"dl", fixed2(payload.download)},
        {"ul", fixed2(payload.upload)},
        {"ping", fixed2(payload.ping)},
        {"jitter", fixed2(payload.jitter)},
        {"log", payload.log},
        {"extra", std::move(*extra)},
    };
}

std::expected<std::string, std::string> parse_result_id(std::string_view body) {
    std::vector<std::string_view> tokens;
    std::string_view rest = body;
    while (true) {
        auto start = rest.find_first_not_of(kWhitespace);
        if (start == std::string_view::npos) break;
        rest.remove_prefix(start);
        auto end = rest.find_first_of(kWhitespace);
        tokens.push_back(rest.substr(0, end));
        if (end == std::string_view::npos) break;
        rest.remove_prefix(end);
    }

    if (tokens.size() != 2) {
        return std::unexpected(std::format("Server returned invalid response: {}", body));
    }
    return std::string(tokens[1]);
}

std::expected<std::string, std::string> build_share_url(const TelemetryServer& server, std::string_view id) {
    auto base = server.share_url();
    if (!base) return std::unexpected(base.error());
    return Url::set_query_param(*base, "id", id);
}

TelemetryClient::TelemetryClient(TelemetryServer server, FormPoster poster)
    : server_(std::move(server)), poster_(std::move(poster)) {}

std::expected<std::string, std::string> TelemetryClient::submit(const TelemetryPayload& payload) const {
    if (!poster_) {
        return std::unexpected("No telemetry transport configured");
    }

    auto fields = build_telemetry_form(payload);
    if (!fields) return std::unexpected(fields.error());

    auto endpoint = server_.endpoint_url();
    if (!endpoint) return std::unexpected(endpoint.error());

    auto body = poster_(*endpoint, *fields, Config::USER_AGENT);
    if (!body) return std::unexpected(body.error());

    auto id = parse_result_id(*body);
    if (!id) return std::unexpected(id.error());

    return build_share_url(server_, *id);
}

FormPoster make_http_poster(HttpClient& http) {
    return [&http](const std::string& url, const std::vector<FormField>& fields, std::string_view user_agent) {
        return http.post_form(url, fields, user_agent);
    };
}
