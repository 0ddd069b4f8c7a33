/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "librespeed_server.hpp"
#include "test_options.hpp"

struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list = false;
    bool csv_header = false;
    bool verbose = false;
    bool share = false;

    std::filesystem::path local_json;
    std::vector<int> server_ids;
    std::vector<int> exclude_ids;

    TestOptions test;
    OutputOptions output;

    std::optional<TelemetryLevel> telemetry_level;
    std::filesystem::path telemetry_json;
    std::optional<std::string> telemetry_server;
    std::optional<std::string> telemetry_path;
    std::optional<std::string> telemetry_share;
};

// `args` excludes the program name. Accepts both "--opt value" and "--opt=value".
std::expected<CliOptions, std::string> parse_cli_options(std::span<const std::string_view> args);

// Defaults, then the --telemetry-json file, then individual flags.
std::expected<TelemetryServer, std::string> resolve_telemetry(const CliOptions& opts);

// Explicit --server ids in the order given; otherwise the first entry not excluded.
std::expected<std::vector<ServerEntry>, std::string> select_servers(const std::vector<ServerEntry>& all,
                                                                    const CliOptions& opts);
