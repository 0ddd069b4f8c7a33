/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/cli_options.hpp"

#include <algorithm>
#include <format>

#include "include/utils.hpp"

namespace {

std::expected<int, std::string> positive_int(std::string_view option, std::string_view value) {
    auto parsed = parse_number<int>(value);
    if (!parsed || *parsed <= 0) {
        return std::unexpected(std::format("Option '{}' expects a positive integer, got '{}'", option, value));
    }
    return *parsed;
}

std::expected<int, std::string> server_id(std::string_view option, std::string_view value) {
    auto parsed = parse_number<int>(value);
    if (!parsed) {
        return std::unexpected(std::format("Option '{}' expects a server id, got '{}'", option, value));
    }
    return *parsed;
}

}

std::expected<CliOptions, std::string> parse_cli_options(std::span<const std::string_view> args) {
    CliOptions opts;
    bool want_v4 = false;
    bool want_v6 = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        std::optional<std::string_view> inline_value;

        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto value = [&]() -> std::expected<std::string_view, std::string> {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("Option '{}' requires a value", arg));
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "--list") {
            opts.list = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--local-json") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.local_json = std::string(*v);
        } else if (arg == "--server" || arg == "--exclude") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto id = server_id(arg, *v);
            if (!id) return std::unexpected(id.error());
            (arg == "--server" ? opts.server_ids : opts.exclude_ids).push_back(*id);
        } else if (arg == "--no-download") {
            opts.test.no_download = true;
        } else if (arg == "--no-upload") {
            opts.test.no_upload = true;
        } else if (arg == "--no-pre-allocate") {
            opts.test.no_preallocate = true;
        } else if (arg == "--bytes") {
            opts.test.use_bytes = true;
        } else if (arg == "--mebibytes") {
            opts.test.use_mebi = true;
        } else if (arg == "--concurrent" || arg == "--chunks" || arg == "--duration") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = positive_int(arg, *v);
            if (!n) return std::unexpected(n.error());
            if (arg == "--concurrent") {
                opts.test.concurrency = *n;
            } else if (arg == "--chunks") {
                opts.test.chunks = *n;
            } else {
                opts.test.duration = std::chrono::seconds(*n);
            }
        } else if (arg == "--source") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.test.source_ip = std::string(*v);
        } else if (arg == "-4" || arg == "--ipv4") {
            want_v4 = true;
        } else if (arg == "-6" || arg == "--ipv6") {
            want_v6 = true;
        } else if (arg == "--distance") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto unit = parse_distance_unit(*v);
            if (!unit) return std::unexpected(unit.error());
            opts.test.distance = *unit;
        } else if (arg == "--share") {
            opts.share = true;
        } else if (arg == "--telemetry-level") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto level = parse_telemetry_level(*v);
            if (!level) return std::unexpected(level.error());
            opts.telemetry_level = *level;
        } else if (arg == "--telemetry-json") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.telemetry_json = std::string(*v);
        } else if (arg == "--telemetry-server") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.telemetry_server = std::string(*v);
        } else if (arg == "--telemetry-path") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.telemetry_path = std::string(*v);
        } else if (arg == "--telemetry-share") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.telemetry_share = std::string(*v);
        } else if (arg == "--telemetry-extra") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.test.telemetry_extra = std::string(*v);
        } else if (arg == "--simple") {
            opts.output.simple = true;
        } else if (arg == "--csv") {
            opts.output.csv = true;
        } else if (arg == "--csv-delimiter") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            if (v->size() != 1) {
                return std::unexpected(
                    std::format("Option '--csv-delimiter' expects a single character, got '{}'", *v));
            }
            opts.output.csv_delimiter = v->front();
        } else if (arg == "--csv-header") {
            opts.csv_header = true;
        } else if (arg == "--json") {
            opts.output.json = true;
        } else {
            return std::unexpected(std::format("Unknown option '{}'", args[i]));
        }
    }

    if (want_v4 && want_v6) {
        return std::unexpected("Options '--ipv4' and '--ipv6' are mutually exclusive");
    }
    if (want_v4) opts.test.network = NetworkFamily::IPv4;
    if (want_v6) opts.test.network = NetworkFamily::IPv6;

    return opts;
}

std::expected<TelemetryServer, std::string> resolve_telemetry(const CliOptions& opts) {
    TelemetryServer telemetry;

    if (!opts.telemetry_json.empty()) {
        auto loaded = load_telemetry_server(opts.telemetry_json, telemetry);
        if (!loaded) return std::unexpected(loaded.error());
        telemetry = std::move(*loaded);
    }

    if (opts.telemetry_server) telemetry.server = *opts.telemetry_server;
    if (opts.telemetry_path) telemetry.path = *opts.telemetry_path;
    if (opts.telemetry_share) telemetry.share = *opts.telemetry_share;

    if (opts.telemetry_level) {
        telemetry.level = *opts.telemetry_level;
    } else if (opts.share) {
        telemetry.level = TelemetryLevel::Basic;
    }

    return telemetry;
}

std::expected<std::vector<ServerEntry>, std::string> select_servers(const std::vector<ServerEntry>& all,
                                                                    const CliOptions& opts) {
    auto excluded = [&](const ServerEntry& entry) {
        return std::ranges::find(opts.exclude_ids, entry.id) != opts.exclude_ids.end();
    };

    std::vector<ServerEntry> selected;
    if (!opts.server_ids.empty()) {
        for (int id : opts.server_ids) {
            auto it = std::ranges::find(all, id, &ServerEntry::id);
            if (it == all.end()) {
                return std::unexpected(std::format("No server with id {} in the server list", id));
            }
            if (!excluded(*it)) selected.push_back(*it);
        }
    } else {
        auto it = std::ranges::find_if(all, [&](const ServerEntry& entry) { return !excluded(entry); });
        if (it != all.end()) selected.push_back(*it);
    }

    if (selected.empty()) {
        return std::unexpected("No server selected for testing");
    }
    return selected;
}
