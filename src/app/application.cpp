/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "include/cli_options.hpp"
#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/config.hpp"
#include "include/http_client.hpp"
#include "include/http_context.hpp"
#include "include/interrupts.hpp"
#include "include/librespeed_server.hpp"
#include "include/logger.hpp"
#include "include/report_formatter.hpp"
#include "include/speed_test.hpp"
#include "include/telemetry.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} --local-json FILE [options]", app_name);
    std::println("");
    std::println("Server selection:");
    std::println("  --local-json FILE         LibreSpeed server list (JSON array)");
    std::println("  --list                    List servers in the server list and exit");
    std::println("  --server ID               Test against server ID (repeatable)");
    std::println("  --exclude ID              Skip server ID (repeatable)");
    std::println("");
    std::println("Test options:");
    std::println("  --no-download             Skip the download test");
    std::println("  --no-upload               Skip the upload test");
    std::println("  --no-pre-allocate         Generate upload data per request");
    std::println("  --concurrent N            Concurrent HTTP streams (default {})", Config::DEFAULT_CONCURRENCY);
    std::println("  --chunks N                Download chunk count per request (default {})", Config::DEFAULT_CHUNKS);
    std::println("  --duration SEC            Upper bound per transfer test (default {})", Config::DEFAULT_DURATION_SEC);
    std::println("  --source IP               Bind to source address IP");
    std::println("  -4, --ipv4 / -6, --ipv6   Force IPv4 or IPv6");
    std::println("  --distance mi|km|NM       Distance unit for the ISP lookup (default km)");
    std::println("");
    std::println("Telemetry:");
    std::println("  --share                   Submit results and print a share link");
    std::println("  --telemetry-level LEVEL   disabled, basic, full or debug");
    std::println("  --telemetry-json FILE     Telemetry endpoint config");
    std::println("  --telemetry-server URL    Telemetry server base URL");
    std::println("  --telemetry-path PATH     Submission path on the telemetry server");
    std::println("  --telemetry-share PATH    Share page path on the telemetry server");
    std::println("  --telemetry-extra TEXT    Extra metadata sent with the result");
    std::println("");
    std::println("Output:");
    std::println("  --simple                  Print only ping, jitter and rates");
    std::println("  --bytes                   Show rates in bytes per second");
    std::println("  --mebibytes               Use 1024 instead of 1000 with --bytes");
    std::println("  --csv                     CSV rows (takes precedence over --json)");
    std::println("  --csv-delimiter C         CSV delimiter (default ',')");
    std::println("  --csv-header              Print the CSV header and exit");
    std::println("  --json                    JSON array of reports");
    std::println("  --verbose                 Debug logging");
    std::println("  -h, --help                Show this help message");
    std::println("  -v, --version             Show version information");
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

void Application::report_error(std::string_view message) const {
    std::println(stderr, "{}Error: {}{}", Color::RED, message, Color::RESET);
}

int Application::run(int argc, char* argv[]) {
    try {
        SignalGuard signal_guard;
        HttpContext http_context;

        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        std::vector<std::string_view> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        auto parsed = parse_cli_options(args);
        if (!parsed) {
            report_error(parsed.error());
            show_help(app_name);
            return 1;
        }
        CliOptions& opts = *parsed;

        if (opts.show_help) {
            show_help(app_name);
            return 0;
        }
        if (opts.show_version) {
            show_version();
            return 0;
        }
        if (opts.csv_header) {
            auto header = ReportFormatter::csv_header(opts.output.csv_delimiter);
            if (!header) {
                report_error(header.error());
                return 1;
            }
            std::print("{}", *header);
            return 0;
        }

        if (opts.local_json.empty()) {
            report_error("A server list is required (--local-json FILE)");
            return 1;
        }

        auto all_servers = load_server_list(opts.local_json);
        if (!all_servers) {
            report_error(all_servers.error());
            return 1;
        }

        if (opts.list) {
            CliRenderer::render_server_list(*all_servers);
            return 0;
        }

        auto telemetry = resolve_telemetry(opts);
        if (!telemetry) {
            report_error(telemetry.error());
            return 1;
        }
        opts.test.telemetry = *telemetry;

        auto selected = select_servers(*all_servers, opts);
        if (!selected) {
            report_error(selected.error());
            return 1;
        }

        const bool quiet = opts.output.simple || opts.output.csv || opts.output.json;
        LogLevel level = LogLevel::Info;
        if (opts.verbose) {
            level = LogLevel::Debug;
        } else if (quiet) {
            level = LogLevel::Warn;
        }
        Logger log(std::cerr, level, stderr_is_terminal());

        auto start_time = steady_clock::now();
        if (!quiet) {
            print_centered_header(std::format("{} v{} - LibreSpeed Speed Test", Config::APP_NAME, Config::APP_VERSION));
        }

        HttpOptions http_options{opts.test.source_ip, opts.test.network};
        std::vector<std::unique_ptr<SpeedServer>> servers;
        servers.reserve(selected->size());
        for (auto& entry : *selected) {
            servers.push_back(std::make_unique<LibreSpeedServer>(std::move(entry), http_options));
        }

        HttpClient telemetry_http;
        SpeedTest st(opts.test, log, make_http_poster(telemetry_http));

        SpinnerCallback spinner_cb;
        if (!quiet) spinner_cb = CliRenderer::make_spinner_callback();

        auto result = st.run_interactive(servers, opts.output, std::cout, spinner_cb);
        if (!result) {
            std::println(stderr, "{}Speedtest Error: {}{}", Color::RED, result.error(), Color::RESET);
            return 1;
        }

        if (!quiet) {
            print_line();
            double elapsed_sec = duration<double>(steady_clock::now() - start_time).count();
            std::println(" Finished in        : {:.0f} sec", elapsed_sec);
        }
    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        return 1;
    }

    return 0;
}
