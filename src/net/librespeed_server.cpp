/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/librespeed_server.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <sstream>
#include <thread>
#include <utility>

#include "include/config.hpp"
#include "include/interrupts.hpp"
#include "include/url.hpp"

using json = nlohmann::json;
using namespace std::chrono;

namespace {

std::vector<char> random_payload(std::size_t size) {
    std::vector<char> data(size);
    std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::generate(data.begin(), data.end(), [&] { return static_cast<char>(dist(rng)); });
    return data;
}

}

void from_json(const json& j, ServerEntry& entry) {
    entry.id = j.value("id", 0);
    entry.name = j.value("name", "");
    entry.server = j.value("server", "");
    entry.download_url = j.value("dlURL", "");
    entry.upload_url = j.value("ulURL", "");
    entry.ping_url = j.value("pingURL", "");
    entry.get_ip_url = j.value("getIpURL", "");
    entry.sponsor_name = j.value("sponsorName", "");
    entry.sponsor_url = j.value("sponsorURL", "");
}

std::expected<std::vector<ServerEntry>, std::string> parse_server_list(std::string_view text) {
    try {
        auto data = json::parse(text);
        if (!data.is_array()) {
            return std::unexpected("Server list must be a JSON array");
        }

        std::vector<ServerEntry> servers;
        servers.reserve(data.size());
        for (const auto& item : data) {
            if (!item.is_object()) {
                return std::unexpected("Server list entries must be JSON objects");
            }
            auto entry = item.get<ServerEntry>();
            if (entry.server.empty()) {
                return std::unexpected(std::format("Server '{}' (id {}) has no URL", entry.name, entry.id));
            }
            servers.push_back(std::move(entry));
        }
        return servers;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("Malformed server list: {}", e.what()));
    }
}

std::expected<std::vector<ServerEntry>, std::string> load_server_list(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        return std::unexpected(std::format("Cannot open server list '{}'", file.string()));
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_server_list(ss.str());
}

LibreSpeedServer::LibreSpeedServer(ServerEntry entry, HttpOptions http_options)
    : SpeedServer(entry.name), entry_(std::move(entry)), http_options_(std::move(http_options)) {}

std::expected<std::string, std::string> LibreSpeedServer::endpoint(std::string_view path) const {
    auto base = Url::normalize(entry_.server);
    if (!base) return std::unexpected(base.error());
    return Url::join_path(*base, path);
}

std::expected<std::string, std::string> LibreSpeedServer::resolve_url() {
    return Url::normalize(entry_.server);
}

std::string LibreSpeedServer::sponsor() const {
    if (entry_.sponsor_name.empty()) return {};
    if (entry_.sponsor_url.empty()) return entry_.sponsor_name;
    return std::format("{} @ {}", entry_.sponsor_name, entry_.sponsor_url);
}

std::unique_ptr<HttpClient> LibreSpeedServer::make_client(const HttpOptions& options) {
    return std::make_unique<HttpClient>(options);
}

std::expected<std::unique_ptr<HttpClient>, std::string> LibreSpeedServer::open_client(const HttpOptions& options) {
    try {
        return make_client(options);
    } catch (const std::runtime_error& e) {
        return std::unexpected(std::format("Cannot open HTTP session: {}", e.what()));
    }
}

bool LibreSpeedServer::is_up() {
    auto url = endpoint(entry_.ping_url);
    if (!url) return false;

    auto http = open_client(http_options_);
    if (!http) {
        telemetry_log().warn("liveness probe failed: {}", http.error());
        return false;
    }
    auto res = (*http)->get(*url, Config::LIVENESS_TIMEOUT_SEC);
    if (!res) {
        telemetry_log().warn("liveness probe failed: {}", res.error());
        return false;
    }
    return res->status == 200;
}

std::expected<IspInfo, std::string> LibreSpeedServer::lookup_isp_info(DistanceUnit unit) {
    auto url = endpoint(entry_.get_ip_url);
    if (!url) return std::unexpected(url.error());
    url = Url::set_query_param(*url, "isp", "true");
    if (!url) return std::unexpected(url.error());
    url = Url::set_query_param(*url, "distance", to_string(unit));
    if (!url) return std::unexpected(url.error());

    auto http = open_client(http_options_);
    if (!http) return std::unexpected(http.error());
    auto res = (*http)->get(*url, Config::HTTP_TIMEOUT_SEC);
    if (!res) return std::unexpected(res.error());
    if (res->status != 200) {
        return std::unexpected(std::format("IP lookup returned HTTP {}", res->status));
    }

    try {
        auto data = json::parse(res->body);
        if (!data.is_object()) {
            return std::unexpected("IP lookup response is not a JSON object");
        }
        auto info = data.get<IspInfo>();
        telemetry_log().info("client: {}", info.processed_string);
        return info;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("Malformed IP lookup response: {}", e.what()));
    }
}

std::expected<PingResult, std::string> LibreSpeedServer::ping_and_jitter(int count,
                                                                         const std::string& source_ip,
                                                                         NetworkFamily family) {
    auto url = endpoint(entry_.ping_url);
    if (!url) return std::unexpected(url.error());

    auto http = open_client(HttpOptions{source_ip, family});
    if (!http) return std::unexpected(http.error());
    std::vector<double> samples;
    samples.reserve(static_cast<std::size_t>(std::max(count, 0)));

    for (int i = 0; i < count; ++i) {
        auto ms = (*http)->timed_get(*url);
        if (!ms) {
            telemetry_log().warn("ping probe {} failed: {}", i + 1, ms.error());
            return std::unexpected(ms.error());
        }
        telemetry_log().debug("ping probe {}: {:.3f} ms", i + 1, *ms);
        samples.push_back(*ms);
    }

    auto result = compute_ping_jitter(samples);
    telemetry_log().info("ping {:.2f} ms, jitter {:.2f} ms", result.ping_ms, result.jitter_ms);
    return result;
}

std::expected<TransferResult, std::string> LibreSpeedServer::run_transfer(std::string_view label,
                                                                          const TransferOptions& opts,
                                                                          const TransferStep& step) {
    const int workers = std::max(1, opts.concurrency);
    const seconds limit = opts.duration.count() > 0 ? opts.duration : seconds(Config::DEFAULT_DURATION_SEC);

    std::atomic<std::uint64_t> bytes{0};
    std::mutex error_mutex;
    std::string first_error;

    auto record_error = [&](std::string message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (first_error.empty()) first_error = std::move(message);
    };

    const auto start = steady_clock::now();
    const auto deadline = start + limit;
    {
        std::vector<std::jthread> pool;
        pool.reserve(static_cast<std::size_t>(workers));
        for (int i = 0; i < workers; ++i) {
            pool.emplace_back([&] {
                auto http = open_client(http_options_);
                if (!http) {
                    record_error(http.error());
                    return;
                }
                try {
                    while (steady_clock::now() < deadline && !g_interrupted) {
                        if (auto res = step(**http, deadline, bytes); !res) {
                            record_error(res.error());
                            return;
                        }
                    }
                } catch (const std::exception& e) {
                    record_error(e.what());
                }
            });
        }
    }

    if (g_interrupted) {
        return std::unexpected("Operation interrupted by user");
    }

    const double elapsed = duration<double>(steady_clock::now() - start).count();
    const std::uint64_t total = bytes.load();

    if (!first_error.empty()) {
        if (total == 0) return std::unexpected(first_error);
        telemetry_log().warn("{} worker stopped early: {}", label, first_error);
    }

    TransferResult result;
    result.bytes = total;
    result.mbps = elapsed > 0.0 ? static_cast<double>(total) * 8.0 / 1000000.0 / elapsed : 0.0;
    telemetry_log().info("{}: {} bytes in {:.2f} s ({:.2f} Mbps)", label, total, elapsed, result.mbps);
    return result;
}

std::expected<TransferResult, std::string> LibreSpeedServer::download(const TransferOptions& opts) {
    auto url = endpoint(entry_.download_url);
    if (!url) return std::unexpected(url.error());
    url = Url::set_query_param(*url, "ckSize", std::to_string(std::max(1, opts.chunks)));
    if (!url) return std::unexpected(url.error());

    const std::string target = *url;
    return run_transfer("download", opts, [&target](HttpClient& http, steady_clock::time_point deadline,
                                                    std::atomic<std::uint64_t>& counter) {
        return http.stream_get(target, deadline, counter);
    });
}

std::expected<TransferResult, std::string> LibreSpeedServer::upload(const TransferOptions& opts) {
    auto url = endpoint(entry_.upload_url);
    if (!url) return std::unexpected(url.error());

    const std::string target = *url;
    std::vector<char> shared;
    if (!opts.no_preallocate) {
        shared = random_payload(Config::UPLOAD_PAYLOAD_BYTES);
    }

    const bool per_request = opts.no_preallocate;
    return run_transfer("upload", opts, [&](HttpClient& http, steady_clock::time_point deadline,
                                            std::atomic<std::uint64_t>& counter) {
        if (per_request) {
            auto payload = random_payload(Config::UPLOAD_PAYLOAD_BYTES);
            return http.stream_post(target, payload, deadline, counter);
        }
        return http.stream_post(target, shared, deadline, counter);
    });
}
