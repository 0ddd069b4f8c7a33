/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "http_client.hpp"
#include "speed_server.hpp"

// One entry of a LibreSpeed server list.
struct ServerEntry {
    int id = 0;
    std::string name;
    std::string server;
    std::string download_url;
    std::string upload_url;
    std::string ping_url;
    std::string get_ip_url;
    std::string sponsor_name;
    std::string sponsor_url;
};

void from_json(const nlohmann::json& j, ServerEntry& entry);

std::expected<std::vector<ServerEntry>, std::string> parse_server_list(std::string_view text);
std::expected<std::vector<ServerEntry>, std::string> load_server_list(const std::filesystem::path& file);

// Measurement over the LibreSpeed HTTP backend (empty.php / garbage.php / getIP.php).
class LibreSpeedServer : public SpeedServer {
    using TransferStep = std::function<std::expected<void, std::string>(
        HttpClient&, std::chrono::steady_clock::time_point, std::atomic<std::uint64_t>&)>;

    ServerEntry entry_;
    HttpOptions http_options_;

    std::expected<std::string, std::string> endpoint(std::string_view path) const;
    std::expected<std::unique_ptr<HttpClient>, std::string> open_client(const HttpOptions& options);
    std::expected<TransferResult, std::string> run_transfer(std::string_view label,
                                                            const TransferOptions& opts,
                                                            const TransferStep& step);

   protected:
    // Throws std::runtime_error when no curl handle can be created.
    virtual std::unique_ptr<HttpClient> make_client(const HttpOptions& options);

   public:
    LibreSpeedServer(ServerEntry entry, HttpOptions http_options);

    std::expected<std::string, std::string> resolve_url() override;
    std::string sponsor() const override;
    bool is_up() override;
    std::expected<IspInfo, std::string> lookup_isp_info(DistanceUnit unit) override;
    std::expected<PingResult, std::string> ping_and_jitter(int count,
                                                           const std::string& source_ip,
                                                           NetworkFamily family) override;
    std::expected<TransferResult, std::string> download(const TransferOptions& opts) override;
    std::expected<TransferResult, std::string> upload(const TransferOptions& opts) override;
};
