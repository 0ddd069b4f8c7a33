// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>

#include "results.hpp"
#include "telemetry_log.hpp"
#include "test_options.hpp"

struct PingResult {
    double ping_ms = 0.0;
    double jitter_ms = 0.0;
};

struct TransferResult {
    double mbps = 0.0;
    std::uint64_t bytes = 0;
};

struct TransferOptions {
    bool silent = false;
    bool use_bytes = false;
    bool use_mebi = false;
    bool no_preallocate = false;
    int concurrency = 1;
    int chunks = 1;
    std::chrono::seconds duration{0};
};

// Measurement capability of one remote endpoint. The orchestrator only talks
// to this interface; each transport backend provides its own subclass.
class SpeedServer {
    std::string name_;
    TelemetryLog tlog_;

   public:
    explicit SpeedServer(std::string name) : name_(std::move(name)) {}
    virtual ~SpeedServer() = default;

    SpeedServer(const SpeedServer&) = delete;
    SpeedServer& operator=(const SpeedServer&) = delete;

    const std::string& name() const noexcept { return name_; }
    TelemetryLog& telemetry_log() noexcept { return tlog_; }

    virtual std::expected<std::string, std::string> resolve_url() = 0;
    virtual std::string sponsor() const = 0;
    virtual bool is_up() = 0;
    virtual std::expected<IspInfo, std::string> lookup_isp_info(DistanceUnit unit) = 0;
    virtual std::expected<PingResult, std::string> ping_and_jitter(int count,
                                                                   const std::string& source_ip,
                                                                   NetworkFamily family) = 0;
    virtual std::expected<TransferResult, std::string> download(const TransferOptions& opts) = 0;
    virtual std::expected<TransferResult, std::string> upload(const TransferOptions& opts) = 0;
};

// Mean latency plus smoothed jitter over consecutive samples.
PingResult compute_ping_jitter(std::span<const double> samples_ms) noexcept;
