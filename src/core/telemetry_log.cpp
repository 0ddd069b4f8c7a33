// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/telemetry_log.hpp"

#include <chrono>

#include "include/results.hpp"

void TelemetryLog::append(int min_level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ < min_level) return;
    lines_.push_back(std::format("{}: {}", format_timestamp(std::chrono::system_clock::now()), message));
}

void TelemetryLog::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

std::string TelemetryLog::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& line : lines_) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

void TelemetryLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}
