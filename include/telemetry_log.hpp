// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Per-server diagnostic capture that ends up in the telemetry "log" field.
// Level 1 keeps warnings, 2 adds info lines, 3 adds debug lines.
class TelemetryLog {
    int level_ = 0;
    std::vector<std::string> lines_;
    mutable std::mutex mutex_;

    void append(int min_level, std::string_view message);

   public:
    TelemetryLog() = default;

    TelemetryLog(const TelemetryLog&) = delete;
    TelemetryLog& operator=(const TelemetryLog&) = delete;

    void set_level(int level);

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        append(1, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        append(2, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        append(3, std::format(fmt, std::forward<Args>(args)...));
    }

    std::string str() const;
    void clear();
};
