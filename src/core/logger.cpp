/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/logger.hpp"

#include <ostream>
#include <print>

#include "include/color.hpp"

namespace {

std::string_view level_tag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            break;
    }
    return "ERROR";
}

}

void Logger::write(LogLevel level, std::string_view message) {
    if (!enabled(level)) return;

    std::string tag = std::format("[{}]", level_tag(level));
    if (color_) {
        if (level == LogLevel::Error) {
            tag = Color::colorize(tag, Color::RED);
        } else if (level == LogLevel::Warn) {
            tag = Color::colorize(tag, Color::YELLOW);
        }
    }

    std::println(*sink_, "{} {}", tag, message);
    sink_->flush();
}
