/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <catch2/catch.hpp>

#include <string>
#include <thread>
#include <vector>

#include "include/telemetry_log.hpp"

namespace {

std::size_t count_lines(const std::string& text) {
    if (text.empty()) return 0;
    std::size_t n = 1;
    for (char c : text) {
        if (c == '\n') ++n;
    }
    return n;
}

void emit_all(TelemetryLog& tlog) {
    tlog.warn("w");
    tlog.info("i");
    tlog.debug("d");
}

}

TEST_CASE("disabled capture records nothing") {
    TelemetryLog tlog;
    emit_all(tlog);
    REQUIRE(tlog.str().empty());
}

TEST_CASE("capture depth follows the telemetry level") {
    for (int level = 1; level <= 3; ++level) {
        TelemetryLog tlog;
        tlog.set_level(level);
        emit_all(tlog);
        REQUIRE(count_lines(tlog.str()) == static_cast<std::size_t>(level));
    }
}

TEST_CASE("captured lines are timestamped") {
    TelemetryLog tlog;
    tlog.set_level(1);
    tlog.warn("probe {} failed", "empty.php");

    std::string text = tlog.str();
    REQUIRE(text.ends_with("Z: probe empty.php failed"));
    REQUIRE(text.find('T') == 10);

    tlog.clear();
    REQUIRE(tlog.str().empty());
}

TEST_CASE("capture is safe across threads") {
    TelemetryLog tlog;
    tlog.set_level(2);
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&tlog, t] {
                for (int i = 0; i < 25; ++i) tlog.info("worker {} step {}", t, i);
            });
        }
    }
    REQUIRE(count_lines(tlog.str()) == 100);
}
