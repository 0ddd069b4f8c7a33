/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <span>
#include <string>

#include "results.hpp"

enum class OutputFormat { Text, Simple, Json, Csv };

namespace ReportFormatter {

// CSV beats JSON beats simple text.
OutputFormat select_output_format(bool csv, bool json, bool simple) noexcept;

// Mbps as bytes/s, KB/s, MB/s or GB/s; base 1024 when use_mebi.
std::string humanize_mbps(double mbps, bool use_mebi);

std::string format_rate(double mbps, bool use_bytes, bool use_mebi);

std::string simple_summary(double ping, double jitter, double download, double upload,
                           bool use_bytes, bool use_mebi);

std::expected<std::string, std::string> csv_header(char delimiter = ',');

// Headerless rows, one per report, in collection order.
std::expected<std::string, std::string> to_csv(std::span<const Report> reports, char delimiter = ',');

std::expected<std::string, std::string> to_json(std::span<const Report> reports);

}  // namespace ReportFormatter
