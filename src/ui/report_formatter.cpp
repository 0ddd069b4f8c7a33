/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/report_formatter.hpp"

#include <array>
#include <format>
#include <string_view>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ReportFormatter {

namespace {

constexpr std::array<std::string_view, 9> kCsvColumns = {
    "Timestamp", "Server Name", "Address", "Ping", "Jitter", "Download", "Upload", "Share", "IP"};

std::expected<void, std::string> check_delimiter(char delimiter) {
    if (delimiter == '\0' || delimiter == '"' || delimiter == '\r' || delimiter == '\n') {
        return std::unexpected(std::format("invalid CSV delimiter (character code {})", static_cast<int>(delimiter)));
    }
    return {};
}

bool needs_quotes(std::string_view field, char delimiter) {
    if (field.empty()) return false;
    if (field.front() == ' ' || field.front() == '\t') return true;
    return field.find_first_of(std::string{delimiter, '"', '\r', '\n'}) != std::string_view::npos;
}

void append_field(std::string& line, std::string_view field, char delimiter) {
    if (!needs_quotes(field, delimiter)) {
        line += field;
        return;
    }
    line += '"';
    for (char c : field) {
        if (c == '"') line += '"';
        line += c;
    }
    line += '"';
}

void append_row(std::string& out, const FlatReport& row, char delimiter) {
    std::array<std::string, 9> fields = {
        row.timestamp,
        row.name,
        row.address,
        std::format("{}", row.ping),
        std::format("{}", row.jitter),
        std::format("{}", row.download),
        std::format("{}", row.upload),
        row.share,
        row.ip,
    };

    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += delimiter;
        append_field(out, fields[i], delimiter);
    }
    out += '\n';
}

}

OutputFormat select_output_format(bool csv, bool json, bool simple) noexcept {
    if (csv) return OutputFormat::Csv;
    if (json) return OutputFormat::Json;
    if (simple) return OutputFormat::Simple;
    return OutputFormat::Text;
}

std::string humanize_mbps(double mbps, bool use_mebi) {
    const double base = use_mebi ? 1024.0 : 1000.0;
    const double val = mbps / 8.0;

    if (val < 1.0) {
        const double kb = val * base;
        if (kb < 1.0) {
            return std::format("{:.2f} bytes/s", kb * base);
        }
        return std::format("{:.2f} KB/s", kb);
    }
    if (val > base) {
        return std::format("{:.2f} GB/s", val / base);
    }
    return std::format("{:.2f} MB/s", val);
}

std::string format_rate(double mbps, bool use_bytes, bool use_mebi) {
    if (use_bytes) return humanize_mbps(mbps, use_mebi);
    return std::format("{:.2f} Mbps", mbps);
}

std::string simple_summary(double ping, double jitter, double download, double upload,
                           bool use_bytes, bool use_mebi) {
    return std::format("Ping:\t{:.2f} ms\tJitter:\t{:.2f} ms\nDownload rate:\t{}\nUpload rate:\t{}",
                       ping,
                       jitter,
                       format_rate(download, use_bytes, use_mebi),
                       format_rate(upload, use_bytes, use_mebi));
}

std::expected<std::string, std::string> csv_header(char delimiter) {
    if (auto ok = check_delimiter(delimiter); !ok) return std::unexpected(ok.error());

    std::string out;
    for (std::size_t i = 0; i < kCsvColumns.size(); ++i) {
        if (i > 0) out += delimiter;
        append_field(out, kCsvColumns[i], delimiter);
    }
    out += '\n';
    return out;
}

std::expected<std::string, std::string> to_csv(std::span<const Report> reports, char delimiter) {
    if (auto ok = check_delimiter(delimiter); !ok) return std::unexpected(ok.error());

    std::string out;
    for (const auto& report : reports) {
        append_row(out, flatten(report), delimiter);
    }
    return out;
}

std::expected<std::string, std::string> to_json(std::span<const Report> reports) {
    try {
        json arr = json::array();
        for (const auto& report : reports) {
            arr.push_back(json(report));
        }
        return arr.dump();
    } catch (const json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

}  // namespace ReportFormatter
