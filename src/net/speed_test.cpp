#include "include/speed_test.hpp"

#include <chrono>
#include <format>
#include <ostream>
#include <print>
#include <string>
#include <string_view>
#include <utility>

#include "include/config.hpp"
#include "include/report_formatter.hpp"
#include "include/url.hpp"

namespace {

class SpinnerScope {
    const SpinnerCallback& cb_;
    std::string_view label_;
    bool active_ = false;

public:
    SpinnerScope(const SpinnerCallback& cb, std::string_view label, bool enabled) : cb_(cb), label_(label) {
        active_ = enabled && static_cast<bool>(cb_);
        if (active_) cb_(SpinnerEvent::Start, label_);
    }

    ~SpinnerScope() {
        if (active_) cb_(SpinnerEvent::Stop, label_);
    }

    SpinnerScope(const SpinnerScope&) = delete;
    SpinnerScope& operator=(const SpinnerScope&) = delete;
};

bool machine_readable(const OutputOptions& output) {
    return output.simple || output.csv || output.json;
}

}

SpeedTest::SpeedTest(const TestOptions& opts, Logger& log, FormPoster poster)
    : opts_(opts), log_(log), telemetry_(opts.telemetry, std::move(poster)) {}

std::expected<Report, std::string> SpeedTest::test_server(SpeedServer& server, const RunContext& ctx) {
    const bool silent = !ctx.interactive || machine_readable(ctx.output);
    const bool show = !silent && ctx.out != nullptr;
    const LogLevel progress = ctx.interactive ? LogLevel::Info : LogLevel::Debug;

    server.telemetry_log().clear();
    server.telemetry_log().set_level(telemetry_.level());

    auto url = server.resolve_url();
    if (!url) {
        log_.error("Failed to get server URL: {}", url.error());
        return std::unexpected(std::format("Failed to get server URL: {}", url.error()));
    }

    std::string host = Url::host(*url).value_or(*url);
    log_.log(progress, "Selected server: {} [{}]", server.name(), host);

    if (auto sponsor = server.sponsor(); !sponsor.empty()) {
        log_.log(progress, "Sponsored by: {}", sponsor);
    }

    if (!server.is_up()) {
        log_.log(progress,
                 "Selected server {} ({}) is not responding at the moment, try again later",
                 server.name(),
                 host);
        server.telemetry_log().warn("server {} did not answer the liveness probe", host);
    }

    auto isp = server.lookup_isp_info(opts_.distance);
    if (!isp) {
        log_.error("Failed to get IP info: {}", isp.error());
        return std::unexpected(std::format("Failed to get IP info: {}", isp.error()));
    }
    log_.log(progress, "You're testing from: {}", isp->processed_string);

    PingResult ping;
    {
        SpinnerScope spinner(ctx.spinner, "Pinging server...", !silent);
        auto sampled = server.ping_and_jitter(Config::PING_COUNT, opts_.source_ip, opts_.network);
        if (!sampled) {
            log_.error("Failed to get ping and jitter: {}", sampled.error());
            return std::unexpected(std::format("Failed to get ping and jitter: {}", sampled.error()));
        }
        ping = *sampled;
    }
    if (show) {
        std::println(*ctx.out, "Ping: {:.2f} ms\tJitter: {:.2f} ms", ping.ping_ms, ping.jitter_ms);
    }

    TransferOptions transfer;
    transfer.silent = silent;
    transfer.use_bytes = opts_.use_bytes;
    transfer.use_mebi = opts_.use_mebi;
    transfer.no_preallocate = opts_.no_preallocate;
    transfer.concurrency = opts_.concurrency;
    transfer.chunks = opts_.chunks;
    transfer.duration = opts_.duration;

    TransferResult download;
    if (opts_.no_download) {
        log_.log(progress, "Download test is disabled");
    } else {
        {
            SpinnerScope spinner(ctx.spinner, "Downloading...", !silent);
            auto sampled = server.download(transfer);
            if (!sampled) {
                log_.error("Failed to get download speed: {}", sampled.error());
                return std::unexpected(std::format("Failed to get download speed: {}", sampled.error()));
            }
            download = *sampled;
        }
        if (show) {
            std::println(*ctx.out, "Download rate:\t{}",
                         ReportFormatter::format_rate(download.mbps, opts_.use_bytes, opts_.use_mebi));
        }
    }

    TransferResult upload;
    if (opts_.no_upload) {
        log_.log(progress, "Upload test is disabled");
    } else {
        {
            SpinnerScope spinner(ctx.spinner, "Uploading...", !silent);
            auto sampled = server.upload(transfer);
            if (!sampled) {
                log_.error("Failed to get upload speed: {}", sampled.error());
                return std::unexpected(std::format("Failed to get upload speed: {}", sampled.error()));
            }
            upload = *sampled;
        }
        if (show) {
            std::println(*ctx.out, "Upload rate:\t{}",
                         ReportFormatter::format_rate(upload.mbps, opts_.use_bytes, opts_.use_mebi));
        }
    }

    if (ctx.interactive && ctx.output.simple && ctx.out != nullptr) {
        std::println(*ctx.out, "{}",
                     ReportFormatter::simple_summary(ping.ping_ms, ping.jitter_ms, download.mbps, upload.mbps,
                                                     opts_.use_bytes, opts_.use_mebi));
    }

    Report rep;
    rep.ping = round2(ping.ping_ms);
    rep.jitter = round2(ping.jitter_ms);
    rep.download = round2(download.mbps);
    rep.upload = round2(upload.mbps);
    rep.bytes_received = download.bytes;
    rep.bytes_sent = upload.bytes;

    if (telemetry_.level() > 0) {
        TelemetryPayload payload;
        payload.isp = *isp;
        payload.download = rep.download;
        payload.upload = rep.upload;
        payload.ping = rep.ping;
        payload.jitter = rep.jitter;
        payload.log = server.telemetry_log().str();
        payload.extra.server_name = server.name();
        payload.extra.extra = opts_.telemetry_extra;

        if (auto link = telemetry_.submit(payload); !link) {
            log_.error("Error when sending telemetry data: {}", link.error());
        } else {
            rep.share = *link;
            if (ctx.interactive && !ctx.output.csv && !ctx.output.json && ctx.out != nullptr) {
                std::println(*ctx.out, "Share your result: {}", rep.share);
            }
        }
    }

    rep.timestamp = std::chrono::system_clock::now();
    rep.server.name = server.name();
    rep.server.url = *url;
    rep.client = isp->raw_isp_info;
    rep.client.readme.clear();

    return rep;
}

void SpeedTest::render(std::span<const Report> reports, const RunContext& ctx) {
    if (!ctx.interactive || ctx.out == nullptr) return;

    const auto& output = ctx.output;
    switch (ReportFormatter::select_output_format(output.csv, output.json, output.simple)) {
        case OutputFormat::Csv:
            if (auto rows = ReportFormatter::to_csv(reports, output.csv_delimiter)) {
                std::print(*ctx.out, "{}", *rows);
            } else {
                log_.error("Error generating CSV report: {}", rows.error());
            }
            break;
        case OutputFormat::Json:
            if (auto text = ReportFormatter::to_json(reports)) {
                std::println(*ctx.out, "{}", *text);
            } else {
                log_.error("Error generating JSON report: {}", text.error());
            }
            break;
        case OutputFormat::Simple:
        case OutputFormat::Text:
            break;
    }
    ctx.out->flush();
}

std::expected<std::vector<Report>, std::string> SpeedTest::run(
    std::span<const std::unique_ptr<SpeedServer>> servers, const RunContext& ctx) {
    const bool many = servers.size() > 1;
    const bool silent = !ctx.interactive || machine_readable(ctx.output);

    if (many) {
        log_.log(ctx.interactive ? LogLevel::Info : LogLevel::Debug, "Testing against {} servers", servers.size());
    }

    std::vector<Report> reports;
    reports.reserve(servers.size());

    for (const auto& server : servers) {
        auto rep = test_server(*server, ctx);
        if (!rep) {
            return std::unexpected(rep.error());
        }
        reports.push_back(std::move(*rep));

        if (many && !silent && ctx.out != nullptr) {
            std::println(*ctx.out, "");
        }
    }

    render(reports, ctx);
    return reports;
}

std::expected<void, std::string> SpeedTest::run_interactive(std::span<const std::unique_ptr<SpeedServer>> servers,
                                                            const OutputOptions& output,
                                                            std::ostream& out,
                                                            const SpinnerCallback& spinner_cb) {
    RunContext ctx;
    ctx.interactive = true;
    ctx.output = output;
    ctx.out = &out;
    ctx.spinner = spinner_cb;

    auto reports = run(servers, ctx);
    if (!reports) return std::unexpected(reports.error());
    return {};
}

std::expected<std::vector<Report>, std::string> SpeedTest::run_silent(
    std::span<const std::unique_ptr<SpeedServer>> servers) {
    return run(servers, RunContext{});
}
