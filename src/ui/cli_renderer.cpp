#include "include/cli_renderer.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <thread>

#include "include/color.hpp"
#include "include/config.hpp"
#include "include/url.hpp"

namespace CliRenderer {

namespace {

class UiSpinner {
    std::jthread worker_;
    std::string text_;

public:
    void start(std::string_view text) {
        text_ = text;

        worker_ = std::jthread([this](std::stop_token st) {
            static constexpr std::string_view frames = "|/-\\";
            std::size_t idx = 0;

            while (!st.stop_requested()) {
                std::print("\r{} {}", text_, frames[idx++ % frames.size()]);
                std::cout.flush();

                std::this_thread::sleep_for(std::chrono::milliseconds(Config::UI_SPINNER_DELAY_MS));
            }

            std::print("\r{}\r", std::string(text_.size() + 2, ' '));
            std::cout.flush();
        });
    }

    void stop() {
        worker_ = std::jthread();
    }
};

}

SpinnerCallback make_spinner_callback() {
    auto spinner = std::make_shared<UiSpinner>();
    return [spinner](SpinnerEvent ev, std::string_view label) {
        switch (ev) {
            case SpinnerEvent::Start:
                spinner->start(label);
                break;
            case SpinnerEvent::Stop:
                spinner->stop();
                break;
        }
    };
}

std::string format_server_line(const ServerEntry& entry) {
    std::string host = Url::host(entry.server).value_or(entry.server);
    std::string line = std::format("{}: {} ({})", entry.id, entry.name, host);
    if (!entry.sponsor_name.empty()) {
        line += std::format(" Sponsor: {}", entry.sponsor_name);
    }
    return line;
}

void render_server_list(std::span<const ServerEntry> servers) {
    for (const auto& entry : servers) {
        std::println("{}{}{}", Color::CYAN, format_server_line(entry), Color::RESET);
    }
}

}  // namespace CliRenderer
