#pragma once

#include <cstddef>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "sepal";
    constexpr std::string_view APP_VERSION = "1.2.0";
    constexpr std::string_view USER_AGENT = "sepal/1.2.0";

    constexpr int PING_COUNT = 10;
    constexpr int DEFAULT_CONCURRENCY = 3;
    constexpr int DEFAULT_CHUNKS = 100;
    constexpr int DEFAULT_DURATION_SEC = 15;
    constexpr std::size_t UPLOAD_PAYLOAD_BYTES = 1024 * 1024;

    constexpr std::string_view TELEMETRY_SERVER = "https://librespeed.org";
    constexpr std::string_view TELEMETRY_PATH = "/results/telemetry.php";
    constexpr std::string_view TELEMETRY_SHARE = "/results/";

    constexpr long HTTP_TIMEOUT_SEC = 10;
    constexpr long HTTP_CONNECT_TIMEOUT_SEC = 10;
    constexpr long LIVENESS_TIMEOUT_SEC = 5;

    constexpr std::size_t TERM_WIDTH = 78;
    constexpr int UI_SPINNER_DELAY_MS = 150;
}
