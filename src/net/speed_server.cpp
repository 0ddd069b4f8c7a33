#include "include/speed_server.hpp"

#include <cmath>

PingResult compute_ping_jitter(std::span<const double> samples_ms) noexcept {
    PingResult result;
    if (samples_ms.empty()) return result;

    double sum = 0.0;
    double jitter = 0.0;
    for (std::size_t i = 0; i < samples_ms.size(); ++i) {
        sum += samples_ms[i];
        if (i == 0) continue;

        double instant = std::abs(samples_ms[i] - samples_ms[i - 1]);
        if (i == 1) {
            jitter = instant;
        } else if (jitter > instant) {
            jitter = jitter * 0.7 + instant * 0.3;
        } else {
            jitter = instant * 0.2 + jitter * 0.8;
        }
    }

    result.ping_ms = sum / static_cast<double>(samples_ms.size());
    result.jitter_ms = jitter;
    return result;
}
