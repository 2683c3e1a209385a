#include <rangeio/stream/retry.hpp>

#include <cmath>
#include <thread>

namespace rangeio::stream {

std::chrono::milliseconds BackoffPolicy::delay(int attemptIndex) const {
    if (initial.count() <= 0 || attemptIndex < 0)
        return std::chrono::milliseconds{0};
    const double scaled =
        static_cast<double>(initial.count()) * std::pow(multiplier, static_cast<double>(attemptIndex));
    const double cap = static_cast<double>(maxBackoff.count());
    if (maxBackoff.count() > 0 && (scaled > cap || !std::isfinite(scaled)))
        return maxBackoff;
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(scaled)};
}

Sleeper defaultSleeper() {
    return [](std::chrono::milliseconds d) {
        if (d.count() > 0)
            std::this_thread::sleep_for(d);
    };
}

} // namespace rangeio::stream
