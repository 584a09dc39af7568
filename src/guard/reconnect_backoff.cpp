#include "guard/reconnect_backoff.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace guard {

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds floor,
                                   std::chrono::milliseconds cap,
                                   Jitter jitter)
    : floor_(floor),
      cap_(cap),
      backoff_(floor),
      jitter_(std::move(jitter)),
      engine_(std::random_device{}()) {
    if (floor_.count() <= 0 || cap_ < floor_) {
        throw std::invalid_argument("backoff floor must be positive and not exceed the cap");
    }
}

std::chrono::milliseconds ReconnectBackoff::next_delay() {
    double factor = 0.0;
    if (jitter_) {
        factor = std::clamp(jitter_(), 0.0, 1.0);
    } else {
        std::uniform_real_distribution<double> uniform(0.0, 1.0);
        factor = uniform(engine_);
    }

    const auto jittered = static_cast<long long>(static_cast<double>(backoff_.count()) * (1.0 + factor));
    const auto delay = std::min(std::chrono::milliseconds(jittered), cap_);
    backoff_ = std::min(backoff_ * 2, cap_);
    return delay;
}

void ReconnectBackoff::reset() noexcept {
    backoff_ = floor_;
}

} // namespace guard
