#pragma once

#include <chrono>
#include <functional>
#include <random>

namespace guard {

// Jittered exponential backoff: each delay is min(backoff * (1 + U[0,1)), cap),
// after which backoff doubles up to cap. reset() returns it to the floor.
class ReconnectBackoff {
public:
    using Jitter = std::function<double()>;

    // An empty jitter source uses a uniform [0,1) generator.
    ReconnectBackoff(std::chrono::milliseconds floor,
                     std::chrono::milliseconds cap,
                     Jitter jitter = {});

    std::chrono::milliseconds next_delay();
    void reset() noexcept;

    std::chrono::milliseconds current() const noexcept { return backoff_; }

private:
    std::chrono::milliseconds floor_;
    std::chrono::milliseconds cap_;
    std::chrono::milliseconds backoff_;
    Jitter jitter_;
    std::mt19937_64 engine_;
};

} // namespace guard
