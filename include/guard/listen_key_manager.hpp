#pragma once

#include "guard/exchange_gateway.hpp"

#include <string>

namespace guard {

class ListenKeyManager {
public:
    explicit ListenKeyManager(ExchangeGateway& gateway);

    // Throws binance::TransportError / binance::UpstreamError.
    std::string acquire();

    // Best effort: false on failure, which is logged.
    bool renew(const std::string& listen_key);

    // Best effort; empty keys are ignored.
    void release(const std::string& listen_key) noexcept;

private:
    ExchangeGateway& gateway_;
};

} // namespace guard
