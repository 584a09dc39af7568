#pragma once

#include "binance/client_base.hpp"

#include <cstdint>
#include <string>

namespace binance {

// USDT-M futures REST surface used by the guard. Every method returns the raw
// response body and throws TransportError / UpstreamError on failure.
class FuturesClient : public ClientBase {
public:
    explicit FuturesClient(Credentials credentials,
                           std::string base_url = "https://fapi.binance.com",
                           long recv_window_ms = 5000);

    std::string server_time() const;

    // Reads /fapi/v1/time and stores the server-minus-local offset for signing.
    // Returns the applied offset.
    std::int64_t sync_server_time();

    std::string open_orders(const std::string& symbol) const;
    std::string cancel_order(const std::string& symbol, std::int64_t order_id) const;
    std::string cancel_all_open_orders(const std::string& symbol) const;

    // User data stream
    std::string create_listen_key() const;
    std::string keepalive_listen_key(const std::string& listen_key) const;
    std::string close_listen_key(const std::string& listen_key) const;
};

} // namespace binance
