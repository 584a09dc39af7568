#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace guard {

struct OpenOrder {
    std::int64_t order_id = 0;
    std::string client_order_id;
    std::string position_side;
    std::string type;
};

// Exchange operations the guard depends on. Implementations throw
// binance::TransportError / binance::UpstreamError and must tolerate
// concurrent cancel_order calls.
class ExchangeGateway {
public:
    virtual ~ExchangeGateway() = default;

    virtual std::string create_listen_key() = 0;
    virtual void keepalive_listen_key(const std::string& listen_key) = 0;
    virtual void close_listen_key(const std::string& listen_key) = 0;

    virtual std::vector<OpenOrder> open_orders(const std::string& symbol) = 0;
    virtual void cancel_order(const std::string& symbol, std::int64_t order_id) = 0;
    virtual void cancel_all_open_orders(const std::string& symbol) = 0;
};

} // namespace guard
