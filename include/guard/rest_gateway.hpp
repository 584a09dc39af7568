#pragma once

#include "binance/futures_client.hpp"
#include "guard/exchange_gateway.hpp"

#include <string>
#include <vector>

namespace guard {

// Decodes a /fapi/v1/openOrders body. Throws binance::UpstreamError when the
// body is not a JSON array.
std::vector<OpenOrder> parse_open_orders(const std::string& body);

// Throws binance::UpstreamError when the body carries no listenKey.
std::string parse_listen_key(const std::string& body);

class RestGateway : public ExchangeGateway {
public:
    explicit RestGateway(binance::FuturesClient& client);

    std::string create_listen_key() override;
    void keepalive_listen_key(const std::string& listen_key) override;
    void close_listen_key(const std::string& listen_key) override;

    std::vector<OpenOrder> open_orders(const std::string& symbol) override;
    void cancel_order(const std::string& symbol, std::int64_t order_id) override;
    void cancel_all_open_orders(const std::string& symbol) override;

private:
    binance::FuturesClient& client_;
};

} // namespace guard
