#include "guard/rest_gateway.hpp"

#include "guard/json_fields.hpp"
#include "guard/log.hpp"

#include <nlohmann/json.hpp>

namespace guard {

std::vector<OpenOrder> parse_open_orders(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        throw binance::UpstreamError("Unexpected openOrders response: " + body, 200, body);
    }

    std::vector<OpenOrder> orders;
    orders.reserve(json.size());
    for (const auto& entry : json) {
        if (!entry.is_object()) {
            continue;
        }
        OpenOrder order;
        order.order_id = get_id_optional(entry, "orderId");
        order.client_order_id = get_string_optional(entry, "clientOrderId");
        order.position_side = get_string_optional(entry, "positionSide");
        order.type = get_string_optional(entry, "type");
        if (order.order_id != 0) {
            orders.push_back(std::move(order));
        }
    }
    return orders;
}

std::string parse_listen_key(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    const auto key = json.is_discarded() ? std::string{} : get_string_optional(json, "listenKey");
    if (key.empty()) {
        throw binance::UpstreamError("listenKey missing from response: " + body, 200, body);
    }
    return key;
}

RestGateway::RestGateway(binance::FuturesClient& client)
    : client_(client) {}

std::string RestGateway::create_listen_key() {
    return parse_listen_key(client_.create_listen_key());
}

void RestGateway::keepalive_listen_key(const std::string& listen_key) {
    client_.keepalive_listen_key(listen_key);
}

void RestGateway::close_listen_key(const std::string& listen_key) {
    client_.close_listen_key(listen_key);
}

std::vector<OpenOrder> RestGateway::open_orders(const std::string& symbol) {
    const auto body = client_.open_orders(symbol);
    log_debug("REST", "openOrders ", symbol, " took ", client_.last_request_timings().total_ms, " ms");
    return parse_open_orders(body);
}

void RestGateway::cancel_order(const std::string& symbol, std::int64_t order_id) {
    client_.cancel_order(symbol, order_id);
}

void RestGateway::cancel_all_open_orders(const std::string& symbol) {
    client_.cancel_all_open_orders(symbol);
}

} // namespace guard
