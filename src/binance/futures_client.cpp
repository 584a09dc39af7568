#include "binance/futures_client.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace binance {

FuturesClient::FuturesClient(Credentials credentials, std::string base_url, long recv_window_ms)
    : ClientBase(std::move(credentials), std::move(base_url), recv_window_ms) {}

std::string FuturesClient::server_time() const {
    return public_request("GET", "/fapi/v1/time").body;
}

std::int64_t FuturesClient::sync_server_time() {
    const auto before = current_timestamp_ms();
    const auto body = server_time();
    const auto after = current_timestamp_ms();

    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.contains("serverTime") || !json["serverTime"].is_number_integer()) {
        throw UpstreamError("Unexpected /fapi/v1/time response: " + body, 200, body);
    }

    const auto server_ms = json["serverTime"].get<std::int64_t>();
    const auto offset = server_ms - (before + (after - before) / 2);
    set_time_offset_ms(offset);
    return offset;
}

std::string FuturesClient::open_orders(const std::string& symbol) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    return signed_request("GET", "/fapi/v1/openOrders", std::move(params)).body;
}

std::string FuturesClient::cancel_order(const std::string& symbol, std::int64_t order_id) const {
    QueryParams params = {
        {"symbol", to_upper_copy(symbol)},
        {"orderId", std::to_string(order_id)}
    };
    return signed_request("DELETE", "/fapi/v1/order", std::move(params)).body;
}

std::string FuturesClient::cancel_all_open_orders(const std::string& symbol) const {
    QueryParams params = {{"symbol", to_upper_copy(symbol)}};
    return signed_request("DELETE", "/fapi/v1/allOpenOrders", std::move(params)).body;
}

std::string FuturesClient::create_listen_key() const {
    return keyed_request("POST", "/fapi/v1/listenKey").body;
}

std::string FuturesClient::keepalive_listen_key(const std::string& listen_key) const {
    QueryParams params = {{"listenKey", listen_key}};
    return keyed_request("PUT", "/fapi/v1/listenKey", params).body;
}

std::string FuturesClient::close_listen_key(const std::string& listen_key) const {
    QueryParams params = {{"listenKey", listen_key}};
    return keyed_request("DELETE", "/fapi/v1/listenKey", params).body;
}

} // namespace binance
