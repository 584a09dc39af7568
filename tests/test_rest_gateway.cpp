#include "binance/futures_client.hpp"
#include "guard/rest_gateway.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("parse_open_orders decodes the fields used for targeting") {
    const std::string body = R"([
        {"avgPrice":"0.00000","clientOrderId":"brkt_tp","closePosition":true,"orderId":1917641,
         "origType":"TAKE_PROFIT_MARKET","positionSide":"LONG","reduceOnly":true,"side":"SELL",
         "status":"NEW","stopPrice":"9300","symbol":"BTCUSDT","type":"TAKE_PROFIT_MARKET"},
        {"clientOrderId":"manual_1","orderId":"1917642","positionSide":"SHORT","type":"LIMIT"},
        {"clientOrderId":"no-id"},
        "garbage"
    ])";

    const auto orders = guard::parse_open_orders(body);
    REQUIRE(orders.size() == 2);
    CHECK(orders[0].order_id == 1917641);
    CHECK(orders[0].client_order_id == "brkt_tp");
    CHECK(orders[0].position_side == "LONG");
    CHECK(orders[0].type == "TAKE_PROFIT_MARKET");
    CHECK(orders[1].order_id == 1917642);
    CHECK(orders[1].position_side == "SHORT");
}

TEST_CASE("parse_open_orders accepts an empty list") {
    CHECK(guard::parse_open_orders("[]").empty());
}

TEST_CASE("parse_open_orders rejects error documents") {
    CHECK_THROWS_AS(guard::parse_open_orders(R"({"code":-1021,"msg":"Timestamp outside recvWindow"})"),
                    binance::UpstreamError);
    CHECK_THROWS_AS(guard::parse_open_orders("<html>"), binance::UpstreamError);
}

TEST_CASE("parse_listen_key extracts the key or throws") {
    CHECK(guard::parse_listen_key(R"({"listenKey":"pqia91ma19a5s61cv6a81va65sdf19v8a65a1"})")
          == "pqia91ma19a5s61cv6a81va65sdf19v8a65a1");
    CHECK_THROWS_AS(guard::parse_listen_key(R"({"listenKey":""})"), binance::UpstreamError);
    CHECK_THROWS_AS(guard::parse_listen_key("{}"), binance::UpstreamError);
    CHECK_THROWS_AS(guard::parse_listen_key("oops"), binance::UpstreamError);
}

TEST_CASE("signed queries carry timestamp, recvWindow and a matching signature") {
    binance::FuturesClient client{binance::Credentials{"api-key", "api-secret"},
                                  "https://fapi.binance.com", 7000};
    client.set_time_offset_ms(-1500);

    const auto before = binance::current_timestamp_ms() - 1500;
    const auto query = client.build_signed_query({{"symbol", "BTCUSDT"}, {"orderId", "42"}});
    const auto after = binance::current_timestamp_ms() - 1500;

    const std::string prefix = "symbol=BTCUSDT&orderId=42&timestamp=";
    REQUIRE(query.rfind(prefix, 0) == 0);

    const auto signature_pos = query.find("&signature=");
    REQUIRE(signature_pos != std::string::npos);
    const auto payload = query.substr(0, signature_pos);
    const auto signature = query.substr(signature_pos + std::string("&signature=").size());

    CHECK(payload.find("&recvWindow=7000") != std::string::npos);
    CHECK(signature == binance::hmac_sha256_hex("api-secret", payload));
    CHECK(signature.size() == 64);
    CHECK(payload.find("api-key") == std::string::npos);

    const auto stamp_begin = prefix.size();
    const auto stamp = std::stoll(payload.substr(stamp_begin, payload.find('&', stamp_begin) - stamp_begin));
    CHECK(stamp >= before);
    CHECK(stamp <= after);
}
