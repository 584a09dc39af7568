#include "binance/util.hpp"
#include "binance/ws_client.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("url_encode handles safe and unsafe characters") {
    using binance::url_encode;
    CHECK(url_encode("simple") == "simple");
    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("1+1=2") == "1%2B1%3D2");
    CHECK(url_encode("brkt_tp-1.~") == "brkt_tp-1.~");
}

TEST_CASE("filter_empty removes empty values") {
    using binance::filter_empty;
    binance::QueryParams params = {
        {"symbol", "BTCUSDT"},
        {"orderId", ""},
        {"limit", "0"},
        {"reduceOnly", "false"}
    };

    const auto filtered = filter_empty(params);
    REQUIRE(filtered.size() == 3);
    CHECK(filtered[0].first == "symbol");
    CHECK(filtered[1].first == "limit");
    CHECK(filtered[2].first == "reduceOnly");
}

TEST_CASE("build_query_string preserves order and encodes values") {
    using binance::build_query_string;
    binance::QueryParams params = {
        {"symbol", "BTCUSDT"},
        {"orderId", "12345"},
        {"note", "space value"}
    };

    CHECK(build_query_string(params) == "symbol=BTCUSDT&orderId=12345&note=space%20value");
}

TEST_CASE("to_upper_copy converts strings to uppercase") {
    using binance::to_upper_copy;
    CHECK(to_upper_copy("btcUSDT") == "BTCUSDT");
    CHECK(to_upper_copy("side") == "SIDE");
}

TEST_CASE("hmac_sha256_hex matches the Binance API documentation example") {
    const std::string secret = "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j";
    const std::string query =
        "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1"
        "&recvWindow=5000&timestamp=1499827319559";

    CHECK(binance::hmac_sha256_hex(secret, query)
          == "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");
}

TEST_CASE("RFC 4231 test case 2 for HMAC-SHA256") {
    CHECK(binance::hmac_sha256_hex("Jefe", "what do ya want for nothing?")
          == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("parse_ws_url splits stream URLs") {
    binance::WsEndpoint endpoint;
    REQUIRE(binance::parse_ws_url("wss://fstream.binance.com/ws/abc123", endpoint));
    CHECK(endpoint.host == "fstream.binance.com");
    CHECK(endpoint.path == "/ws/abc123");
    CHECK(endpoint.port == 443);
    CHECK(endpoint.ssl);

    REQUIRE(binance::parse_ws_url("ws://localhost:9001", endpoint));
    CHECK(endpoint.host == "localhost");
    CHECK(endpoint.path == "/");
    CHECK(endpoint.port == 9001);
    CHECK_FALSE(endpoint.ssl);
}

TEST_CASE("parse_ws_url rejects other schemes and bad ports") {
    binance::WsEndpoint endpoint;
    CHECK_FALSE(binance::parse_ws_url("https://fstream.binance.com/ws", endpoint));
    CHECK_FALSE(binance::parse_ws_url("wss://host:abc/ws", endpoint));
    CHECK_FALSE(binance::parse_ws_url("wss://host:/ws", endpoint));
    CHECK_FALSE(binance::parse_ws_url("wss:///ws", endpoint));
}
