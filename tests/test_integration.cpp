#include "binance/futures_client.hpp"
#include "guard/config.hpp"
#include "guard/rest_gateway.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

binance::Credentials load_credentials() {
    static bool loaded = false;
    if (!loaded) {
        const std::filesystem::path source_root = std::filesystem::path(__FILE__).parent_path().parent_path();
        if (!guard::load_env_file((std::filesystem::current_path() / ".env").string())) {
            guard::load_env_file((source_root / ".env").string());
        }
        loaded = true;
    }
    const char* api_key = std::getenv("BINANCE_API_KEY");
    const char* api_secret = std::getenv("BINANCE_API_SECRET");
    return binance::Credentials{api_key ? api_key : "", api_secret ? api_secret : ""};
}

std::string base_url() {
    const char* value = std::getenv("BINANCE_BASE_URL");
    return value && *value ? value : "https://fapi.binance.com";
}

void log_timings(const std::string& label, const binance::RequestTimings& timings) {
    std::cout << "[BINANCE] " << label
              << " total=" << timings.total_ms << " ms"
              << ", connect=" << timings.connect_ms << " ms"
              << ", tls=" << timings.app_connect_ms << " ms"
              << ", start_transfer=" << timings.start_transfer_ms << " ms"
              << std::endl;
}

} // namespace

TEST_CASE("FuturesClient reads the server clock", "[integration][binance]") {
    binance::FuturesClient client{load_credentials(), base_url()};

    try {
        const auto offset = client.sync_server_time();
        log_timings("server time", client.last_request_timings());
        CHECK(client.time_offset_ms() == offset);
        // A healthy host clock is within a minute of the exchange.
        CHECK(offset > -60000);
        CHECK(offset < 60000);
    } catch (const binance::HttpError& ex) {
        FAIL_CHECK("HTTP error while reading server time: " << ex.what());
    }
}

TEST_CASE("RestGateway lists open orders with a signed request", "[integration][binance]") {
    const auto credentials = load_credentials();
    if (credentials.api_key.empty() || credentials.api_secret.empty()) {
        WARN("Binance credentials not provided; skipping open_orders integration test");
        return;
    }

    binance::FuturesClient client{credentials, base_url()};
    guard::RestGateway gateway{client};

    try {
        client.sync_server_time();
        const auto orders = gateway.open_orders("BTCUSDT");
        log_timings("open orders", client.last_request_timings());
        for (const auto& order : orders) {
            CHECK(order.order_id > 0);
        }
    } catch (const binance::UpstreamError& ex) {
        if (ex.status_code() == 401 || ex.body().find("-2015") != std::string::npos) {
            WARN("API key rejected or IP not whitelisted; skipping open_orders test: " << ex.body());
            return;
        }
        FAIL_CHECK("HTTP error while listing open orders: " << ex.what());
    } catch (const binance::HttpError& ex) {
        FAIL_CHECK("Transport error while listing open orders: " << ex.what());
    }
}
