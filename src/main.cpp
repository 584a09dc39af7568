#include "binance/futures_client.hpp"
#include "guard/cancellation_engine.hpp"
#include "guard/config.hpp"
#include "guard/event_pipeline.hpp"
#include "guard/listen_key_manager.hpp"
#include "guard/log.hpp"
#include "guard/rest_gateway.hpp"
#include "guard/status_server.hpp"
#include "guard/stream_connector.hpp"
#include "guard/stream_session.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
volatile std::sig_atomic_t g_running = 1;

void signal_handler(int /*signal*/) {
    g_running = 0;
}

constexpr const char* kTag = "OCO";

} // namespace

int main() {
    guard::load_env_file(".env");

    guard::GuardConfig config;
    try {
        config = guard::parse_config(guard::read_environment());
    } catch (const guard::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }

    guard::set_log_level(config.log_level);
    guard::log_info(kTag, "starting (mode=", guard::to_string(config.cancel_policy.mode),
                    ", hedge=", config.cancel_policy.hedge_mode ? "on" : "off",
                    ", keepalive=", config.keepalive_interval.count() / 1000, "s)");
    for (const auto& warning : guard::config_warnings(config)) {
        guard::log_warn(kTag, warning);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    binance::FuturesClient client{config.credentials, config.rest_base_url, config.recv_window_ms};
    try {
        const auto offset = client.sync_server_time();
        guard::log_info(kTag, "server clock offset ", offset, " ms");
    } catch (const std::exception& ex) {
        guard::log_warn(kTag, "server time sync failed, signing with local clock: ", ex.what());
    }

    guard::RestGateway gateway{client};
    guard::ListenKeyManager listen_keys{gateway};
    guard::CancellationEngine engine{gateway, config.cancel_policy};
    guard::WsStreamConnector connector;

    guard::StreamSessionOptions options;
    options.stream_base_url = config.stream_base_url;
    options.keepalive_interval = config.keepalive_interval;
    options.reconnect_min = config.reconnect_min;
    options.reconnect_max = config.reconnect_max;

    // Declared before the pipeline so it outlives the observer calls.
    std::unique_ptr<guard::StreamSession> session;
    guard::PipelineObserver observer;
    observer.on_order_event = [&session](std::int64_t at_ms) {
        session->record_order_event(at_ms);
    };
    observer.on_close_fill = [&session](const guard::ClosingFill&, const guard::CancelSummary&, std::int64_t at_ms) {
        session->record_close_fill(at_ms);
    };

    guard::EventPipeline pipeline{engine, observer};
    session = std::make_unique<guard::StreamSession>(
        options, listen_keys, connector,
        [&pipeline](const std::string& message) { pipeline.submit(message); });

    std::unique_ptr<guard::StatusServer> status_server;
    if (config.health_port > 0) {
        status_server = std::make_unique<guard::StatusServer>(
            config.health_port, [&session]() { return session->snapshot(); });
        if (!status_server->start()) {
            guard::log_warn(kTag, "health server disabled");
            status_server.reset();
        }
    }

    pipeline.start();
    session->start();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    guard::log_info(kTag, "shutting down");
    session->stop();
    pipeline.stop();
    if (status_server) {
        status_server->stop();
    }
    guard::log_info(kTag, "bye");
    return 0;
}
