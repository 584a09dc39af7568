#include "guard/stream_connector.hpp"

#include "binance/http_client.hpp"
#include "binance/ws_client.hpp"

#include <utility>

namespace guard {
namespace {

class WsStreamConnection : public StreamConnection {
public:
    explicit WsStreamConnection(std::unique_ptr<binance::WsClient> client)
        : client_(std::move(client)) {}

    ~WsStreamConnection() override {
        close();
    }

    void close() override {
        if (client_) {
            client_->disconnect();
        }
    }

private:
    std::unique_ptr<binance::WsClient> client_;
};

} // namespace

std::unique_ptr<StreamConnection> WsStreamConnector::open(const std::string& url, StreamHandlers handlers) {
    binance::WsCallbacks callbacks;
    callbacks.on_open = std::move(handlers.on_open);
    callbacks.on_message = std::move(handlers.on_message);
    callbacks.on_error = std::move(handlers.on_error);
    callbacks.on_close = std::move(handlers.on_close);

    auto client = std::make_unique<binance::WsClient>(url, std::move(callbacks));
    if (!client->connect()) {
        throw binance::TransportError("failed to start WebSocket connection");
    }

    return std::make_unique<WsStreamConnection>(std::move(client));
}

} // namespace guard
