#pragma once

#include <functional>
#include <memory>
#include <string>

namespace binance {

// Invoked on the libwebsockets service thread. Any of them may be empty.
struct WsCallbacks {
    std::function<void()> on_open;
    std::function<void(const std::string& message)> on_message;
    std::function<void(const std::string& error)> on_error;
    std::function<void()> on_close;
};

struct WsEndpoint {
    std::string host;
    std::string path;
    int port = 443;
    bool ssl = true;
};

// Splits a ws:// or wss:// URL; returns false for any other scheme or a bad port.
bool parse_ws_url(const std::string& url, WsEndpoint& endpoint);

// One client-side WebSocket connection serviced on its own thread. Text frames
// are reassembled before delivery. Once disconnect() starts no callback fires.
class WsClient {
public:
    WsClient(std::string url, WsCallbacks callbacks);
    ~WsClient();

    WsClient(const WsClient&) = delete;
    WsClient& operator=(const WsClient&) = delete;

    // Starts the handshake; completion is reported through on_open or on_error.
    bool connect();
    void disconnect();

    struct Impl;

private:
    std::unique_ptr<Impl> pimpl_;
};

} // namespace binance
