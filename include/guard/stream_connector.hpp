#pragma once

#include <functional>
#include <memory>
#include <string>

namespace guard {

// Handlers may run on any thread; they must only enqueue work.
struct StreamHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string& message)> on_message;
    std::function<void(const std::string& error)> on_error;
    std::function<void()> on_close;
};

class StreamConnection {
public:
    virtual ~StreamConnection() = default;

    // Synchronous; no handler fires once this returns.
    virtual void close() = 0;
};

class StreamConnector {
public:
    virtual ~StreamConnector() = default;

    // Starts opening `url`; the outcome arrives through the handlers.
    // Throws binance::TransportError when the attempt cannot even start.
    virtual std::unique_ptr<StreamConnection> open(const std::string& url, StreamHandlers handlers) = 0;
};

// libwebsockets-backed connector.
class WsStreamConnector : public StreamConnector {
public:
    std::unique_ptr<StreamConnection> open(const std::string& url, StreamHandlers handlers) override;
};

} // namespace guard
