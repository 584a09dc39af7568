#include "binance/ws_client.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <cstring>
#include <thread>

namespace binance {
namespace {

enum class WsConnectionState {
    Disconnected,
    Connecting,
    Connected
};

} // namespace

struct WsClient::Impl {
    std::string url;
    WsCallbacks callbacks;
    WsEndpoint endpoint;

    ::lws_context* context = nullptr;
    ::lws* wsi = nullptr;
    std::thread service_thread;

    std::atomic<bool> stopping{false};
    std::atomic<bool> muted{false};
    std::atomic<WsConnectionState> state{WsConnectionState::Disconnected};

    // Service thread only.
    std::string partial_frame;

    void opened() {
        state = WsConnectionState::Connected;
        if (!muted && callbacks.on_open) {
            callbacks.on_open();
        }
    }

    void failed(const std::string& reason) {
        state = WsConnectionState::Disconnected;
        wsi = nullptr;
        if (!muted && callbacks.on_error) {
            callbacks.on_error(reason);
        }
    }

    void closed() {
        const auto previous = state.exchange(WsConnectionState::Disconnected);
        wsi = nullptr;
        if (previous == WsConnectionState::Connected && !muted && callbacks.on_close) {
            callbacks.on_close();
        }
    }

    void received(const char* data, std::size_t len, bool final_fragment) {
        partial_frame.append(data, len);
        if (!final_fragment) {
            return;
        }
        if (!muted && callbacks.on_message) {
            callbacks.on_message(partial_frame);
        }
        partial_frame.clear();
    }

    void destroy_context() {
        if (context) {
            lws_context_destroy(context);
            context = nullptr;
        }
    }
};

} // namespace binance

namespace {

int on_lws_event(struct lws* wsi, enum lws_callback_reasons reason,
                 void* /*user*/, void* in, size_t len) {
    auto* impl = static_cast<binance::WsClient::Impl*>(lws_get_opaque_user_data(wsi));
    if (!impl) {
        // Events raised before the connection carries its opaque pointer.
        impl = static_cast<binance::WsClient::Impl*>(lws_context_user(lws_get_context(wsi)));
        if (!impl) {
            return 0;
        }
        lws_set_opaque_user_data(wsi, impl);
    }

    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED:
            impl->opened();
            break;

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
            impl->failed(in ? std::string(static_cast<const char*>(in), len)
                            : std::string("connection error"));
            break;

        case LWS_CALLBACK_CLIENT_CLOSED:
        case LWS_CALLBACK_CLOSED:
            impl->closed();
            break;

        case LWS_CALLBACK_CLIENT_RECEIVE:
            if (in && len > 0 && !lws_frame_is_binary(wsi)) {
                impl->received(static_cast<const char*>(in), len, lws_is_final_fragment(wsi) != 0);
            }
            break;

        default:
            break;
    }

    return 0;
}

constexpr std::size_t kRxBufferSize = 65536;

const struct lws_protocols kProtocols[] = {
    {"user-stream", on_lws_event, 0, kRxBufferSize},
    {nullptr, nullptr, 0, 0}
};

} // namespace

namespace binance {

bool parse_ws_url(const std::string& url, WsEndpoint& endpoint) {
    std::size_t start = 0;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.ssl = true;
        endpoint.port = 443;
        start = 6;
    } else if (url.rfind("ws://", 0) == 0) {
        endpoint.ssl = false;
        endpoint.port = 80;
        start = 5;
    } else {
        return false;
    }

    const std::size_t slash = url.find('/', start);
    endpoint.host = url.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    endpoint.path = slash == std::string::npos ? "/" : url.substr(slash);

    const std::size_t colon = endpoint.host.find(':');
    if (colon != std::string::npos) {
        const std::string port = endpoint.host.substr(colon + 1);
        if (port.empty() || port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        endpoint.port = std::stoi(port);
        endpoint.host.erase(colon);
    }

    return !endpoint.host.empty();
}

WsClient::WsClient(std::string url, WsCallbacks callbacks)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->url = std::move(url);
    pimpl_->callbacks = std::move(callbacks);
}

WsClient::~WsClient() {
    disconnect();
}

bool WsClient::connect() {
    auto& impl = *pimpl_;
    if (impl.state != WsConnectionState::Disconnected || impl.service_thread.joinable()) {
        return false;
    }
    if (!parse_ws_url(impl.url, impl.endpoint)) {
        return false;
    }

    lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = kProtocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = pimpl_.get();

    impl.context = lws_create_context(&info);
    if (!impl.context) {
        return false;
    }

    const auto& endpoint = impl.endpoint;
    lws_client_connect_info request;
    std::memset(&request, 0, sizeof(request));
    request.context = impl.context;
    request.address = endpoint.host.c_str();
    request.host = endpoint.host.c_str();
    request.origin = endpoint.host.c_str();
    request.port = endpoint.port;
    request.path = endpoint.path.c_str();
    request.protocol = kProtocols[0].name;
    request.ssl_connection = endpoint.ssl ? LCCSCF_USE_SSL : 0;
    request.opaque_user_data = pimpl_.get();

    impl.state = WsConnectionState::Connecting;
    impl.muted = false;
    impl.stopping = false;

    impl.wsi = lws_client_connect_via_info(&request);
    if (!impl.wsi) {
        impl.destroy_context();
        impl.state = WsConnectionState::Disconnected;
        return false;
    }

    impl.service_thread = std::thread([p = pimpl_.get()]() {
        while (!p->stopping) {
            lws_service(p->context, 0);
        }
    });
    return true;
}

void WsClient::disconnect() {
    auto& impl = *pimpl_;
    impl.muted = true;
    impl.stopping = true;

    if (impl.context) {
        lws_cancel_service(impl.context);
    }
    if (impl.service_thread.joinable()) {
        impl.service_thread.join();
    }
    impl.destroy_context();

    impl.wsi = nullptr;
    impl.partial_frame.clear();
    impl.state = WsConnectionState::Disconnected;
}

} // namespace binance
