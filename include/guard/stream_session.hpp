#pragma once

#include "guard/channel.hpp"
#include "guard/listen_key_manager.hpp"
#include "guard/reconnect_backoff.hpp"
#include "guard/session_state.hpp"
#include "guard/stream_connector.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace guard {

struct StreamSessionOptions {
    std::string stream_base_url = "wss://fstream.binance.com/ws";
    std::chrono::milliseconds keepalive_interval{25 * 60 * 1000};
    std::chrono::milliseconds reconnect_min{1000};
    std::chrono::milliseconds reconnect_max{60000};
    ReconnectBackoff::Jitter jitter;
};

using MessageSink = std::function<void(const std::string& message)>;

// Owns the user data stream: one listen key and at most one connection at a
// time, renewal while connected, jittered reconnect after any error or close.
//
// All transitions run on one control thread that consumes an event channel.
// Socket callbacks and the event pipeline only post to that channel, tagged
// with the generation of the connection they belong to; events from a
// connection that was already torn down are dropped.
class StreamSession {
public:
    StreamSession(StreamSessionOptions options,
                  ListenKeyManager& listen_keys,
                  StreamConnector& connector,
                  MessageSink sink);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    void start();

    // Closes the connection, releases the listen key and joins the control
    // thread. Interrupts a pending reconnect delay. Idempotent.
    void stop();

    SessionSnapshot snapshot() const;

    void record_order_event(std::int64_t at_ms);
    void record_close_fill(std::int64_t at_ms);

private:
    enum class EventKind {
        Opened,
        Message,
        Error,
        Closed,
        OrderEvent,
        CloseFill,
        Stop
    };

    struct Event {
        EventKind kind = EventKind::Stop;
        std::uint64_t generation = 0;
        std::string payload;
        std::int64_t at_ms = 0;
    };

    void run();
    bool open_connection();
    void serve_connection();
    void wait_before_reconnect();
    void teardown();

    // Applies events that do not depend on the connection. Returns false for
    // connection events, which the caller must handle.
    bool apply_common(const Event& event);
    StreamHandlers make_handlers(std::uint64_t generation);
    void record_error(const std::string& message);
    void set_phase(SessionPhase phase);

    StreamSessionOptions options_;
    ListenKeyManager& listen_keys_;
    StreamConnector& connector_;
    MessageSink sink_;

    EventChannel<Event> events_;
    SessionState state_;
    std::mutex lifecycle_mutex_;
    std::thread control_thread_;

    // Control-thread state.
    ReconnectBackoff backoff_;
    std::unique_ptr<StreamConnection> connection_;
    std::string listen_key_;
    std::uint64_t next_generation_ = 1;
    std::uint64_t active_generation_ = 0;
    bool stop_requested_ = false;
};

} // namespace guard
