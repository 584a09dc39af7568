#include "guard/stream_session.hpp"

#include "guard/log.hpp"

#include <exception>
#include <utility>

namespace guard {
namespace {

constexpr const char* kTag = "OCO";

// Upper bound on a single wait when no renewal is due.
constexpr std::chrono::seconds kIdleWait{60};

} // namespace

const char* to_string(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::Disconnected: return "disconnected";
        case SessionPhase::Connecting: return "connecting";
        case SessionPhase::Connected: return "connected";
        case SessionPhase::Closing: return "closing";
    }
    return "disconnected";
}

StreamSession::StreamSession(StreamSessionOptions options,
                             ListenKeyManager& listen_keys,
                             StreamConnector& connector,
                             MessageSink sink)
    : options_(std::move(options)),
      listen_keys_(listen_keys),
      connector_(connector),
      sink_(std::move(sink)),
      backoff_(options_.reconnect_min, options_.reconnect_max, options_.jitter) {}

StreamSession::~StreamSession() {
    stop();
}

void StreamSession::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (control_thread_.joinable()) {
        return;
    }
    stop_requested_ = false;
    control_thread_ = std::thread(&StreamSession::run, this);
}

void StreamSession::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!control_thread_.joinable()) {
        return;
    }
    events_.push(Event{EventKind::Stop});
    control_thread_.join();
}

SessionSnapshot StreamSession::snapshot() const {
    return state_.snapshot();
}

void StreamSession::record_order_event(std::int64_t at_ms) {
    Event event;
    event.kind = EventKind::OrderEvent;
    event.at_ms = at_ms;
    events_.push(std::move(event));
}

void StreamSession::record_close_fill(std::int64_t at_ms) {
    Event event;
    event.kind = EventKind::CloseFill;
    event.at_ms = at_ms;
    events_.push(std::move(event));
}

void StreamSession::run() {
    while (!stop_requested_) {
        if (open_connection()) {
            serve_connection();
        }
        if (stop_requested_) {
            break;
        }
        wait_before_reconnect();
    }
    teardown();
    log_info(kTag, "user stream stopped");
}

bool StreamSession::open_connection() {
    set_phase(SessionPhase::Connecting);

    std::string key;
    try {
        key = listen_keys_.acquire();
    } catch (const std::exception& ex) {
        record_error(std::string("listen key: ") + ex.what());
        set_phase(SessionPhase::Disconnected);
        return false;
    }

    listen_key_ = key;
    state_.update([&key](SessionSnapshot& record) { record.listen_key = key; });

    const auto generation = next_generation_++;
    active_generation_ = generation;

    try {
        connection_ = connector_.open(options_.stream_base_url + "/" + key, make_handlers(generation));
    } catch (const std::exception& ex) {
        record_error(std::string("stream connect: ") + ex.what());
        teardown();
        return false;
    }
    return true;
}

void StreamSession::serve_connection() {
    std::optional<std::chrono::steady_clock::time_point> renew_at;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (renew_at && now >= *renew_at) {
            listen_keys_.renew(listen_key_);
            renew_at = now + options_.keepalive_interval;
        }

        const auto deadline = renew_at ? *renew_at : now + kIdleWait;
        auto event = events_.pop_until(deadline);
        if (!event || apply_common(*event)) {
            if (stop_requested_) {
                teardown();
                return;
            }
            continue;
        }

        if (event->generation != active_generation_) {
            log_debug(kTag, "dropping event from stale connection ", event->generation);
            continue;
        }

        switch (event->kind) {
            case EventKind::Opened:
                set_phase(SessionPhase::Connected);
                state_.update([](SessionSnapshot& record) { record.connected = true; });
                backoff_.reset();
                renew_at = std::chrono::steady_clock::now() + options_.keepalive_interval;
                log_info(kTag, "user stream connected");
                break;

            case EventKind::Message:
                sink_(event->payload);
                break;

            case EventKind::Error:
                record_error(event->payload);
                teardown();
                return;

            case EventKind::Closed:
                log_warn(kTag, "user stream closed");
                teardown();
                return;

            default:
                break;
        }
    }
}

void StreamSession::wait_before_reconnect() {
    const auto delay = backoff_.next_delay();

    std::uint64_t attempt = 0;
    state_.update([&attempt, delay](SessionSnapshot& record) {
        attempt = ++record.reconnects;
        record.last_reconnect_delay_ms = delay.count();
    });
    log_info(kTag, "reconnecting in ", delay.count(), "ms (attempt ", attempt, ")");

    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (!stop_requested_) {
        auto event = events_.pop_until(deadline);
        if (!event) {
            return;
        }
        apply_common(*event);
    }
}

void StreamSession::teardown() {
    if (!connection_ && listen_key_.empty()) {
        return;
    }

    set_phase(SessionPhase::Closing);
    active_generation_ = 0;

    if (connection_) {
        connection_->close();
        connection_.reset();
    }

    listen_keys_.release(listen_key_);
    listen_key_.clear();

    state_.update([](SessionSnapshot& record) {
        record.connected = false;
        record.listen_key.clear();
        record.phase = SessionPhase::Disconnected;
    });
}

bool StreamSession::apply_common(const Event& event) {
    switch (event.kind) {
        case EventKind::Stop:
            stop_requested_ = true;
            return true;

        case EventKind::OrderEvent:
            state_.update([&event](SessionSnapshot& record) { record.last_event_at_ms = event.at_ms; });
            return true;

        case EventKind::CloseFill:
            state_.update([&event](SessionSnapshot& record) {
                record.last_order_update_at_ms = event.at_ms;
                ++record.cancel_batches;
            });
            return true;

        default:
            return false;
    }
}

StreamHandlers StreamSession::make_handlers(std::uint64_t generation) {
    StreamHandlers handlers;
    handlers.on_open = [this, generation]() {
        events_.push(Event{EventKind::Opened, generation});
    };
    handlers.on_message = [this, generation](const std::string& message) {
        events_.push(Event{EventKind::Message, generation, message});
    };
    handlers.on_error = [this, generation](const std::string& error) {
        events_.push(Event{EventKind::Error, generation, error});
    };
    handlers.on_close = [this, generation]() {
        events_.push(Event{EventKind::Closed, generation});
    };
    return handlers;
}

void StreamSession::record_error(const std::string& message) {
    log_warn(kTag, "ws error: ", message);
    state_.update([&message](SessionSnapshot& record) { record.last_error = message; });
}

void StreamSession::set_phase(SessionPhase phase) {
    state_.update([phase](SessionSnapshot& record) { record.phase = phase; });
}

} // namespace guard
