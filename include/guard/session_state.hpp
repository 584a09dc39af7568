#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace guard {

enum class SessionPhase {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

const char* to_string(SessionPhase phase) noexcept;

struct SessionSnapshot {
    SessionPhase phase = SessionPhase::Disconnected;
    bool connected = false;
    std::string listen_key;
    std::uint64_t reconnects = 0;
    std::int64_t last_event_at_ms = 0;
    std::int64_t last_order_update_at_ms = 0;
    std::optional<std::string> last_error;
    std::int64_t last_reconnect_delay_ms = 0;
    std::uint64_t cancel_batches = 0;
};

// Process-wide session record. Written by StreamSession only; readers get copies.
class SessionState {
public:
    SessionSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    template <typename Mutator>
    void update(Mutator&& mutate) {
        std::lock_guard<std::mutex> lock(mutex_);
        mutate(record_);
    }

private:
    mutable std::mutex mutex_;
    SessionSnapshot record_;
};

} // namespace guard
