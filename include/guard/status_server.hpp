#pragma once

#include "guard/session_state.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace guard {

struct HttpReply {
    int status = 200;
    std::string body;
};

nlohmann::json snapshot_to_json(const SessionSnapshot& snapshot, std::int64_t now_ms);

// GET /health answers with the snapshot; everything else is 404.
HttpReply route_status_request(const std::string& method,
                               const std::string& target,
                               const SessionSnapshot& snapshot,
                               std::int64_t now_ms);

// Minimal blocking HTTP/1.1 endpoint on its own thread. One request per
// connection, JSON responses only.
class StatusServer {
public:
    using SnapshotSource = std::function<SessionSnapshot()>;

    StatusServer(int port, SnapshotSource source);
    ~StatusServer();

    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    // Binds and starts serving. Returns false if the socket cannot be bound.
    bool start();
    void stop();

    int port() const noexcept { return port_; }

private:
    void run();
    void handle_client(int client_fd);

    int port_;
    SnapshotSource source_;
    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};

} // namespace guard
