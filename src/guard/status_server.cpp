#include "guard/status_server.hpp"

#include "binance/util.hpp"
#include "guard/log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace guard {
namespace {

constexpr const char* kTag = "HEALTH";
constexpr int kPollIntervalMs = 200;
constexpr std::size_t kMaxRequestBytes = 8192;

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 404: return "Not Found";
        default: return "Error";
    }
}

void send_all(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

} // namespace

nlohmann::json snapshot_to_json(const SessionSnapshot& snapshot, std::int64_t now_ms) {
    nlohmann::json doc;
    doc["ok"] = true;
    doc["now"] = now_ms;
    doc["connected"] = snapshot.connected;
    doc["phase"] = to_string(snapshot.phase);
    doc["reconnects"] = snapshot.reconnects;
    doc["lastEventAt"] = snapshot.last_event_at_ms;
    doc["lastOrderUpdateAt"] = snapshot.last_order_update_at_ms;
    doc["lastError"] = snapshot.last_error ? nlohmann::json(*snapshot.last_error) : nlohmann::json(nullptr);
    doc["lastReconnectDelayMs"] = snapshot.last_reconnect_delay_ms;
    doc["cancelBatches"] = snapshot.cancel_batches;
    return doc;
}

HttpReply route_status_request(const std::string& method,
                               const std::string& target,
                               const SessionSnapshot& snapshot,
                               std::int64_t now_ms) {
    const auto path = target.substr(0, target.find('?'));
    if (method == "GET" && path == "/health") {
        return HttpReply{200, snapshot_to_json(snapshot, now_ms).dump()};
    }
    return HttpReply{404, nlohmann::json{{"ok", false}, {"error", "not found"}}.dump()};
}

StatusServer::StatusServer(int port, SnapshotSource source)
    : port_(port),
      source_(std::move(source)) {}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start() {
    if (running_) {
        return true;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        log_error(kTag, "socket: ", std::strerror(errno));
        return false;
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0
        || ::listen(fd, 16) < 0) {
        log_error(kTag, "cannot listen on :", port_, ": ", std::strerror(errno));
        ::close(fd);
        return false;
    }

    if (port_ == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port_ = ntohs(addr.sin_port);
        }
    }

    listen_fd_ = fd;
    running_ = true;
    server_thread_ = std::thread(&StatusServer::run, this);
    log_info(kTag, "health server on :", port_);
    return true;
}

void StatusServer::stop() {
    running_ = false;
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void StatusServer::run() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready <= 0) {
            continue;
        }

        const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }
        handle_client(client_fd);
        ::close(client_fd);
    }
}

void StatusServer::handle_client(int client_fd) {
    timeval timeout{};
    timeout.tv_sec = 1;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    std::string request;
    char buffer[1024];
    while (request.find("\r\n") == std::string::npos && request.size() < kMaxRequestBytes) {
        const auto n = ::recv(client_fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            break;
        }
        request.append(buffer, static_cast<std::size_t>(n));
    }

    const auto line_end = request.find("\r\n");
    const auto request_line = request.substr(0, line_end);
    const auto first_space = request_line.find(' ');
    const auto second_space = request_line.find(' ', first_space == std::string::npos ? 0 : first_space + 1);

    std::string method;
    std::string target;
    if (first_space != std::string::npos && second_space != std::string::npos) {
        method = request_line.substr(0, first_space);
        target = request_line.substr(first_space + 1, second_space - first_space - 1);
    }

    const auto reply = route_status_request(method, target, source_(), binance::current_timestamp_ms());

    std::string response =
        "HTTP/1.1 " + std::to_string(reply.status) + " " + reason_phrase(reply.status) + "\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(reply.body.size()) + "\r\n"
        "Connection: close\r\n"
        "\r\n" + reply.body;
    send_all(client_fd, response);
}

} // namespace guard
