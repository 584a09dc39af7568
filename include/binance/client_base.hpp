#pragma once

#include "binance/http_client.hpp"
#include "binance/util.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace binance {

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

class ClientBase {
public:
    ClientBase(Credentials credentials,
               std::string base_url,
               long recv_window_ms = 5000);

    [[nodiscard]] RequestTimings last_request_timings() const;

    // Offset added to the local clock when stamping signed requests.
    void set_time_offset_ms(std::int64_t offset_ms) noexcept;
    [[nodiscard]] std::int64_t time_offset_ms() const noexcept;

    // Query string with timestamp, recvWindow and signature appended.
    std::string build_signed_query(QueryParams params) const;

protected:
    HttpResponse public_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    // Carries the API key header but no signature (USER_STREAM endpoints).
    HttpResponse keyed_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    HttpResponse signed_request(
        const std::string& method,
        const std::string& path,
        QueryParams params = {}) const;

private:
    HttpResponse perform(const std::string& method,
                         const std::string& url,
                         const HttpHeaders& headers) const;
    void require_api_key() const;

    Credentials credentials_;
    std::string base_url_;
    long recv_window_ms_;
    std::atomic<std::int64_t> time_offset_ms_{0};
    HttpClient http_client_;
    mutable RequestTimings last_timings_;
    mutable std::mutex request_mutex_;
};

} // namespace binance
