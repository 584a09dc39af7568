#include "binance/client_base.hpp"

#include <stdexcept>
#include <utility>

namespace binance {
namespace {

constexpr const char* kApiKeyHeader = "X-MBX-APIKEY";

} // namespace

ClientBase::ClientBase(Credentials credentials, std::string base_url, long recv_window_ms)
    : credentials_(std::move(credentials)),
      base_url_(std::move(base_url)),
      recv_window_ms_(recv_window_ms),
      http_client_(),
      last_timings_{} {}

RequestTimings ClientBase::last_request_timings() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_timings_;
}

void ClientBase::set_time_offset_ms(std::int64_t offset_ms) noexcept {
    time_offset_ms_.store(offset_ms);
}

std::int64_t ClientBase::time_offset_ms() const noexcept {
    return time_offset_ms_.load();
}

HttpResponse ClientBase::public_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    return perform(method, url, {});
}

HttpResponse ClientBase::keyed_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    require_api_key();

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    return perform(method, url, {{kApiKeyHeader, credentials_.api_key}});
}

HttpResponse ClientBase::signed_request(
    const std::string& method,
    const std::string& path,
    QueryParams params) const {

    require_api_key();
    if (credentials_.api_secret.empty()) {
        throw std::invalid_argument("API secret is required for signed requests");
    }

    const auto signed_query = build_signed_query(std::move(params));
    const std::string url = base_url_ + path + '?' + signed_query;

    return perform(method, url, {{kApiKeyHeader, credentials_.api_key}});
}

std::string ClientBase::build_signed_query(QueryParams params) const {
    params.emplace_back("timestamp", std::to_string(current_timestamp_ms() + time_offset_ms()));
    params.emplace_back("recvWindow", std::to_string(recv_window_ms_));
    const auto query = build_query_string(params);
    const auto signature = hmac_sha256_hex(credentials_.api_secret, query);
    return query + "&signature=" + signature;
}

HttpResponse ClientBase::perform(const std::string& method,
                                 const std::string& url,
                                 const HttpHeaders& headers) const {
    auto response = http_client_.request(method, url, headers);
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        last_timings_ = response.timings;
    }
    return response;
}

void ClientBase::require_api_key() const {
    if (credentials_.api_key.empty()) {
        throw std::invalid_argument("API key is required for authenticated requests");
    }
}

} // namespace binance
