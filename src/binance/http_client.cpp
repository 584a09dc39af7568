#include "binance/http_client.hpp"

#include <memory>
#include <utility>

namespace binance {
namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

struct EasyHandleDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

} // namespace

HttpClient::HttpClient()
    : global_initialized_(false) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw TransportError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

RequestTimings HttpClient::collect_timings(CURL* handle) const {
    RequestTimings timings;
    double value = 0.0;

    if (curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &value) == CURLE_OK) {
        timings.connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME, &value) == CURLE_OK) {
        timings.app_connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &value) == CURLE_OK) {
        timings.start_transfer_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &value) == CURLE_OK) {
        timings.total_ms = value * 1000.0;
    }

    return timings;
}

HttpResponse HttpClient::request(
    const std::string& method,
    const std::string& url,
    const HttpHeaders& headers,
    const std::string& body) const {
    std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        throw TransportError("Failed to create CURL easy handle");
    }

    std::string response_body;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, 5000L);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, 3000L);
    curl_easy_setopt(handle.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(handle.get(), CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    std::unique_ptr<curl_slist, HeaderListDeleter> header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), (header.first + ": " + header.second).c_str());
        if (appended == nullptr) {
            throw TransportError("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    if (header_list) {
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    if (!body.empty()) {
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const auto perform_code = curl_easy_perform(handle.get());
    if (perform_code != CURLE_OK) {
        throw TransportError(method + " " + url.substr(0, url.find('?')) + " failed: "
                             + std::string(curl_easy_strerror(perform_code)));
    }

    long status_code = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status_code);

    if (status_code < 200 || status_code >= 300) {
        throw UpstreamError("HTTP " + std::to_string(status_code) + ": " + response_body,
                            status_code, response_body);
    }

    return HttpResponse{status_code, std::move(response_body), collect_timings(handle.get())};
}

} // namespace binance
