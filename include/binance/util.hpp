#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace binance {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

// Drops parameters whose value is empty; order is preserved.
QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

std::string to_upper_copy(std::string value);

// Lowercase hex HMAC-SHA256 of message keyed by key.
std::string hmac_sha256_hex(const std::string& key, const std::string& message);

std::int64_t current_timestamp_ms();

} // namespace binance
