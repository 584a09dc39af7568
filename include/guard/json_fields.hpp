#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace guard {

// Lenient accessors for exchange payloads where numbers sometimes arrive as
// strings and optional fields may be null or missing.
std::string get_string_optional(const nlohmann::json& obj, const char* key);
bool get_bool_optional(const nlohmann::json& obj, const char* key, bool default_value = false);
std::int64_t get_id_optional(const nlohmann::json& obj, const char* key, std::int64_t default_value = 0);

} // namespace guard
