#include "guard/json_fields.hpp"

namespace guard {
namespace {

std::string parse_string_optional(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        return std::to_string(value.get<double>());
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return {};
}

} // namespace

std::string get_string_optional(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return {};
    }
    return parse_string_optional(obj.at(key));
}

bool get_bool_optional(const nlohmann::json& obj, const char* key, bool default_value) {
    if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
        return default_value;
    }
    const auto& value = obj.at(key);
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return value.get<std::string>() == "true";
    }
    return default_value;
}

std::int64_t get_id_optional(const nlohmann::json& obj, const char* key, std::int64_t default_value) {
    if (!obj.is_object() || !obj.contains(key)) {
        return default_value;
    }
    const auto& value = obj.at(key);
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 18) {
            return default_value;
        }
        return std::stoll(text);
    }
    return default_value;
}

} // namespace guard
