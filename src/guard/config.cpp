#include "guard/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace guard {
namespace {

const char* const kKnownKeys[] = {
    "BINANCE_API_KEY",
    "BINANCE_API_SECRET",
    "BASE_URL",
    "FWS_BASE",
    "RECV_WINDOW",
    "KEEPALIVE_MINUTES",
    "CANCEL_MODE",
    "CLIENT_ID_PREFIX",
    "HEDGE_MODE",
    "HEALTH_PORT",
    "RECONNECT_MIN_MS",
    "RECONNECT_MAX_MS",
    "LOG_LEVEL",
};

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string lookup(const EnvMap& env, const std::string& key, const std::string& fallback) {
    const auto it = env.find(key);
    if (it == env.end()) {
        return fallback;
    }
    return trim(it->second);
}

long long parse_integer(const EnvMap& env, const std::string& key, long long fallback,
                        long long min_value, long long max_value) {
    const auto text = lookup(env, key, "");
    if (text.empty()) {
        return fallback;
    }

    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(key + " must be an integer, got \"" + text + "\"");
    }
    if (consumed != text.size()) {
        throw ConfigError(key + " must be an integer, got \"" + text + "\"");
    }
    if (value < min_value || value > max_value) {
        throw ConfigError(key + " must be between " + std::to_string(min_value) + " and "
                          + std::to_string(max_value) + ", got " + text);
    }
    return value;
}

double parse_positive_double(const EnvMap& env, const std::string& key, double fallback, double max_value) {
    const auto text = lookup(env, key, "");
    if (text.empty()) {
        return fallback;
    }

    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(key + " must be a number, got \"" + text + "\"");
    }
    if (consumed != text.size() || !std::isfinite(value) || value <= 0.0 || value > max_value) {
        throw ConfigError(key + " must be a number in (0, " + std::to_string(max_value) + "], got " + text);
    }
    return value;
}

bool parse_flag(const EnvMap& env, const std::string& key, bool fallback) {
    const auto text = lookup(env, key, "");
    if (text.empty()) {
        return fallback;
    }
    if (text == "1" || text == "true" || text == "TRUE") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE") {
        return false;
    }
    throw ConfigError(key + " must be 0 or 1, got \"" + text + "\"");
}

} // namespace

GuardConfig parse_config(const EnvMap& env) {
    GuardConfig config;

    config.credentials.api_key = lookup(env, "BINANCE_API_KEY", "");
    config.credentials.api_secret = lookup(env, "BINANCE_API_SECRET", "");
    if (config.credentials.api_key.empty() || config.credentials.api_secret.empty()) {
        throw ConfigError("Set BINANCE_API_KEY and BINANCE_API_SECRET");
    }

    config.rest_base_url = lookup(env, "BASE_URL", config.rest_base_url);
    config.stream_base_url = lookup(env, "FWS_BASE", config.stream_base_url);
    while (!config.stream_base_url.empty() && config.stream_base_url.back() == '/') {
        config.stream_base_url.pop_back();
    }
    if (config.rest_base_url.empty() || config.stream_base_url.empty()) {
        throw ConfigError("BASE_URL and FWS_BASE must not be empty");
    }

    config.recv_window_ms = static_cast<long>(parse_integer(env, "RECV_WINDOW", 5000, 1, 60000));

    // Listen keys expire after 60 minutes without a keepalive.
    const double keepalive_minutes = parse_positive_double(env, "KEEPALIVE_MINUTES", 25.0, 59.0);
    config.keepalive_interval = std::chrono::milliseconds(
        static_cast<long long>(std::llround(keepalive_minutes * 60000.0)));

    const auto mode_text = lookup(env, "CANCEL_MODE", "SYMBOL");
    if (!parse_cancel_mode(mode_text, config.cancel_policy.mode)) {
        throw ConfigError("CANCEL_MODE must be SYMBOL, SIDE or PREFIX, got \"" + mode_text + "\"");
    }
    config.cancel_policy.client_id_prefix = lookup(env, "CLIENT_ID_PREFIX", "brkt_");
    if (config.cancel_policy.mode == CancelMode::ByPrefix && config.cancel_policy.client_id_prefix.empty()) {
        throw ConfigError("CANCEL_MODE=PREFIX requires a non-empty CLIENT_ID_PREFIX");
    }
    config.cancel_policy.hedge_mode = parse_flag(env, "HEDGE_MODE", false);

    config.health_port = static_cast<int>(parse_integer(env, "HEALTH_PORT", 8080, 0, 65535));

    config.reconnect_min = std::chrono::milliseconds(parse_integer(env, "RECONNECT_MIN_MS", 1000, 1, 3600000));
    config.reconnect_max = std::chrono::milliseconds(parse_integer(env, "RECONNECT_MAX_MS", 60000, 1, 3600000));
    if (config.reconnect_min > config.reconnect_max) {
        throw ConfigError("RECONNECT_MIN_MS must not exceed RECONNECT_MAX_MS");
    }

    const auto level_text = lookup(env, "LOG_LEVEL", "info");
    if (!parse_log_level(level_text, config.log_level)) {
        throw ConfigError("LOG_LEVEL must be debug, info, warn or error, got \"" + level_text + "\"");
    }

    return config;
}

std::vector<std::string> config_warnings(const GuardConfig& config) {
    std::vector<std::string> warnings;
    if (config.cancel_policy.mode == CancelMode::BySide && !config.cancel_policy.hedge_mode) {
        warnings.emplace_back(
            "CANCEL_MODE=SIDE without HEDGE_MODE=1: fills without a position side "
            "will cancel every open order on the symbol");
    }
    if (config.cancel_policy.mode == CancelMode::BySymbol && config.cancel_policy.hedge_mode) {
        warnings.emplace_back(
            "HEDGE_MODE=1 with CANCEL_MODE=SYMBOL: fills carrying LONG/SHORT are cancelled by side");
    }
    return warnings;
}

EnvMap read_environment() {
    EnvMap env;
    for (const char* key : kKnownKeys) {
        if (const char* value = std::getenv(key)) {
            env.emplace(key, value);
        }
    }
    return env;
}

bool load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    return true;
}

} // namespace guard
