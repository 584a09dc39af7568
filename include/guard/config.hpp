#pragma once

#include "binance/client_base.hpp"
#include "guard/cancellation_engine.hpp"
#include "guard/log.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace guard {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

struct GuardConfig {
    binance::Credentials credentials;
    std::string rest_base_url = "https://fapi.binance.com";
    std::string stream_base_url = "wss://fstream.binance.com/ws";
    long recv_window_ms = 5000;
    std::chrono::milliseconds keepalive_interval{25 * 60 * 1000};
    CancelPolicy cancel_policy;
    int health_port = 8080;
    std::chrono::milliseconds reconnect_min{1000};
    std::chrono::milliseconds reconnect_max{60000};
    LogLevel log_level = LogLevel::Info;
};

using EnvMap = std::unordered_map<std::string, std::string>;

// Throws ConfigError on missing credentials or malformed values.
GuardConfig parse_config(const EnvMap& env);

// Non-fatal observations about a parsed configuration, for the startup log.
std::vector<std::string> config_warnings(const GuardConfig& config);

// Snapshot of every variable parse_config understands, from the process environment.
EnvMap read_environment();

// KEY=VALUE lines into the environment; existing variables win. Returns false
// when the file cannot be opened.
bool load_env_file(const std::string& path);

} // namespace guard
