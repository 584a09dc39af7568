#include "guard/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace guard {
namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    g_level.store(level);
}

LogLevel log_level() noexcept {
    return g_level.load();
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "debug") {
        level = LogLevel::Debug;
    } else if (lowered == "info") {
        level = LogLevel::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::Warn;
    } else if (lowered == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

std::string format_timestamp_ms(long long epoch_ms) {
    const std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (epoch_ms % 1000) << 'Z';
    return oss.str();
}

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    using namespace std::chrono;
    const auto now_ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();

    std::ostream& out = level >= LogLevel::Warn ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lock(g_output_mutex);
    out << format_timestamp_ms(now_ms) << ' ' << level_name(level)
        << " [" << tag << "] " << message << std::endl;
}

} // namespace guard
