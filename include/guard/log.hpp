#pragma once

#include <sstream>
#include <string>

namespace guard {

enum class LogLevel { Debug, Info, Warn, Error };

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

// Accepts debug/info/warn/error in any case; false leaves level untouched.
bool parse_log_level(const std::string& text, LogLevel& level);

// Writes "<ISO-8601 UTC> <LEVEL> [tag] message"; Warn and Error go to stderr.
void log_line(LogLevel level, const std::string& tag, const std::string& message);

std::string format_timestamp_ms(long long epoch_ms);

namespace detail {

inline void append(std::ostringstream&) {}

template <typename T, typename... Rest>
void append(std::ostringstream& oss, const T& value, const Rest&... rest) {
    oss << value;
    append(oss, rest...);
}

} // namespace detail

template <typename... Args>
void log(LogLevel level, const std::string& tag, const Args&... args) {
    if (level < log_level()) {
        return;
    }
    std::ostringstream oss;
    detail::append(oss, args...);
    log_line(level, tag, oss.str());
}

template <typename... Args>
void log_debug(const std::string& tag, const Args&... args) { log(LogLevel::Debug, tag, args...); }

template <typename... Args>
void log_info(const std::string& tag, const Args&... args) { log(LogLevel::Info, tag, args...); }

template <typename... Args>
void log_warn(const std::string& tag, const Args&... args) { log(LogLevel::Warn, tag, args...); }

template <typename... Args>
void log_error(const std::string& tag, const Args&... args) { log(LogLevel::Error, tag, args...); }

} // namespace guard
