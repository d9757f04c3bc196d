#ifndef FIZZDEX_LOG_HPP
#define FIZZDEX_LOG_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace fizzdex {

// =============================================================================
// Logging (stderr, process-wide level)
// =============================================================================

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

void set_log_level(LogLevel level);
LogLevel log_level();

// "trace", "debug", "info", "warn"/"warning", "error", "off"
// Throws std::invalid_argument on anything else.
LogLevel parse_log_level(std::string_view name);
const char* log_level_name(LogLevel level);

bool log_enabled(LogLevel level);
void log_write(LogLevel level, const std::string& message);

namespace detail {

inline void append(std::ostringstream&) {}

template<typename T, typename... Rest>
void append(std::ostringstream& os, const T& value, const Rest&... rest) {
    os << value;
    append(os, rest...);
}

} // namespace detail

template<typename... Args>
void log(LogLevel level, const Args&... args) {
    if (!log_enabled(level)) return;
    std::ostringstream os;
    detail::append(os, args...);
    log_write(level, os.str());
}

template<typename... Args> void log_debug(const Args&... args) { log(LogLevel::DEBUG, args...); }
template<typename... Args> void log_info(const Args&... args)  { log(LogLevel::INFO, args...); }
template<typename... Args> void log_warn(const Args&... args)  { log(LogLevel::WARN, args...); }
template<typename... Args> void log_error(const Args&... args) { log(LogLevel::ERROR, args...); }

} // namespace fizzdex

#endif // FIZZDEX_LOG_HPP
