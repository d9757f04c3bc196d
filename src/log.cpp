// =============================================================================
// log.cpp - Leveled stderr logging
// =============================================================================

#include "fizzdex/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace fizzdex {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_write_mutex;

} // anonymous namespace

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

LogLevel parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown log level: " + lower);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF:   return "off";
    }
    return "unknown";
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::OFF && level >= log_level();
}

void log_write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[fizzdex] [" << log_level_name(level) << "] " << message << "\n";
}

} // namespace fizzdex
