#include "oprops/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace oprops {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};

std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

} // namespace

const char* level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= log_level();
}

void log(LogLevel level, std::string_view message) {
    if (!log_enabled(level))
        return;

    std::lock_guard lock(log_mutex());
    std::clog << "[oprops] " << level_name(level) << ": " << message << std::endl;
}

} // namespace oprops
