#pragma once

#include <string_view>

namespace oprops {

enum class LogLevel { Debug, Info, Warn, Error, Off };

const char* level_name(LogLevel level) noexcept;

// Messages below this level are discarded. Defaults to Warn.
void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

bool log_enabled(LogLevel level) noexcept;

// Writes "[oprops] LEVEL: message" to std::clog
void log(LogLevel level, std::string_view message);

} // namespace oprops
