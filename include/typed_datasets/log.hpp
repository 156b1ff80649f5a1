#pragma once
#include <optional>
#include <string_view>

namespace tds {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Process-wide threshold; lines above it are dropped. Default: Warn.
void     set_log_level(LogLevel lvl) noexcept;
LogLevel log_level() noexcept;
bool     log_enabled(LogLevel lvl) noexcept;

// "error" | "warn" | "info" | "debug" (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view s);

// Writes "[tag] msg" to stderr when `lvl` is enabled.
void log_line(LogLevel lvl, std::string_view tag, std::string_view msg);

}
