#include "typed_datasets/log.hpp"
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace tds {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_out_mu;

bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}
}

void set_log_level(LogLevel lvl) noexcept { g_level.store(static_cast<int>(lvl)); }
LogLevel log_level() noexcept { return static_cast<LogLevel>(g_level.load()); }
bool log_enabled(LogLevel lvl) noexcept { return static_cast<int>(lvl) <= g_level.load(); }

std::optional<LogLevel> parse_log_level(std::string_view s) {
  if (ieq(s, "error")) return LogLevel::Error;
  if (ieq(s, "warn") || ieq(s, "warning")) return LogLevel::Warn;
  if (ieq(s, "info"))  return LogLevel::Info;
  if (ieq(s, "debug")) return LogLevel::Debug;
  return std::nullopt;
}

void log_line(LogLevel lvl, std::string_view tag, std::string_view msg) {
  if (!log_enabled(lvl)) return;
  std::lock_guard<std::mutex> lk(g_out_mu);
  std::cerr << '[' << tag << "] " << msg << '\n';
}

}
