#include "typed_datasets/loader_config.hpp"
#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace tds {

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

LoaderConfig loader_config_from_env() {
  LoaderConfig cfg;

  const std::string dir = env_or("TDS_CACHE_DIR", "");
  if (!dir.empty()) cfg.cache_dir = dir;

  const std::string timeout = env_or("TDS_TIMEOUT_S", "");
  if (!timeout.empty()) {
    int secs = 0;
    auto [ptr, ec] = std::from_chars(timeout.data(), timeout.data() + timeout.size(), secs);
    if (ec == std::errc() && ptr == timeout.data() + timeout.size() && secs > 0) {
      cfg.connect_timeout_s = secs;
      cfg.read_timeout_s = secs;
    } else {
      log_line(LogLevel::Warn, "config", "ignoring TDS_TIMEOUT_S=" + timeout);
    }
  }

  const std::string level = env_or("TDS_LOG_LEVEL", "");
  if (!level.empty()) {
    if (auto lvl = parse_log_level(level)) cfg.log_level = *lvl;
    else log_line(LogLevel::Warn, "config", "ignoring TDS_LOG_LEVEL=" + level);
  }
  return cfg;
}

Result<std::filesystem::path> resolve_cache_dir(const LoaderConfig& cfg) {
  if (!cfg.cache_dir.empty()) return cfg.cache_dir;
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  if (ec) return io_error("cannot resolve temp directory", ec.message());
  return tmp / cfg.cache_subdir;
}

}
