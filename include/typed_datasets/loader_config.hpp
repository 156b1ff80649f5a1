#pragma once
#include "typed_datasets/error.hpp"
#include "typed_datasets/log.hpp"
#include <filesystem>
#include <string>

namespace tds {

struct LoaderConfig {
  std::filesystem::path cache_dir;          // empty -> <temp>/<cache_subdir>
  std::string cache_subdir    = "haskds";
  int connect_timeout_s       = 30;
  int read_timeout_s          = 30;
  LogLevel log_level          = LogLevel::Warn;  // applied with set_log_level()
};

// Defaults overridden by TDS_CACHE_DIR, TDS_TIMEOUT_S (both timeouts) and
// TDS_LOG_LEVEL. Malformed values are ignored with a warning.
LoaderConfig loader_config_from_env();

// Explicit cache_dir, or the system temp directory joined with cache_subdir.
Result<std::filesystem::path> resolve_cache_dir(const LoaderConfig& cfg);

}
