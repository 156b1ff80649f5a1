#pragma once
#include "typed_datasets/error.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace tds {

// Flat directory of raw source payloads keyed by a hash of the source
// identifier. Entries are created once and never updated or evicted.
class CacheStore {
public:
  explicit CacheStore(std::filesystem::path dir);

  const std::filesystem::path& dir() const noexcept { return dir_; }

  Result<std::filesystem::path> path_for(std::string_view identifier) const;

  static bool exists(const std::filesystem::path& p);

  // Whole-file read; Io error if missing or unreadable.
  static Result<std::string> read(const std::filesystem::path& p);

  // Creates the parent directory if needed, writes to a sibling temp file and
  // renames it over `p`, so concurrent readers see either nothing or the
  // complete payload. Concurrent writers: last rename wins.
  static bool write(const std::filesystem::path& p, std::string_view bytes,
                    Error* err = nullptr);

private:
  std::filesystem::path dir_;
};

}
