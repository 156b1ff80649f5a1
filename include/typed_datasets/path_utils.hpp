#pragma once
#include "typed_datasets/error.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace tds {

enum class FileFormat { CSV, JSON, Unknown };

// Guess format from the extension of a path or URL (query/fragment ignored).
FileFormat detect_format(std::string_view path_or_url);

// Lowercase hex of SHA-256(data), truncated to `len` digits (max 64).
// Io error if the digest cannot be computed.
Result<std::string> hex_hash_prefix(std::string_view data, int len);

// Cache file for `identifier`: cache_dir / "ds<16 hex digits of SHA-256>".
// The hash is part of the on-disk cache format; changing it orphans every
// existing entry.
Result<std::filesystem::path> resolve_path(const std::filesystem::path& cache_dir,
                                           std::string_view identifier);

// Create `dir` and its parents; succeeds if it already exists.
bool ensure_dir(const std::filesystem::path& dir, Error* err = nullptr);

}
