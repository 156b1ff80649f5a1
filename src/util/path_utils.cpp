#include "typed_datasets/path_utils.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <system_error>

namespace tds {

static constexpr int kCacheKeyHexDigits = 16;

FileFormat detect_format(std::string_view path_or_url) {
  auto cut = path_or_url.find_first_of("?#");
  if (cut != std::string_view::npos) path_or_url = path_or_url.substr(0, cut);
  auto ext = std::filesystem::path(std::string(path_or_url)).extension().string();
  if (ext == ".csv" || ext == ".tsv" || ext == ".data" || ext == ".txt") return FileFormat::CSV;
  if (ext == ".json") return FileFormat::JSON;
  return FileFormat::Unknown;
}

Result<std::string> hex_hash_prefix(std::string_view data, int len) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1 || md_len == 0) {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return io_error("cannot compute SHA-256 cache key", buf);
  }

  static constexpr char digits[] = "0123456789abcdef";
  std::string s;
  s.reserve(md_len * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    s.push_back(digits[md[i] >> 4]);
    s.push_back(digits[md[i] & 0x0f]);
  }
  if (len >= 0 && static_cast<std::size_t>(len) < s.size()) s.resize(len);
  return s;
}

Result<std::filesystem::path> resolve_path(const std::filesystem::path& cache_dir,
                                           std::string_view identifier) {
  auto hex = hex_hash_prefix(identifier, kCacheKeyHexDigits);
  if (!hex) {
    Error e = hex.error();
    e.context = std::string(identifier) + ": " + e.context;
    return e;
  }
  return cache_dir / ("ds" + hex.value());
}

bool ensure_dir(const std::filesystem::path& dir, Error* err) {
  if (dir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  std::error_code dir_ec;
  if (ec && !std::filesystem::is_directory(dir, dir_ec)) {
    if (err) *err = io_error("cannot create directory " + dir.string(), ec.message());
    return false;
  }
  return true;
}

}
