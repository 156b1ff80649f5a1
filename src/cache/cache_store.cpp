#include "typed_datasets/cache_store.hpp"
#include "typed_datasets/path_utils.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace tds {

CacheStore::CacheStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

Result<std::filesystem::path> CacheStore::path_for(std::string_view identifier) const {
  return resolve_path(dir_, identifier);
}

bool CacheStore::exists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

Result<std::string> CacheStore::read(const std::filesystem::path& p) {
  FILE* f = std::fopen(p.c_str(), "rb");
  if (!f) return io_error("cannot open cache entry " + p.string(), std::strerror(errno));

  std::string out;
  char buf[64 * 1024];
  while (true) {
    std::size_t n = std::fread(buf, 1, sizeof(buf), f);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) {
      if (std::ferror(f)) {
        int e = errno;
        std::fclose(f);
        return io_error("cannot read cache entry " + p.string(), std::strerror(e));
      }
      break;
    }
  }
  std::fclose(f);
  return out;
}

bool CacheStore::write(const std::filesystem::path& p, std::string_view bytes, Error* err) {
  if (!ensure_dir(p.parent_path(), err)) return false;

  static std::atomic<unsigned> seq{0};
  auto tmp = p;
  tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(seq++);

  FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) {
    if (err) *err = io_error("cannot create " + tmp.string(), std::strerror(errno));
    return false;
  }
  const bool wrote = std::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
  const int write_errno = errno;
  const bool closed = std::fclose(f) == 0;
  if (!wrote || !closed) {
    std::error_code ignore;
    std::filesystem::remove(tmp, ignore);
    if (err) *err = io_error("cannot write " + p.string(),
                             std::strerror(wrote ? errno : write_errno));
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignore;
    std::filesystem::remove(tmp, ignore);
    if (err) *err = io_error("cannot move cache entry into place: " + p.string(), ec.message());
    return false;
  }
  return true;
}

}
