#include "typed_datasets/source_resolver.hpp"
#include "typed_datasets/log.hpp"

namespace tds {

SourceResolver::SourceResolver(const CacheStore& cache, Fetcher& fetcher)
  : cache_(cache), fetcher_(fetcher) {}

Result<std::string> SourceResolver::resolve(const Source& src) {
  return std::visit([this](const auto& s) { return resolve_url(s); }, src);
}

Result<std::string> SourceResolver::resolve_url(const Url& u) {
  last_hit_ = false;
  auto key = cache_.path_for(u.value);
  if (!key) return key.error();
  const auto& path = key.value();

  if (CacheStore::exists(path)) {
    log_line(LogLevel::Debug, "cache", "hit: " + path.string() + " <- " + u.value);
    auto bytes = CacheStore::read(path);
    if (bytes) last_hit_ = true;
    return bytes;
  }

  log_line(LogLevel::Debug, "cache", "miss: " + u.value);
  auto body = fetcher_.get(u.value);
  if (!body) return body;

  Error err;
  if (!CacheStore::write(path, body.value(), &err)) return err;
  log_line(LogLevel::Info, "cache", "stored " + path.string());
  return body;
}

}
