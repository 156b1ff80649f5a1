#pragma once
#include "typed_datasets/cache_store.hpp"
#include "typed_datasets/error.hpp"
#include "typed_datasets/http_fetcher.hpp"
#include "typed_datasets/source.hpp"
#include <string>

namespace tds {

// Source -> raw bytes, going to the network only on a cache miss.
class SourceResolver {
public:
  SourceResolver(const CacheStore& cache, Fetcher& fetcher);

  Result<std::string> resolve(const Source& src);

  // Whether the last resolve() was served from the cache.
  bool last_was_cache_hit() const noexcept { return last_hit_; }

private:
  Result<std::string> resolve_url(const Url& u);

  const CacheStore& cache_;
  Fetcher& fetcher_;
  bool last_hit_{false};
};

}
