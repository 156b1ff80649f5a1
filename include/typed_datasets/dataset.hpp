#pragma once
#include "typed_datasets/cache_store.hpp"
#include "typed_datasets/csv_parse.hpp"
#include "typed_datasets/error.hpp"
#include "typed_datasets/http_fetcher.hpp"
#include "typed_datasets/json_parse.hpp"
#include "typed_datasets/loader_config.hpp"
#include "typed_datasets/log.hpp"
#include "typed_datasets/source.hpp"
#include "typed_datasets/source_resolver.hpp"
#include "typed_datasets/text_transforms.hpp"
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace tds {

// A deferred load: given a cache directory and a network capability,
// produce every record of the dataset or fail. Holds no resources between
// loads.
template <class T>
class Dataset {
public:
  virtual ~Dataset() = default;

  virtual Result<std::vector<T>> load(const std::filesystem::path& cache_dir,
                                      Fetcher& fetcher) const = 0;

  virtual const Source& source() const = 0;
};

namespace detail {

// Resolve the source and run the preprocessing hook. Hook failures (error
// result or exception) are reported as parse errors.
inline Result<std::string> fetch_and_preprocess(const Source& src, const Preprocess& pre,
                                                const std::filesystem::path& cache_dir,
                                                Fetcher& fetcher) {
  CacheStore cache(cache_dir);
  SourceResolver resolver(cache, fetcher);
  auto raw = resolver.resolve(src);
  if (!raw) return raw;
  if (!pre) return raw;

  try {
    auto out = pre(raw.value());
    if (!out) {
      Error e = out.error();
      e.kind = ErrorKind::Parse;
      return e;
    }
    return out;
  } catch (const std::exception& ex) {
    return parse_error("preprocessing failed", ex.what());
  }
}

template <class T>
Result<std::vector<T>> with_source(Result<std::vector<T>> r, const Source& src) {
  if (r) return r;
  Error e = r.error();
  e.context = source_identifier(src) + ": " + e.context;
  return e;
}

}

// Headerless delimited text, decoded positionally with RecordDecoder<T>.
template <class T>
class DelimitedDataset : public Dataset<T> {
public:
  DelimitedDataset(Source src, char delimiter, Preprocess pre)
    : src_(std::move(src)), delimiter_(delimiter), pre_(std::move(pre)) {}

  Result<std::vector<T>> load(const std::filesystem::path& cache_dir,
                              Fetcher& fetcher) const override {
    auto bytes = detail::fetch_and_preprocess(src_, pre_, cache_dir, fetcher);
    if (!bytes) return bytes.error();
    return detail::with_source(parse_delimited<T>(bytes.value(), delimiter_), src_);
  }

  const Source& source() const override { return src_; }

private:
  Source src_;
  char delimiter_;
  Preprocess pre_;
};

// Delimited text with a header row, decoded by name with NamedRecordDecoder<T>.
template <class T>
class HeaderedDataset : public Dataset<T> {
public:
  HeaderedDataset(Source src, char delimiter, Preprocess pre)
    : src_(std::move(src)), delimiter_(delimiter), pre_(std::move(pre)) {}

  Result<std::vector<T>> load(const std::filesystem::path& cache_dir,
                              Fetcher& fetcher) const override {
    auto bytes = detail::fetch_and_preprocess(src_, pre_, cache_dir, fetcher);
    if (!bytes) return bytes.error();
    return detail::with_source(parse_delimited_headered<T>(bytes.value(), delimiter_), src_);
  }

  const Source& source() const override { return src_; }

private:
  Source src_;
  char delimiter_;
  Preprocess pre_;
};

// A JSON array of T, decoded with JsonDecoder<T>.
template <class T>
class JsonDataset : public Dataset<T> {
public:
  JsonDataset(Source src, Preprocess pre)
    : src_(std::move(src)), pre_(std::move(pre)) {}

  Result<std::vector<T>> load(const std::filesystem::path& cache_dir,
                              Fetcher& fetcher) const override {
    auto bytes = detail::fetch_and_preprocess(src_, pre_, cache_dir, fetcher);
    if (!bytes) return bytes.error();
    return detail::with_source(parse_json<T>(bytes.value()), src_);
  }

  const Source& source() const override { return src_; }

private:
  Source src_;
  Preprocess pre_;
};

template <class T>
DelimitedDataset<T> delimited_dataset(Source src, Preprocess pre = identity_preprocess()) {
  return DelimitedDataset<T>(std::move(src), ',', std::move(pre));
}

template <class T>
HeaderedDataset<T> headered_dataset(Source src) {
  return HeaderedDataset<T>(std::move(src), ',', identity_preprocess());
}

template <class T>
HeaderedDataset<T> headered_dataset(char separator, Source src) {
  return HeaderedDataset<T>(std::move(src), separator, identity_preprocess());
}

template <class T>
HeaderedDataset<T> headered_dataset(char separator, Source src, Preprocess pre) {
  return HeaderedDataset<T>(std::move(src), separator, std::move(pre));
}

template <class T>
JsonDataset<T> json_dataset(Source src, Preprocess pre = identity_preprocess()) {
  return JsonDataset<T>(std::move(src), std::move(pre));
}

inline HttpFetcher::Config fetcher_config(const LoaderConfig& cfg) {
  HttpFetcher::Config fc;
  fc.connect_timeout_s = cfg.connect_timeout_s;
  fc.read_timeout_s = cfg.read_timeout_s;
  return fc;
}

// Load `ds` through an explicit network capability.
template <class T>
Result<std::vector<T>> get_dataset(const Dataset<T>& ds, const LoaderConfig& cfg, Fetcher& fetcher) {
  auto dir = resolve_cache_dir(cfg);
  if (!dir) return dir.error();

  log_line(LogLevel::Info, "load", source_identifier(ds.source()) + " (cache " + dir.value().string() + ")");
  auto rows = ds.load(dir.value(), fetcher);
  if (rows) log_line(LogLevel::Info, "load", std::to_string(rows.value().size()) + " records");
  else      log_line(LogLevel::Error, "load", rows.error().to_string());
  return rows;
}

// Load `ds`, caching under <temp>/haskds unless configured otherwise.
template <class T>
Result<std::vector<T>> get_dataset(const Dataset<T>& ds, const LoaderConfig& cfg = LoaderConfig{}) {
  HttpFetcher fetcher(fetcher_config(cfg));
  return get_dataset(ds, cfg, fetcher);
}

}
