#include "typed_datasets/dataset.hpp"
#include "typed_datasets/path_utils.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// True when an entry for `id` exists under `dir`.
static bool is_cached(const fs::path& dir, const std::string& id) {
  auto p = tds::resolve_path(dir, id);
  return p && tds::CacheStore::exists(p.value());
}

// In-memory network: serves fixed bodies and counts requests.
class FakeFetcher : public tds::Fetcher {
public:
  std::map<std::string, std::string> bodies;
  int requests = 0;

  tds::Result<std::string> get(const std::string& url) override {
    ++requests;
    auto it = bodies.find(url);
    if (it == bodies.end()) return tds::fetch_error("HTTP status 404", url);
    return it->second;
  }
};

struct Iris {
  double sepal_length = 0.0;
  std::string species;
};

namespace tds {
template <>
struct RecordDecoder<Iris> {
  static bool decode(const RecordView& rv, Iris& out, std::string& err) {
    return expect_arity(rv, 2, err) && field_at(rv, 0, out.sepal_length, err) &&
           field_at(rv, 1, out.species, err);
  }
};

template <>
struct JsonDecoder<Iris> {
  static bool decode(simdjson::ondemand::value v, Iris& out, std::string& err) {
    simdjson::ondemand::object obj;
    return json_object(v, obj, err) && json_field(obj, "sepal", out.sepal_length, err) &&
           json_field(obj, "species", out.species, err);
  }
};
}

int main() {
  int failures = 0;
  auto fail = [&](const std::string& m) { std::cerr << "[FAIL] " << m << "\n"; ++failures; };

  const fs::path dir = fs::temp_directory_path() / ("tds_dataset_test_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(dir, ec);

  tds::LoaderConfig cfg;
  cfg.cache_dir = dir;

  FakeFetcher net;
  const std::string csv_url = "http://data.example/iris.csv";
  net.bodies[csv_url] = "5.1,setosa\n7.0,versicolor\n";

  // First load fetches and caches; second is a cache hit with identical output.
  {
    auto ds = tds::delimited_dataset<Iris>(tds::url(csv_url));
    auto first = tds::get_dataset(ds, cfg, net);
    if (!first) fail("first load: " + first.error().to_string());
    if (net.requests != 1) fail("first load should fetch once");
    if (!is_cached(dir, csv_url)) fail("cache entry not written");

    auto second = tds::get_dataset(ds, cfg, net);
    if (!second) fail("second load: " + second.error().to_string());
    if (net.requests != 1) fail("second load must not touch the network");
    if (first && second) {
      const auto& a = first.value();
      const auto& b = second.value();
      if (a.size() != 2 || b.size() != 2) fail("record count");
      else if (a[1].species != b[1].species || a[0].sepal_length != b[0].sepal_length) fail("outputs differ");
    }
  }

  // Resolver reports where the bytes came from.
  {
    const std::string u = "http://data.example/resolver.csv";
    net.bodies[u] = "1,2\n";
    tds::CacheStore cache(dir);
    tds::SourceResolver resolver(cache, net);
    const int before = net.requests;

    auto miss = resolver.resolve(tds::url(u));
    if (!miss || miss.value() != "1,2\n" || resolver.last_was_cache_hit()) fail("resolver miss");
    auto hit = resolver.resolve(tds::url(u));
    if (!hit || hit.value() != "1,2\n" || !resolver.last_was_cache_hit()) fail("resolver hit");
    if (net.requests != before + 1) fail("resolver fetched more than once");

    auto gone = resolver.resolve(tds::url("http://data.example/absent.csv"));
    if (gone || resolver.last_was_cache_hit()) fail("resolver failed fetch");
  }

  // The cached bytes are what gets parsed, even if the remote changes.
  {
    net.bodies[csv_url] = "9.9,changed\n";
    auto again = tds::get_dataset(tds::delimited_dataset<Iris>(tds::url(csv_url)), cfg, net);
    if (!again || again.value().size() != 2) fail("cache not authoritative");
  }

  // Preprocessing hooks run on the cached bytes.
  {
    const std::string u = "http://data.example/us.csv";
    net.bodies[u] = "# comment line\n1,.5\n2,.25\n";
    auto ds = tds::delimited_dataset<std::pair<int, double>>(
        tds::url(u), tds::compose(tds::drop_lines_hook(1), tds::fix_american_decimals));
    auto r = tds::get_dataset(ds, cfg, net);
    if (!r) fail("preprocessed load: " + r.error().to_string());
    else if (r.value() != std::vector<std::pair<int, double>>{{1, 0.5}, {2, 0.25}}) fail("preprocessed contents");
  }

  // Hook failures are parse failures, whether returned or thrown.
  {
    const std::string u = "http://data.example/short.csv";
    net.bodies[u] = "1,2\n";
    auto r = tds::get_dataset(tds::delimited_dataset<std::pair<int, int>>(tds::url(u), tds::drop_lines_hook(3)),
                              cfg, net);
    if (r || r.error().kind != tds::ErrorKind::Parse) fail("drop_lines underflow must be a parse error");

    tds::Preprocess throws = [](std::string_view) -> tds::Result<std::string> {
      throw std::runtime_error("boom");
    };
    auto t = tds::get_dataset(tds::delimited_dataset<std::pair<int, int>>(tds::url(u), throws), cfg, net);
    if (t || t.error().kind != tds::ErrorKind::Parse || t.error().context.find("boom") == std::string::npos)
      fail("throwing hook must be a parse error");
  }

  // Headered with a custom separator.
  {
    const std::string u = "http://data.example/semi.csv";
    net.bodies[u] = "x;y\n1;a\n2;b\n";
    auto r = tds::get_dataset(
        tds::headered_dataset<std::vector<std::pair<std::string, std::string>>>(';', tds::url(u)), cfg, net);
    if (!r || r.value().size() != 2 || r.value()[1][1].second != "b" || r.value()[0][0].first != "x")
      fail("headered dataset");
  }

  // JSON sources, over https too: the fetch path does not depend on the scheme.
  {
    const std::string u = "https://data.example/iris.json";
    net.bodies[u] = R"([{"sepal": 5.1, "species": "setosa"}])";
    auto r = tds::get_dataset(tds::json_dataset<Iris>(tds::url(u)), cfg, net);
    if (!r || r.value().size() != 1 || r.value()[0].species != "setosa") fail("json dataset over https");

    const std::string bad = "http://data.example/bad.json";
    net.bodies[bad] = R"([{"sepal": "wide"}])";
    auto b = tds::get_dataset(tds::json_dataset<Iris>(tds::url(bad)), cfg, net);
    if (b || b.error().message != "failed to parse json") fail("json shape mismatch");
    else if (b.error().context.find(bad) == std::string::npos) fail("error should name the source");
  }

#ifdef TDS_WITH_TLS
  if (!tds::HttpFetcher::supports_scheme("https")) fail("TLS build must accept https sources");
#endif
  if (!tds::HttpFetcher::supports_scheme("http")) fail("http must be supported");
  if (tds::HttpFetcher::supports_scheme("ftp")) fail("ftp must be rejected");

  // Fetch failures propagate and leave no cache entry behind.
  {
    const std::string u = "http://data.example/missing.csv";
    auto r = tds::get_dataset(tds::delimited_dataset<Iris>(tds::url(u)), cfg, net);
    if (r || r.error().kind != tds::ErrorKind::Fetch) fail("missing source must be a fetch error");
    if (is_cached(dir, u)) fail("failed fetch must not be cached");
  }

  // Parse failures abort the whole load; raw bytes stay cached.
  {
    const std::string u = "http://data.example/broken.csv";
    net.bodies[u] = "1.0,a\nnope,b\n";
    auto r = tds::get_dataset(tds::delimited_dataset<Iris>(tds::url(u)), cfg, net);
    if (r || r.error().kind != tds::ErrorKind::Parse) fail("bad row must fail the load");
    if (!is_cached(dir, u)) fail("raw bytes should stay cached");
  }

  // Default cache directory lives under the temp dir.
  {
    tds::LoaderConfig defaults;
    auto d = tds::resolve_cache_dir(defaults);
    if (!d || d.value().filename() != "haskds") fail("default cache dir");
  }

  fs::remove_all(dir, ec);
  if (failures) return 1;
  std::cout << "[PASS] dataset cache\n";
  return 0;
}
