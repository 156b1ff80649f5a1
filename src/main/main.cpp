#include "typed_datasets/dataset.hpp"
#include "typed_datasets/json_decode.hpp"
#include "typed_datasets/loader_config.hpp"
#include "typed_datasets/log.hpp"
#include "typed_datasets/path_utils.hpp"
#include "typed_datasets/text_transforms.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

enum class Format { Auto, Csv, CsvHeader, Json };

struct Cli {
  std::string url;
  Format format = Format::Auto;
  char sep = ',';
  bool fix_decimals = false;
  bool fixed_width = false;
  std::size_t drop_lines = 0;
  bool print = false;
  bool cache_path_only = false;
  tds::LoaderConfig cfg = tds::loader_config_from_env();
};

constexpr int kExitOk = 0, kExitUsage = 1, kExitFetch = 2, kExitParse = 3;

void usage(std::ostream& o) {
  o << "Usage: typed-datasets --url=URL [--format=csv|csv-header|json] [--sep=C]\n"
       "                      [--fix-decimals] [--fixed-width] [--drop-lines=N]\n"
       "                      [--cache-dir=DIR] [--timeout=SEC] [--log-level=LEVEL]\n"
       "                      [--print] [--cache-path]\n";
}

bool to_int(const std::string& s, long long& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

// False on a malformed argument (already reported).
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    std::string v;
    auto eat = [&](const char* pfx) {
      if (a.rfind(pfx, 0) == 0) { v = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--url=")) { c.url = v; continue; }
    if (a == "--url" && i + 1 < argc) { c.url = argv[++i]; continue; }
    if (eat("--format=")) {
      if (v == "csv") c.format = Format::Csv;
      else if (v == "csv-header") c.format = Format::CsvHeader;
      else if (v == "json") c.format = Format::Json;
      else { std::cerr << "[cli] unknown format: " << v << "\n"; return false; }
      continue;
    }
    if (eat("--sep=")) {
      if (v == "\\t" || v == "tab") c.sep = '\t';
      else if (v.size() == 1) c.sep = v[0];
      else { std::cerr << "[cli] separator must be one character: " << v << "\n"; return false; }
      continue;
    }
    if (a == "--fix-decimals") { c.fix_decimals = true; continue; }
    if (a == "--fixed-width")  { c.fixed_width = true; continue; }
    if (eat("--drop-lines=")) {
      long long n = 0;
      if (!to_int(v, n) || n < 0) { std::cerr << "[cli] bad --drop-lines: " << v << "\n"; return false; }
      c.drop_lines = static_cast<std::size_t>(n);
      continue;
    }
    if (eat("--cache-dir=")) { c.cfg.cache_dir = v; continue; }
    if (eat("--timeout=")) {
      long long n = 0;
      if (!to_int(v, n) || n <= 0) { std::cerr << "[cli] bad --timeout: " << v << "\n"; return false; }
      c.cfg.connect_timeout_s = c.cfg.read_timeout_s = static_cast<int>(n);
      continue;
    }
    if (eat("--log-level=")) {
      auto lvl = tds::parse_log_level(v);
      if (!lvl) { std::cerr << "[cli] bad --log-level: " << v << "\n"; return false; }
      c.cfg.log_level = *lvl;
      continue;
    }
    if (a == "--print")      { c.print = true; continue; }
    if (a == "--cache-path") { c.cache_path_only = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(kExitOk); }
    std::cerr << "[cli] unknown argument: " << a << "\n";
    return false;
  }
  return true;
}

tds::Preprocess build_preprocess(const Cli& c) {
  tds::Preprocess pre = tds::identity_preprocess();
  if (c.drop_lines > 0) pre = tds::compose(pre, tds::drop_lines_hook(c.drop_lines));
  if (c.fixed_width)    pre = tds::compose(pre, tds::fixed_width_to_csv);
  if (c.fix_decimals)   pre = tds::compose(pre, tds::fix_american_decimals);
  return pre;
}

int exit_code_for(const tds::Error& e) {
  return (e.kind == tds::ErrorKind::Fetch || e.kind == tds::ErrorKind::Io) ? kExitFetch : kExitParse;
}

template <class T, class PrintFn>
int run(const tds::Dataset<T>& ds, const Cli& c, PrintFn print_row) {
  auto rows = tds::get_dataset(ds, c.cfg);
  if (!rows) {
    std::cerr << "[load] " << rows.error().to_string() << "\n";
    return exit_code_for(rows.error());
  }
  if (c.print) for (const auto& r : rows.value()) print_row(r);
  std::cout << "[load] ok: " << c.url << " -> " << rows.value().size() << " records\n";
  return kExitOk;
}

void print_fields(const std::vector<std::string>& row) {
  for (std::size_t i = 0; i < row.size(); ++i) std::cout << (i ? "\t" : "") << row[i];
  std::cout << "\n";
}

void print_named(const std::vector<std::pair<std::string, std::string>>& row) {
  for (std::size_t i = 0; i < row.size(); ++i)
    std::cout << (i ? "\t" : "") << row[i].first << "=" << row[i].second;
  std::cout << "\n";
}

void print_json(const tds::RawJson& v) { std::cout << v.text << "\n"; }

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return kExitUsage; }
  if (cli.url.empty()) { usage(std::cerr); return kExitUsage; }
  tds::set_log_level(cli.cfg.log_level);

  if (cli.cache_path_only) {
    auto dir = tds::resolve_cache_dir(cli.cfg);
    if (!dir) { std::cerr << "[cache] " << dir.error().to_string() << "\n"; return kExitFetch; }
    auto path = tds::resolve_path(dir.value(), cli.url);
    if (!path) { std::cerr << "[cache] " << path.error().to_string() << "\n"; return kExitFetch; }
    std::cout << path.value().string() << "\n";
    return kExitOk;
  }

  Format fmt = cli.format;
  if (fmt == Format::Auto) {
    fmt = (tds::detect_format(cli.url) == tds::FileFormat::JSON) ? Format::Json : Format::Csv;
  }

  const tds::Preprocess pre = build_preprocess(cli);
  const tds::Source src = tds::url(cli.url);

  switch (fmt) {
    case Format::Json:
      return run(tds::json_dataset<tds::RawJson>(src, pre), cli, print_json);
    case Format::CsvHeader:
      return run(tds::headered_dataset<std::vector<std::pair<std::string, std::string>>>(cli.sep, src, pre),
                 cli, print_named);
    case Format::Csv:
    case Format::Auto:
      break;
  }
  return run(tds::DelimitedDataset<std::vector<std::string>>(src, cli.sep, pre), cli, print_fields);
}
