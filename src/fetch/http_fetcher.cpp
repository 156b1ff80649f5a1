#include "typed_datasets/http_fetcher.hpp"
#include "typed_datasets/log.hpp"
#include <httplib.h>
#include <cctype>

namespace tds {

bool split_url(std::string_view url, UrlParts& out) {
  auto sep = url.find("://");
  if (sep == std::string_view::npos || sep == 0) return false;
  out.scheme.assign(url.substr(0, sep));
  for (auto& c : out.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  std::string_view rest = url.substr(sep + 3);
  auto frag = rest.find('#');
  if (frag != std::string_view::npos) rest = rest.substr(0, frag);

  auto slash = rest.find_first_of("/?");
  std::string_view host = rest.substr(0, slash);
  if (host.empty()) return false;
  out.host_port.assign(host);

  if (slash == std::string_view::npos) {
    out.path = "/";
  } else {
    out.path.assign(rest.substr(slash));
    if (out.path.front() == '?') out.path.insert(out.path.begin(), '/');
  }
  return true;
}

bool HttpFetcher::supports_scheme(std::string_view scheme) {
  if (scheme == "http") return true;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
  if (scheme == "https") return true;
#endif
  return false;
}

HttpFetcher::HttpFetcher() : HttpFetcher(Config{}) {}

HttpFetcher::HttpFetcher(Config cfg) : cfg_(std::move(cfg)) {}

Result<std::string> HttpFetcher::get(const std::string& url) {
  UrlParts parts;
  if (!split_url(url, parts)) return fetch_error("malformed URL", url);
  if (!supports_scheme(parts.scheme))
    return fetch_error("unsupported URL scheme '" + parts.scheme + "'", url);

  httplib::Client cli(parts.scheme + "://" + parts.host_port);
  if (!cli.is_valid()) return fetch_error("cannot create HTTP client", url);
  cli.set_connection_timeout(cfg_.connect_timeout_s, 0);
  cli.set_read_timeout(cfg_.read_timeout_s, 0);
  cli.set_follow_location(cfg_.follow_redirects);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
  cli.enable_server_certificate_verification(cfg_.verify_tls);
  if (!cfg_.ca_cert_path.empty()) cli.set_ca_cert_path(cfg_.ca_cert_path.c_str());
#endif

  log_line(LogLevel::Info, "fetch", "GET " + url);
  ++requests_;
  auto res = cli.Get(parts.path);
  if (!res) return fetch_error(httplib::to_string(res.error()), url);
  if (res->status < 200 || res->status >= 300)
    return fetch_error("HTTP status " + std::to_string(res->status), url);

  log_line(LogLevel::Debug, "fetch", "received " + std::to_string(res->body.size()) + " bytes");
  return std::move(res->body);
}

}
