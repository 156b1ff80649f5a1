#pragma once
#include "typed_datasets/error.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace tds {

// Network capability: GET a URL, return the body or fail.
class Fetcher {
public:
  virtual ~Fetcher() = default;
  virtual Result<std::string> get(const std::string& url) = 0;
};

struct UrlParts {
  std::string scheme;       // "http" | "https"
  std::string host_port;    // "host" or "host:port"
  std::string path;         // path + query, at least "/"
};

// Splits "scheme://host[:port][/path][?query]". Fragment is dropped.
bool split_url(std::string_view url, UrlParts& out);

// Plain unauthenticated GET via cpp-httplib. No retries; redirects are not
// followed unless configured.
class HttpFetcher : public Fetcher {
public:
  struct Config {
    int  connect_timeout_s = 30;
    int  read_timeout_s    = 30;
    bool follow_redirects  = false;
    bool verify_tls        = true;   // only with TDS_WITH_TLS
    std::string ca_cert_path;        // empty -> system default store
  };

  HttpFetcher();                     // default Config{}
  explicit HttpFetcher(Config cfg);

  Result<std::string> get(const std::string& url) override;

  // Number of network requests issued (successful or not).
  std::uint64_t requests() const noexcept { return requests_; }

  // True for "http", and for "https" when built with TLS support.
  static bool supports_scheme(std::string_view scheme);

private:
  Config cfg_;
  std::uint64_t requests_{0};
};

}
