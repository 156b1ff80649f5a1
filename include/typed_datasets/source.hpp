#pragma once
#include <string>
#include <utility>
#include <variant>

namespace tds {

struct Url {
  std::string value;
};

// Where a dataset's raw bytes come from. Only remote URLs for now; new
// alternatives must also extend source_identifier().
using Source = std::variant<Url>;

inline Source url(std::string u) { return Url{std::move(u)}; }

// Stable string naming the source; used as the cache key.
inline const std::string& source_identifier(const Source& s) {
  return std::get<Url>(s).value;
}

}
