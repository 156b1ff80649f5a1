#include "typed_datasets/field_parse.hpp"
#include <cctype>
#include <fast_float/fast_float.h>

namespace tds {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

template <class F>
static std::optional<F> parse_floating(std::string_view s) {
  if (s.empty()) return std::nullopt;
  F out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> parse_double(std::string_view s) { return parse_floating<double>(s); }
std::optional<float>  parse_float(std::string_view s)  { return parse_floating<float>(s); }

std::optional<bool> parse_bool(std::string_view s, const BoolPolicy& policy) {
  for (const auto& t : policy.true_tokens) {
    if (policy.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : policy.false_tokens) {
    if (policy.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(std::string_view s) {
  static const BoolPolicy defaults{};
  return parse_bool(s, defaults);
}

bool is_null_token(std::string_view s) {
  static constexpr std::string_view nulls[] = {"", "NA", "N/A", "null", "NULL"};
  for (auto n : nulls) if (s == n) return true;
  return false;
}

std::string_view trim_ascii(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

}
