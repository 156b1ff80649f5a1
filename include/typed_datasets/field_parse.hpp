#pragma once
#include "typed_datasets/error.hpp"
#include "typed_datasets/text_transforms.hpp"
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tds {

// Accepted spellings for bool fields.
struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true", "1", "yes"};
  std::vector<std::string> false_tokens = {"false", "0", "no"};
  bool case_sensitive = false;
};

// Numeric parse (fast_float). The whole input must be consumed.
std::optional<double> parse_double(std::string_view s);
std::optional<float>  parse_float(std::string_view s);

std::optional<bool> parse_bool(std::string_view s, const BoolPolicy& policy);
std::optional<bool> parse_bool(std::string_view s);

// Empty, "NA", "N/A", "null", "NULL".
bool is_null_token(std::string_view s);

std::string_view trim_ascii(std::string_view s);

// Canonical textual parse of a scalar. Specialize for your own types
// (enums, tagged strings) with
//   static std::optional<T> parse(std::string_view s);
template <class T, class Enable = void>
struct FieldParser;

template <>
struct FieldParser<std::string> {
  static std::optional<std::string> parse(std::string_view s) { return std::string(s); }
};

template <class T>
struct FieldParser<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
  static std::optional<T> parse(std::string_view s) {
    T v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return v;
  }
};

template <>
struct FieldParser<double> {
  static std::optional<double> parse(std::string_view s) { return parse_double(s); }
};

template <>
struct FieldParser<float> {
  static std::optional<float> parse(std::string_view s) { return parse_float(s); }
};

template <>
struct FieldParser<bool> {
  static std::optional<bool> parse(std::string_view s) { return parse_bool(s); }
};

// Null tokens decode to an empty optional; anything else must parse as U.
template <class U>
struct FieldParser<std::optional<U>> {
  static std::optional<std::optional<U>> parse(std::string_view s) {
    if (is_null_token(s)) return std::optional<std::optional<U>>(std::in_place);
    auto v = FieldParser<U>::parse(s);
    if (!v) return std::nullopt;
    return std::optional<std::optional<U>>(std::in_place, std::move(*v));
  }
};

// Trim, then FieldParser<T>. FieldDecode error "unknown" if it does not parse.
template <class T>
Result<T> read_field(std::string_view s) {
  auto v = FieldParser<T>::parse(trim_ascii(s));
  if (!v) return field_error("unknown", std::string(s));
  return std::move(*v);
}

// dashes_to_camel_case, then read_field: "Iris-setosa" reads as "IrisSetosa".
template <class T>
Result<T> read_field_after_dash_to_camel(std::string_view s) {
  const std::string camel = dashes_to_camel_case(s);
  return read_field<T>(camel);
}

}
