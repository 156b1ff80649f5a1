#pragma once
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tds {

// JSON value -> T. Specialize for record types with
//   static bool decode(simdjson::ondemand::value v, T& out, std::string& err);
// and read members with json_field().
template <class T, class Enable = void>
struct JsonDecoder;

// Unparsed JSON text of a value (whitespace-trimmed).
struct RawJson {
  std::string text;
};

namespace detail {

inline bool json_fail(std::string& err, std::string_view expected, simdjson::error_code ec) {
  err = "expected ";
  err += expected;
  err += ": ";
  err += simdjson::error_message(ec);
  return false;
}

template <class T> struct is_optional : std::false_type {};
template <class U> struct is_optional<std::optional<U>> : std::true_type {};

inline bool is_json_null(simdjson::ondemand::value& v) {
  simdjson::ondemand::json_type t;
  return !v.type().get(t) && t == simdjson::ondemand::json_type::null;
}

}

template <>
struct JsonDecoder<bool> {
  static bool decode(simdjson::ondemand::value v, bool& out, std::string& err) {
    if (auto ec = v.get_bool().get(out)) return detail::json_fail(err, "bool", ec);
    return true;
  }
};

template <class T>
struct JsonDecoder<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
  static bool decode(simdjson::ondemand::value v, T& out, std::string& err) {
    std::int64_t x = 0;
    if (auto ec = v.get_int64().get(x)) return detail::json_fail(err, "integer", ec);
    if (x < std::numeric_limits<T>::min() || x > std::numeric_limits<T>::max()) {
      err = "integer out of range: " + std::to_string(x);
      return false;
    }
    out = static_cast<T>(x);
    return true;
  }
};

template <class T>
struct JsonDecoder<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                                       !std::is_same_v<T, bool>>> {
  static bool decode(simdjson::ondemand::value v, T& out, std::string& err) {
    std::uint64_t x = 0;
    if (auto ec = v.get_uint64().get(x)) return detail::json_fail(err, "unsigned integer", ec);
    if (x > std::numeric_limits<T>::max()) {
      err = "integer out of range: " + std::to_string(x);
      return false;
    }
    out = static_cast<T>(x);
    return true;
  }
};

template <class T>
struct JsonDecoder<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static bool decode(simdjson::ondemand::value v, T& out, std::string& err) {
    double x = 0.0;
    if (auto ec = v.get_double().get(x)) return detail::json_fail(err, "number", ec);
    out = static_cast<T>(x);
    return true;
  }
};

template <>
struct JsonDecoder<std::string> {
  static bool decode(simdjson::ondemand::value v, std::string& out, std::string& err) {
    std::string_view s;
    if (auto ec = v.get_string().get(s)) return detail::json_fail(err, "string", ec);
    out.assign(s.data(), s.size());
    return true;
  }
};

template <>
struct JsonDecoder<RawJson> {
  static bool decode(simdjson::ondemand::value v, RawJson& out, std::string& err) {
    std::string_view s;
    if (auto ec = v.raw_json().get(s)) return detail::json_fail(err, "value", ec);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\n' || s.back() == '\r' || s.back() == '\t'))
      s.remove_suffix(1);
    out.text.assign(s.data(), s.size());
    return true;
  }
};

template <class U>
struct JsonDecoder<std::optional<U>> {
  static bool decode(simdjson::ondemand::value v, std::optional<U>& out, std::string& err) {
    if (detail::is_json_null(v)) {
      out.reset();
      return true;
    }
    U x{};
    if (!JsonDecoder<U>::decode(v, x, err)) return false;
    out = std::move(x);
    return true;
  }
};

template <class U>
struct JsonDecoder<std::vector<U>> {
  static bool decode(simdjson::ondemand::value v, std::vector<U>& out, std::string& err) {
    simdjson::ondemand::array arr;
    if (auto ec = v.get_array().get(arr)) return detail::json_fail(err, "array", ec);
    out.clear();
    std::size_t i = 0;
    for (auto element : arr) {
      simdjson::ondemand::value ev;
      if (auto ec = element.get(ev)) return detail::json_fail(err, "array element", ec);
      U item{};
      if (!JsonDecoder<U>::decode(ev, item, err)) {
        err = "[" + std::to_string(i) + "] " + err;
        return false;
      }
      out.push_back(std::move(item));
      ++i;
    }
    return true;
  }
};

inline bool json_object(simdjson::ondemand::value v, simdjson::ondemand::object& obj, std::string& err) {
  if (auto ec = v.get_object().get(obj)) return detail::json_fail(err, "object", ec);
  return true;
}

// Member `key` of `obj` into `out`. A missing key is an error unless T is
// std::optional, in which case `out` is reset.
template <class T>
bool json_field(simdjson::ondemand::object& obj, std::string_view key, T& out, std::string& err) {
  simdjson::ondemand::value v;
  auto ec = obj.find_field_unordered(key).get(v);
  if (ec == simdjson::NO_SUCH_FIELD) {
    if constexpr (detail::is_optional<T>::value) {
      out.reset();
      return true;
    } else {
      err = "missing key \"" + std::string(key) + "\"";
      return false;
    }
  }
  if (ec) return detail::json_fail(err, "member \"" + std::string(key) + "\"", ec);
  if (!JsonDecoder<T>::decode(v, out, err)) {
    err = "\"" + std::string(key) + "\": " + err;
    return false;
  }
  return true;
}

}
