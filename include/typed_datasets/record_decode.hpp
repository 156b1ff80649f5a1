#pragma once
#include "typed_datasets/field_parse.hpp"
#include "typed_datasets/record_view.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace tds {

// Headerless rows, by position. Specialize with
//   static bool decode(const RecordView& rv, T& out, std::string& err);
template <class T, class Enable = void>
struct RecordDecoder;

// Headered rows, by column name. Same signature as RecordDecoder.
template <class T, class Enable = void>
struct NamedRecordDecoder;

inline bool expect_arity(const RecordView& rv, std::size_t n, std::string& err) {
  if (rv.size() == n) return true;
  err = "expected " + std::to_string(n) + " fields, got " + std::to_string(rv.size());
  return false;
}

// Field `i` through `read` (a callable string_view -> Result<T>).
template <class T, class Reader>
bool field_at(const RecordView& rv, std::size_t i, T& out, std::string& err, Reader&& read) {
  if (i >= rv.size()) {
    err = "missing field " + std::to_string(i);
    return false;
  }
  Result<T> r = read(rv.at(i));
  if (!r) {
    err = "field " + std::to_string(i) + ": " + r.error().message + " '" + r.error().context + "'";
    return false;
  }
  out = std::move(r).value();
  return true;
}

template <class T>
bool field_at(const RecordView& rv, std::size_t i, T& out, std::string& err) {
  return field_at(rv, i, out, err, [](std::string_view s) { return read_field<T>(s); });
}

template <class T, class Reader>
bool field_named(const RecordView& rv, std::string_view name, T& out, std::string& err, Reader&& read) {
  auto s = rv.by_name(name);
  if (!s) {
    err = "no field named \"" + std::string(name) + "\"";
    return false;
  }
  Result<T> r = read(*s);
  if (!r) {
    err = "field \"" + std::string(name) + "\": " + r.error().message + " '" + r.error().context + "'";
    return false;
  }
  out = std::move(r).value();
  return true;
}

template <class T>
bool field_named(const RecordView& rv, std::string_view name, T& out, std::string& err) {
  return field_named(rv, name, out, err, [](std::string_view s) { return read_field<T>(s); });
}

template <class A, class B>
struct RecordDecoder<std::pair<A, B>> {
  static bool decode(const RecordView& rv, std::pair<A, B>& out, std::string& err) {
    return expect_arity(rv, 2, err) &&
           field_at(rv, 0, out.first, err) &&
           field_at(rv, 1, out.second, err);
  }
};

template <class... Ts>
struct RecordDecoder<std::tuple<Ts...>> {
  static bool decode(const RecordView& rv, std::tuple<Ts...>& out, std::string& err) {
    return expect_arity(rv, sizeof...(Ts), err) &&
           decode_each(rv, out, err, std::index_sequence_for<Ts...>{});
  }

private:
  template <std::size_t... I>
  static bool decode_each(const RecordView& rv, std::tuple<Ts...>& out, std::string& err,
                          std::index_sequence<I...>) {
    return (field_at(rv, I, std::get<I>(out), err) && ...);
  }
};

// Any width, raw text.
template <>
struct RecordDecoder<std::vector<std::string>> {
  static bool decode(const RecordView& rv, std::vector<std::string>& out, std::string&) {
    out.clear();
    out.reserve(rv.size());
    for (std::size_t i = 0; i < rv.size(); ++i) out.emplace_back(rv.at(i));
    return true;
  }
};

// (column, value) pairs in header order.
template <>
struct NamedRecordDecoder<std::vector<std::pair<std::string, std::string>>> {
  static bool decode(const RecordView& rv, std::vector<std::pair<std::string, std::string>>& out,
                     std::string&) {
    out.clear();
    out.reserve(rv.size());
    for (std::size_t i = 0; i < rv.size(); ++i)
      out.emplace_back(std::string(rv.colname(i)), std::string(rv.at(i)));
    return true;
  }
};

}
