#pragma once
#include "typed_datasets/arena.hpp"
#include "typed_datasets/error.hpp"
#include "typed_datasets/record_decode.hpp"
#include "typed_datasets/record_view.hpp"
#include "typed_datasets/token_csv_fsm.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tds {

namespace detail {

// Tokenize + decode every record; the first failure aborts the whole parse.
template <class T, class Decode>
Result<std::vector<T>> decode_delimited(std::string_view bytes, const CsvConfig& cfg, Decode decode) {
  Arena header_arena(4 * 1024);
  Arena row_arena(64 * 1024);
  CsvFsm fsm(cfg, header_arena, row_arena);

  std::vector<T> out;
  std::string err;
  const bool ok = fsm.feed(bytes, [&](const RecordView& rv) {
    const std::string where = "line " + std::to_string(rv.line()) + ": ";
    if (cfg.header && rv.header() && rv.size() != rv.header()->size()) {
      err = where + "header has " + std::to_string(rv.header()->size()) +
            " columns but record has " + std::to_string(rv.size());
      return false;
    }
    T rec{};
    if (!decode(rv, rec, err)) {
      err = where + err;
      return false;
    }
    out.push_back(std::move(rec));
    return true;
  });

  if (!ok) {
    if (!fsm.error().empty()) return parse_error("malformed delimited text", fsm.error());
    return parse_error("cannot decode record", err);
  }
  if (cfg.header && fsm.header().empty()) return parse_error("missing header row");
  return out;
}

}

// Headerless: rows decoded positionally via RecordDecoder<T>.
template <class T>
Result<std::vector<T>> parse_delimited(std::string_view bytes, char delimiter = ',') {
  CsvConfig cfg;
  cfg.delimiter = delimiter;
  cfg.header = false;
  return detail::decode_delimited<T>(bytes, cfg, [](const RecordView& rv, T& out, std::string& err) {
    return RecordDecoder<T>::decode(rv, out, err);
  });
}

// First row names the columns; rows decoded via NamedRecordDecoder<T>.
template <class T>
Result<std::vector<T>> parse_delimited_headered(std::string_view bytes, char delimiter = ',') {
  CsvConfig cfg;
  cfg.delimiter = delimiter;
  cfg.header = true;
  return detail::decode_delimited<T>(bytes, cfg, [](const RecordView& rv, T& out, std::string& err) {
    return NamedRecordDecoder<T>::decode(rv, out, err);
  });
}

}
