#pragma once
#include "typed_datasets/error.hpp"
#include "typed_datasets/json_decode.hpp"
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace tds {

// Whole payload as one JSON array of T. Any syntax error, shape mismatch or
// trailing content fails with "failed to parse json"; the simdjson or
// decoder diagnostic goes in the error context. The payload is validated
// with the DOM parser first: on-demand skips members a decoder never reads
// without checking them.
template <class T>
Result<std::vector<T>> parse_json(std::string_view bytes) {
  static constexpr const char* kFailed = "failed to parse json";
  try {
    simdjson::padded_string padded(bytes);
    {
      simdjson::dom::parser validator;
      simdjson::dom::element whole;
      if (auto ec = validator.parse(padded).get(whole)) return parse_error(kFailed, simdjson::error_message(ec));
    }

    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc;
    if (auto ec = parser.iterate(padded).get(doc)) return parse_error(kFailed, simdjson::error_message(ec));

    simdjson::ondemand::value root;
    if (auto ec = doc.get_value().get(root)) return parse_error(kFailed, simdjson::error_message(ec));

    std::vector<T> out;
    std::string err;
    if (!JsonDecoder<std::vector<T>>::decode(root, out, err)) return parse_error(kFailed, err);
    if (!doc.at_end()) return parse_error(kFailed, "trailing content after document");
    return out;
  } catch (const std::exception& e) {
    return parse_error(kFailed, e.what());
  }
}

}
