#include "typed_datasets/error.hpp"

namespace tds {

const char* kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Fetch:       return "FetchError";
    case ErrorKind::Io:          return "IOError";
    case ErrorKind::Parse:       return "ParseError";
    case ErrorKind::FieldDecode: return "FieldDecodeError";
  }
  return "Error";
}

std::string Error::to_string() const {
  std::string s = kind_name(kind);
  s += ": ";
  s += message;
  if (!context.empty()) {
    s += " (";
    s += context;
    s += ")";
  }
  return s;
}

Error fetch_error(std::string message, std::string context) {
  return Error{ErrorKind::Fetch, std::move(message), std::move(context)};
}

Error io_error(std::string message, std::string context) {
  return Error{ErrorKind::Io, std::move(message), std::move(context)};
}

Error parse_error(std::string message, std::string context) {
  return Error{ErrorKind::Parse, std::move(message), std::move(context)};
}

Error field_error(std::string message, std::string context) {
  return Error{ErrorKind::FieldDecode, std::move(message), std::move(context)};
}

}
