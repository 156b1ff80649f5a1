#pragma once
#include <string>
#include <utility>
#include <variant>

namespace tds {

enum class ErrorKind { Fetch, Io, Parse, FieldDecode };

const char* kind_name(ErrorKind k) noexcept;

// A load failure. `context` names the offending identifier, path, or the
// underlying decoder's diagnostic.
struct Error {
  ErrorKind   kind = ErrorKind::Parse;
  std::string message;
  std::string context;

  // "<kind>: <message> (<context>)"
  std::string to_string() const;
};

Error fetch_error(std::string message, std::string context = {});
Error io_error(std::string message, std::string context = {});
Error parse_error(std::string message, std::string context = {});
Error field_error(std::string message, std::string context = {});

// Either a value or an Error. Operations that can fail return this instead
// of throwing, so callers decide whether a failure is fatal.
template <class T>
class Result {
public:
  Result(T value) : v_(std::in_place_index<0>, std::move(value)) {}
  Result(Error err) : v_(std::in_place_index<1>, std::move(err)) {}

  bool ok() const noexcept { return v_.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  // Throws std::bad_variant_access when called on an error.
  T&       value() &       { return std::get<0>(v_); }
  const T& value() const & { return std::get<0>(v_); }
  T&&      value() &&      { return std::get<0>(std::move(v_)); }

  const Error& error() const { return std::get<1>(v_); }

private:
  std::variant<T, Error> v_;
};

}
