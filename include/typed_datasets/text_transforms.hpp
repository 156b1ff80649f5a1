#pragma once
#include "typed_datasets/error.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace tds {

// Byte transform applied to fetched content before structural parsing.
// A plain `std::string(std::string_view)` callable converts implicitly.
using Preprocess = std::function<Result<std::string>(std::string_view)>;

Preprocess identity_preprocess();

// first, then second.
Preprocess compose(Preprocess first, Preprocess second);

// "-x" -> "X"; everything else unchanged. "foo-bar-baz" -> "fooBarBaz".
std::string dashes_to_camel_case(std::string_view s);

// Remove the first `n` newline-terminated lines. Parse error if the input
// holds fewer; an unterminated final line does not count.
Result<std::string> drop_lines(std::size_t n, std::string_view bytes);
Preprocess drop_lines_hook(std::size_t n);

// Every ",." becomes ",0." so ".5"-style decimals parse.
std::string fix_american_decimals(std::string_view bytes);

// Per line: leading spaces dropped, each run of spaces becomes one comma.
std::string fixed_width_to_csv(std::string_view bytes);

}
