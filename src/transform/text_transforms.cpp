#include "typed_datasets/text_transforms.hpp"
#include <cctype>
#include <utility>

namespace tds {

Preprocess identity_preprocess() {
  return [](std::string_view b) -> Result<std::string> { return std::string(b); };
}

Preprocess compose(Preprocess first, Preprocess second) {
  return [first = std::move(first), second = std::move(second)](std::string_view b)
      -> Result<std::string> {
    auto mid = first(b);
    if (!mid) return mid;
    return second(mid.value());
  };
}

std::string dashes_to_camel_case(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '-' && i + 1 < s.size()) {
      out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(s[i + 1]))));
      ++i;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

Result<std::string> drop_lines(std::size_t n, std::string_view bytes) {
  std::size_t pos = 0;
  for (std::size_t dropped = 0; dropped < n; ++dropped) {
    auto nl = bytes.find('\n', pos);
    if (nl == std::string_view::npos) {
      return parse_error("cannot drop " + std::to_string(n) + " lines",
                         "input has only " + std::to_string(dropped) + " terminated lines");
    }
    pos = nl + 1;
  }
  return std::string(bytes.substr(pos));
}

Preprocess drop_lines_hook(std::size_t n) {
  return [n](std::string_view b) { return drop_lines(n, b); };
}

std::string fix_american_decimals(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() + bytes.size() / 16);
  std::size_t start = 0;
  while (true) {
    auto hit = bytes.find(",.", start);
    if (hit == std::string_view::npos) break;
    out.append(bytes.substr(start, hit - start));
    out.append(",0.");
    start = hit + 2;
  }
  out.append(bytes.substr(start));
  return out;
}

std::string fixed_width_to_csv(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  bool line_start = true;   // still inside leading spaces of a line
  bool in_gap = false;      // inside a run of spaces already emitted as ','
  for (char c : bytes) {
    if (c == '\n') {
      out.push_back('\n');
      line_start = true;
      in_gap = false;
    } else if (c == ' ') {
      if (line_start || in_gap) continue;
      out.push_back(',');
      in_gap = true;
    } else {
      out.push_back(c);
      line_start = false;
      in_gap = false;
    }
  }
  return out;
}

}
