#include "typed_datasets/text_transforms.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

static int failures = 0;

static void expect_eq(const std::string& got, const std::string& want, const char* what) {
  if (got == want) return;
  std::cerr << "[FAIL] " << what << ": got \"" << got << "\" want \"" << want << "\"\n";
  ++failures;
}

int main() {
  expect_eq(tds::fix_american_decimals("1,.5,2,.3"), "1,0.5,2,0.3", "fix_american_decimals");
  expect_eq(tds::fix_american_decimals(".5,1.5"), ".5,1.5", "fix_american_decimals leading");
  expect_eq(tds::fix_american_decimals(""), "", "fix_american_decimals empty");

  expect_eq(tds::fixed_width_to_csv("a   b  c\n1   2  3\n"), "a,b,c\n1,2,3\n", "fixed_width_to_csv");
  expect_eq(tds::fixed_width_to_csv("   x y\n  1    2"), "x,y\n1,2", "fixed_width_to_csv leading spaces");
  expect_eq(tds::fixed_width_to_csv("a  \nb"), "a,\nb", "fixed_width_to_csv trailing run");

  expect_eq(tds::dashes_to_camel_case("foo-bar-baz"), "fooBarBaz", "dashes_to_camel_case");
  expect_eq(tds::dashes_to_camel_case("Iris-setosa"), "IrisSetosa", "dashes_to_camel_case iris");
  expect_eq(tds::dashes_to_camel_case("plain"), "plain", "dashes_to_camel_case identity");
  expect_eq(tds::dashes_to_camel_case("tail-"), "tail-", "dashes_to_camel_case trailing dash");

  // drop_lines: exact, fewer, unterminated last line, zero
  {
    auto r = tds::drop_lines(2, "h1\nh2\n");
    if (!r || !r.value().empty()) { std::cerr << "[FAIL] drop_lines exact\n"; ++failures; }
  }
  {
    auto r = tds::drop_lines(1, "header\n1,2\n3,4\n");
    if (!r) { std::cerr << "[FAIL] drop_lines 1: " << r.error().to_string() << "\n"; ++failures; }
    else expect_eq(r.value(), "1,2\n3,4\n", "drop_lines 1");
  }
  {
    auto r = tds::drop_lines(2, "only one\n");
    if (r || r.error().kind != tds::ErrorKind::Parse) {
      std::cerr << "[FAIL] drop_lines past end must fail with a parse error\n"; ++failures;
    }
  }
  {
    auto r = tds::drop_lines(2, "a\nb");
    if (r || r.error().kind != tds::ErrorKind::Parse) {
      std::cerr << "[FAIL] unterminated last line must not count as a dropped line\n"; ++failures;
    }
  }
  {
    auto r = tds::drop_lines(1, "no newline");
    if (r || r.error().kind != tds::ErrorKind::Parse) {
      std::cerr << "[FAIL] drop_lines without any newline must fail\n"; ++failures;
    }
  }
  {
    auto r = tds::drop_lines(1, "skip\nkeep");
    if (!r) { std::cerr << "[FAIL] drop_lines keeps unterminated tail\n"; ++failures; }
    else expect_eq(r.value(), "keep", "drop_lines tail");
  }
  {
    auto r = tds::drop_lines(0, "x\n");
    if (!r) { std::cerr << "[FAIL] drop_lines 0\n"; ++failures; }
    else expect_eq(r.value(), "x\n", "drop_lines 0");
  }
  {
    auto r = tds::drop_lines(1, "");
    if (r) { std::cerr << "[FAIL] drop_lines on empty input must fail\n"; ++failures; }
  }

  // compose runs left to right and stops at the first failure
  {
    auto pre = tds::compose(tds::drop_lines_hook(1), tds::fix_american_decimals);
    auto r = pre("x y\n1,.5\n");
    if (!r) { std::cerr << "[FAIL] compose: " << r.error().to_string() << "\n"; ++failures; }
    else expect_eq(r.value(), "1,0.5\n", "compose");

    auto bad = tds::compose(tds::drop_lines_hook(5), [](std::string_view) -> std::string {
      throw std::logic_error("second hook must not run");
    });
    auto rb = bad("1\n");
    if (rb) { std::cerr << "[FAIL] compose must stop at the first error\n"; ++failures; }
  }

  if (failures) return 1;
  std::cout << "[PASS] text transforms\n";
  return 0;
}
