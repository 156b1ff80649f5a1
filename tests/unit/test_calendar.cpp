#include "typed_datasets/date_parse.hpp"
#include <cstdint>
#include <iostream>

int main() {
  int failures = 0;
  auto expect = [&](double year, std::int64_t want_ms) {
    std::int64_t got = tds::year_to_utc_ms(year);
    if (got != want_ms) {
      std::cerr << "[FAIL] year_to_utc_ms(" << year << ") = " << got << " want " << want_ms << "\n";
      ++failures;
    }
  };

  expect(1970.0, 0);
  expect(2000.0, 946684800000LL);                       // 2000-01-01T00:00:00Z
  expect(2000.5, 946684800000LL + 183LL * 86400000LL);  // leap year: 0.5 * 366 days
  expect(2001.5, 978307200000LL + 182LL * 86400000LL + 43200000LL);  // 182.5 days

  if (!tds::is_leap_year(2000) || tds::is_leap_year(1900) || !tds::is_leap_year(2024)) {
    std::cerr << "[FAIL] is_leap_year\n";
    ++failures;
  }

  if (failures) return 1;
  std::cout << "[PASS] calendar\n";
  return 0;
}
