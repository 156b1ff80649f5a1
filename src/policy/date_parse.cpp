#include "typed_datasets/date_parse.hpp"
#include <chrono>
#include <cmath>
#include <ctime>

namespace tds {

bool is_leap_year(int y) noexcept {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

std::int64_t year_to_utc_ms(double fractional_year) {
  const double whole = std::trunc(fractional_year);
  const int year = static_cast<int>(whole);
  const double year_frac = fractional_year - whole;

  const double days = year_frac * (is_leap_year(year) ? 366.0 : 365.0);
  const double day_whole = std::trunc(days);
  const std::int64_t day_secs = std::llround((days - day_whole) * 86400.0);

  std::tm tm{}; tm.tm_year = year - 1900; tm.tm_mon = 0; tm.tm_mday = 1;

  // timegm is nonstandard; Windows spells it _mkgmtime.
#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif

  using namespace std::chrono;
  const std::int64_t jan1_ms = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return jan1_ms + (static_cast<std::int64_t>(day_whole) * 86400 + day_secs) * 1000;
}

}
