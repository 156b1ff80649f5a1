#pragma once
#include <cstdint>

namespace tds {

// Fractional calendar year (e.g. 1987.5) to UTC epoch milliseconds, rounded
// to the second. Leap years count 366 days; leap seconds are ignored.
std::int64_t year_to_utc_ms(double fractional_year);

bool is_leap_year(int year) noexcept;

}
