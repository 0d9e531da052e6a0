#pragma once

#include <cstdint>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// Calendar utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting between ISO dates, epoch days and epoch
//         milliseconds, plus the year-fraction convention used by pricing.
//
// @details
// Option expiries arrive as "YYYY-MM-DD" (optionally followed by a "T..."
// time part, which is ignored). The engine counts whole calendar days
// between the valuation day and the expiry day, and converts to years with
// an ACT/365 convention: tau = days / 365.
//
// All conversions are UTC; no time-zone database is involved.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerDay = 86'400'000;
constexpr double kDaysPerYear = 365.0;

// -------------------------------------------------------------------------
// days_from_civil
// -------------------------------------------------------------------------
// @brief  Number of days from 1970-01-01 to the given proleptic Gregorian
//         date (negative before the epoch).
// -------------------------------------------------------------------------
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

// -------------------------------------------------------------------------
// parse_iso_date
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD[T...]" into epoch days.
//
// @throws InputError if the text is not a valid calendar date.
// -------------------------------------------------------------------------
std::int64_t parse_iso_date(const std::string& text);

// -------------------------------------------------------------------------
// format_iso_date
// -------------------------------------------------------------------------
// @brief  Inverse of parse_iso_date: epoch days → "YYYY-MM-DD".
// -------------------------------------------------------------------------
std::string format_iso_date(std::int64_t epoch_day);

// Floor division so instants before the epoch land on the right day.
inline std::int64_t ms_to_epoch_day(std::int64_t ms) {
  std::int64_t day = ms / kMillisPerDay;
  if (ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

inline std::int64_t epoch_day_to_ms(std::int64_t epoch_day) {
  return epoch_day * kMillisPerDay;
}

// Calendar days from the valuation instant's day to the expiry day.
// Negative once the expiry has passed.
inline std::int64_t days_to_expiry(std::int64_t expiry_day,
                                   std::int64_t valuation_ms) {
  return expiry_day - ms_to_epoch_day(valuation_ms);
}

inline double year_fraction(std::int64_t days) {
  return static_cast<double>(days) / kDaysPerYear;
}

}  // namespace optrisk
