#include "optrisk/time/time_utils.hpp"
#include "optrisk/domain/errors.hpp"

#include <cctype>
#include <cstdio>

namespace optrisk {

namespace {

bool is_leap(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

bool all_digits(const std::string& s, std::size_t pos, std::size_t len) {
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// parse_iso_date: strict "YYYY-MM-DD", anything after a 'T' is ignored
// -----------------------------------------------------------------------------
std::int64_t parse_iso_date(const std::string& text) {
  const std::string date = text.substr(0, text.find('T'));

  if (date.size() != 10 || date[4] != '-' || date[7] != '-' ||
      !all_digits(date, 0, 4) || !all_digits(date, 5, 2) ||
      !all_digits(date, 8, 2)) {
    throw InputError("expiry must be an ISO date YYYY-MM-DD, got '" + text +
                     "'");
  }

  const std::int64_t y = std::stoll(date.substr(0, 4));
  const unsigned m = static_cast<unsigned>(std::stoul(date.substr(5, 2)));
  const unsigned d = static_cast<unsigned>(std::stoul(date.substr(8, 2)));

  if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
    throw InputError("invalid calendar date '" + text + "'");
  }

  return days_from_civil(y, m, d);
}

// -----------------------------------------------------------------------------
// format_iso_date: civil_from_days
// -----------------------------------------------------------------------------
std::string format_iso_date(std::int64_t epoch_day) {
  const std::int64_t z = epoch_day + 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 +
                         (m <= 2 ? 1 : 0);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                static_cast<long long>(y), m, d);
  return buf;
}

}  // namespace optrisk
