// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for calendar conversions and the valuation clocks.
// =============================================================================

#include "optrisk/domain/errors.hpp"
#include "optrisk/time/fixed_time_provider.hpp"
#include "optrisk/time/live_time_provider.hpp"
#include "optrisk/time/time_utils.hpp"

#include <gtest/gtest.h>

TEST(TimeUtilsTest, ParsesIsoDates) {
  EXPECT_EQ(optrisk::parse_iso_date("1970-01-01"), 0);
  EXPECT_EQ(optrisk::parse_iso_date("1970-01-02"), 1);
  EXPECT_EQ(optrisk::parse_iso_date("2025-01-01"), 20089);
  EXPECT_EQ(optrisk::parse_iso_date("2024-02-29"), 19782);
  EXPECT_EQ(optrisk::parse_iso_date("2025-01-01T16:00:00Z"), 20089);
}

TEST(TimeUtilsTest, RejectsMalformedDates) {
  EXPECT_THROW(optrisk::parse_iso_date("2025-1-01"), optrisk::InputError);
  EXPECT_THROW(optrisk::parse_iso_date("2025-02-30"), optrisk::InputError);
  EXPECT_THROW(optrisk::parse_iso_date("2023-02-29"), optrisk::InputError);
  EXPECT_THROW(optrisk::parse_iso_date("2025-13-01"), optrisk::InputError);
  EXPECT_THROW(optrisk::parse_iso_date("tomorrow"), optrisk::InputError);
  EXPECT_THROW(optrisk::parse_iso_date(""), optrisk::InputError);
}

TEST(TimeUtilsTest, FormatInvertsParse) {
  for (const char* d : {"1970-01-01", "1999-12-31", "2024-02-29", "2030-07-15"}) {
    EXPECT_EQ(optrisk::format_iso_date(optrisk::parse_iso_date(d)), d);
  }
}

TEST(TimeUtilsTest, DaysToExpiryUsesCalendarDays) {
  // 2025-01-01T15:30:00Z is still day 20089.
  const std::int64_t valuation_ms = 20089 * optrisk::kMillisPerDay + 55'800'000;
  EXPECT_EQ(optrisk::ms_to_epoch_day(valuation_ms), 20089);
  EXPECT_EQ(optrisk::days_to_expiry(20089 + 30, valuation_ms), 30);
  EXPECT_EQ(optrisk::days_to_expiry(20088, valuation_ms), -1);
  EXPECT_DOUBLE_EQ(optrisk::year_fraction(73), 0.2);
  EXPECT_EQ(optrisk::ms_to_epoch_day(-1), -1);
}

TEST(TimeProviderTest, FixedClockIsPinned) {
  optrisk::FixedTimeProvider clock(1000);
  EXPECT_EQ(clock.now_ms(), 1000);
  clock.set_time_ms(500);
  EXPECT_EQ(clock.now_ms(), 500);
}

TEST(TimeProviderTest, LiveClockIsAfter2020) {
  optrisk::LiveTimeProvider clock;
  EXPECT_GT(clock.now_ms(), 1577836800000);
}
