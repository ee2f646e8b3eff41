// =============================================================================
// time_window_test.cpp
// =============================================================================
// Unit tests for the time-window evaluator and time-zone helpers.
//
// Validates:
//   - contains() flips exactly at local start and end
//   - Boundaries follow DST transitions (Europe/London, America/New_York)
//   - makeTimeWindow() rejects inverted and out-of-range windows
//   - parseTimeOfDay() accepts HH:MM, HH:MM:SS and 24:00, rejects garbage
//   - accountDay() honours a non-midnight rollover time
//
// Design: Instants are built from UTC civil times with absl so every
// expected value can be checked by hand against the zone's offset.
// =============================================================================

#include "tradegate/config/config_error.hpp"
#include "tradegate/time/time_utils.hpp"
#include "tradegate/time/time_window.hpp"
#include "tradegate/time/time_zone.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

// Helper: UTC wall-clock → Timestamp.
static tradegate::Timestamp utc(int y, int mo, int d, int h, int mi,
                                int s = 0) {
  return tradegate::ms_to_timestamp(absl::ToUnixMillis(absl::FromCivil(
      absl::CivilSecond(y, mo, d, h, mi, s), absl::UTCTimeZone())));
}

static tradegate::domain::TimeWindow londonDay() {
  return tradegate::makeTimeWindow("London", "Europe/London", 8h, 16h);
}

// -----------------------------------------------------------------------------
// 1. Winter (GMT = UTC): 08:00 local is 08:00 UTC.
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, LondonWinterBoundaries) {
  const auto window = londonDay();

  EXPECT_FALSE(tradegate::contains(utc(2024, 1, 15, 7, 59, 59), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 1, 15, 8, 0, 0), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 1, 15, 15, 59, 59), window));
  EXPECT_FALSE(tradegate::contains(utc(2024, 1, 15, 16, 0, 0), window));
}

// -----------------------------------------------------------------------------
// 2. Spring-forward day (2024-03-31, BST from 01:00 UTC): 08:00 local is
//    07:00 UTC and 16:00 local is 15:00 UTC.
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, LondonSpringForwardDay) {
  const auto window = londonDay();

  EXPECT_FALSE(tradegate::contains(utc(2024, 3, 31, 6, 59, 59), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 3, 31, 7, 0, 0), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 3, 31, 14, 59, 59), window));
  EXPECT_FALSE(tradegate::contains(utc(2024, 3, 31, 15, 0, 0), window));

  // The day before still runs on GMT.
  EXPECT_FALSE(tradegate::contains(utc(2024, 3, 30, 7, 0, 0), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 3, 30, 8, 0, 0), window));
}

// -----------------------------------------------------------------------------
// 3. Fall-back day (2024-10-27, GMT from 01:00 UTC).
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, LondonFallBackDay) {
  const auto window = londonDay();

  EXPECT_FALSE(tradegate::contains(utc(2024, 10, 27, 7, 59, 59), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 10, 27, 8, 0, 0), window));
  EXPECT_FALSE(tradegate::contains(utc(2024, 10, 27, 16, 0, 0), window));

  // Saturday before: still BST.
  EXPECT_TRUE(tradegate::contains(utc(2024, 10, 26, 7, 0, 0), window));
}

// -----------------------------------------------------------------------------
// 4. New York spring-forward (2024-03-10): 08:00 EDT is 12:00 UTC; the day
//    before, 08:00 EST is 13:00 UTC.
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, NewYorkSpringForwardDay) {
  const auto window =
      tradegate::makeTimeWindow("New York", "America/New_York", 8h, 17h);

  EXPECT_FALSE(tradegate::contains(utc(2024, 3, 10, 11, 59, 59), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 3, 10, 12, 0, 0), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 3, 10, 20, 59, 59), window));
  EXPECT_FALSE(tradegate::contains(utc(2024, 3, 10, 21, 0, 0), window));

  EXPECT_FALSE(tradegate::contains(utc(2024, 3, 9, 12, 0, 0), window));
  EXPECT_TRUE(tradegate::contains(utc(2024, 3, 9, 13, 0, 0), window));
}

// -----------------------------------------------------------------------------
// 5. A window ending at 24:00 covers the last second of the day.
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, WindowEndingAtMidnight) {
  const auto window = tradegate::makeTimeWindow(
      "Late", "UTC", 20h, tradegate::parseTimeOfDay("24:00"));

  EXPECT_TRUE(tradegate::contains(utc(2024, 5, 1, 23, 59, 59), window));
  EXPECT_FALSE(tradegate::contains(utc(2024, 5, 2, 0, 0, 0), window));
}

// -----------------------------------------------------------------------------
// 6. Validation: inverted, empty, and overnight windows are rejected.
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, RejectsInvalidWindows) {
  EXPECT_THROW(tradegate::makeTimeWindow("Inverted", "UTC", 16h, 8h),
               tradegate::ConfigError);
  EXPECT_THROW(tradegate::makeTimeWindow("Empty", "UTC", 8h, 8h),
               tradegate::ConfigError);
  EXPECT_THROW(tradegate::makeTimeWindow("Overnight", "UTC", 22h, 2h),
               tradegate::ConfigError);
  EXPECT_THROW(tradegate::makeTimeWindow("Past", "UTC", 8h, 25h),
               tradegate::ConfigError);
}

TEST(TimeWindowTest, RejectsUnknownZone) {
  EXPECT_THROW(tradegate::makeTimeWindow("Bad", "Mars/Olympus_Mons", 8h, 16h),
               tradegate::ConfigError);
  EXPECT_THROW(tradegate::loadTimeZone(""), tradegate::ConfigError);
}

// -----------------------------------------------------------------------------
// 7. parseTimeOfDay / formatTimeOfDay
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, ParsesTimeOfDay) {
  EXPECT_EQ(tradegate::parseTimeOfDay("08:00"), 8h);
  EXPECT_EQ(tradegate::parseTimeOfDay("16:30:15"), 16h + 30min + 15s);
  EXPECT_EQ(tradegate::parseTimeOfDay("24:00"), 24h);

  EXPECT_THROW(tradegate::parseTimeOfDay("8:00"), tradegate::ConfigError);
  EXPECT_THROW(tradegate::parseTimeOfDay("08:60"), tradegate::ConfigError);
  EXPECT_THROW(tradegate::parseTimeOfDay("24:01"), tradegate::ConfigError);
  EXPECT_THROW(tradegate::parseTimeOfDay("ab:cd"), tradegate::ConfigError);

  EXPECT_EQ(tradegate::formatTimeOfDay(8h), "08:00");
  EXPECT_EQ(tradegate::formatTimeOfDay(9h + 5min + 7s), "09:05:07");
}

// -----------------------------------------------------------------------------
// 8. accountDay with a 17:00 New York rollover.
// -----------------------------------------------------------------------------
TEST(TimeWindowTest, AccountDayShiftsByRolloverTime) {
  const absl::TimeZone ny = tradegate::loadTimeZone("America/New_York");

  // 2024-07-16 (EDT): 16:59 local = 20:59 UTC, still Monday's account-day.
  EXPECT_EQ(tradegate::accountDay(utc(2024, 7, 16, 20, 59), ny, 17h),
            absl::CivilDay(2024, 7, 15));
  // 17:00 local = 21:00 UTC opens Tuesday's account-day.
  EXPECT_EQ(tradegate::accountDay(utc(2024, 7, 16, 21, 0), ny, 17h),
            absl::CivilDay(2024, 7, 16));

  // Midnight rollover: the plain local date.
  EXPECT_EQ(tradegate::accountDay(utc(2024, 7, 16, 3, 0), ny, 0h),
            absl::CivilDay(2024, 7, 15));
}

TEST(TimeWindowTest, ToLocalReportsDateAndTimeOfDay) {
  const absl::TimeZone london = tradegate::loadTimeZone("Europe/London");
  const auto local = tradegate::toLocal(utc(2024, 7, 1, 23, 30), london);

  EXPECT_EQ(local.date, absl::CivilDay(2024, 7, 2));
  EXPECT_EQ(local.time_of_day, 30min);
}
