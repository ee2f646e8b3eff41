// =============================================================================
// news_guard_test.cpp
// =============================================================================
// Unit tests for tradegate::NewsGuard.
//
// Validates:
//   - Calendar filtering: high impact only, watched names only
//   - Blackout interval is closed on both ends
//   - Currency → symbol mapping (gold follows USD; pairs follow base/quote)
//   - A disabled guard never blocks
//   - addEvent() appends through the same filter
//   - pruneBefore() drops events whose blackout is over
// =============================================================================

#include "tradegate/session/news_guard.hpp"
#include "tradegate/time/time_utils.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

static tradegate::Timestamp utc(int y, int mo, int d, int h, int mi,
                                int s = 0) {
  return tradegate::ms_to_timestamp(absl::ToUnixMillis(absl::FromCivil(
      absl::CivilSecond(y, mo, d, h, mi, s), absl::UTCTimeZone())));
}

static tradegate::NewsEvent makeEvent(const std::string& name,
                                      const std::string& currency,
                                      const std::string& impact,
                                      tradegate::Timestamp at) {
  tradegate::NewsEvent event;
  event.name = name;
  event.currency = currency;
  event.impact = impact;
  event.time = at;
  return event;
}

class NewsGuardTestFixture : public ::testing::Test {
 protected:
  NewsGuardTestFixture() {
    config.enabled = true;
    config.block_before = 15min;
    config.block_after = 15min;
    config.watched_events = {"NFP", "CPI"};
  }

  // NFP (USD) at 12:30 UTC and CPI (EUR) at 09:00 UTC on 2024-07-05.
  std::vector<tradegate::NewsEvent> calendar() const {
    return {
        makeEvent("NFP Non-Farm Payrolls", "USD", "High",
                  utc(2024, 7, 5, 12, 30)),
        makeEvent("CPI m/m", "EUR", "high", utc(2024, 7, 5, 9, 0)),
        makeEvent("FOMC Minutes", "USD", "high", utc(2024, 7, 5, 18, 0)),
        makeEvent("NFP revision", "USD", "Medium", utc(2024, 7, 5, 14, 0)),
    };
  }

  tradegate::NewsGuardConfig config;
};

// -----------------------------------------------------------------------------
// 1. Only watched, high-impact events survive loading.
// -----------------------------------------------------------------------------
TEST_F(NewsGuardTestFixture, LoadCalendarKeepsWatchedHighImpactOnly) {
  tradegate::NewsGuard guard(config);
  EXPECT_EQ(guard.loadCalendar(calendar()), 2u);
  EXPECT_EQ(guard.calendarSize(), 2u);

  // FOMC is not watched; the medium-impact NFP revision is dropped.
  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 18, 0)));
  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 14, 0)));
}

// -----------------------------------------------------------------------------
// 2. [event - 15m, event + 15m], both ends included.
// -----------------------------------------------------------------------------
TEST_F(NewsGuardTestFixture, BlackoutIntervalIsClosed) {
  tradegate::NewsGuard guard(config);
  guard.loadCalendar(calendar());

  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 14, 59)));
  EXPECT_TRUE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 15, 0)));
  EXPECT_TRUE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 30, 0)));
  EXPECT_TRUE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 45, 0)));
  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 45, 1)));

  const auto hit = guard.blackoutFor("EURUSD", utc(2024, 7, 5, 12, 30));
  ASSERT_TRUE(hit);
  EXPECT_EQ(hit->name, "NFP Non-Farm Payrolls");
}

// -----------------------------------------------------------------------------
// 3. Symbol mapping.
// -----------------------------------------------------------------------------
TEST(NewsGuardTest, AffectsSymbolMapping) {
  using tradegate::NewsGuard;

  EXPECT_TRUE(NewsGuard::affectsSymbol("XAUUSD", "USD"));
  EXPECT_TRUE(NewsGuard::affectsSymbol("GOLD", "usd"));
  EXPECT_FALSE(NewsGuard::affectsSymbol("XAUEUR", "EUR"));

  EXPECT_TRUE(NewsGuard::affectsSymbol("EURUSD", "EUR"));
  EXPECT_TRUE(NewsGuard::affectsSymbol("EURUSD", "USD"));
  EXPECT_TRUE(NewsGuard::affectsSymbol("gbpjpy", "JPY"));
  EXPECT_FALSE(NewsGuard::affectsSymbol("GBPJPY", "USD"));

  EXPECT_FALSE(NewsGuard::affectsSymbol("SPX", "USD"));
}

TEST_F(NewsGuardTestFixture, EuroEventDoesNotBlockGold) {
  tradegate::NewsGuard guard(config);
  guard.loadCalendar(calendar());

  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 9, 0)));
  EXPECT_TRUE(guard.blackoutFor("EURGBP", utc(2024, 7, 5, 9, 0)));
  EXPECT_FALSE(guard.blackoutFor("GBPJPY", utc(2024, 7, 5, 9, 0)));
}

// -----------------------------------------------------------------------------
// 4. Disabled guard and empty watch list.
// -----------------------------------------------------------------------------
TEST_F(NewsGuardTestFixture, DisabledGuardNeverBlocks) {
  config.enabled = false;
  tradegate::NewsGuard guard(config);
  guard.loadCalendar(calendar());

  EXPECT_FALSE(guard.enabled());
  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 30)));
}

TEST_F(NewsGuardTestFixture, EmptyWatchListKeepsNothing) {
  config.watched_events.clear();
  tradegate::NewsGuard guard(config);

  EXPECT_EQ(guard.loadCalendar(calendar()), 0u);
  EXPECT_FALSE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 30)));
}

// -----------------------------------------------------------------------------
// 5. addEvent appends retained events and refuses the rest.
// -----------------------------------------------------------------------------
TEST_F(NewsGuardTestFixture, AddEventAppliesFilter) {
  tradegate::NewsGuard guard(config);

  EXPECT_TRUE(guard.addEvent(
      makeEvent("US CPI y/y", "USD", "HIGH", utc(2024, 7, 11, 12, 30))));
  EXPECT_FALSE(guard.addEvent(
      makeEvent("Retail Sales", "USD", "high", utc(2024, 7, 12, 12, 30))));
  EXPECT_EQ(guard.calendarSize(), 1u);

  EXPECT_TRUE(guard.blackoutFor("XAUUSD", utc(2024, 7, 11, 12, 20)));
}

// -----------------------------------------------------------------------------
// 6. pruneBefore drops events whose blackout has ended, and only those.
// -----------------------------------------------------------------------------
TEST_F(NewsGuardTestFixture, PruneBeforeDropsFinishedBlackouts) {
  tradegate::NewsGuard guard(config);
  ASSERT_EQ(guard.loadCalendar(calendar()), 2u);  // CPI 09:00, NFP 12:30

  // CPI blackout ends 09:15: still inside it, nothing goes.
  EXPECT_EQ(guard.pruneBefore(utc(2024, 7, 5, 9, 15)), 0u);
  EXPECT_EQ(guard.calendarSize(), 2u);

  EXPECT_EQ(guard.pruneBefore(utc(2024, 7, 5, 9, 15, 1)), 1u);
  EXPECT_EQ(guard.calendarSize(), 1u);
  EXPECT_FALSE(guard.blackoutFor("EURUSD", utc(2024, 7, 5, 9, 0)));
  EXPECT_TRUE(guard.blackoutFor("XAUUSD", utc(2024, 7, 5, 12, 30)));

  EXPECT_EQ(guard.pruneBefore(utc(2024, 7, 6, 0, 0)), 1u);
  EXPECT_EQ(guard.calendarSize(), 0u);
}

TEST_F(NewsGuardTestFixture, AppendedEventsCanBePruned) {
  tradegate::NewsGuard guard(config);
  for (int day = 1; day <= 20; ++day) {
    ASSERT_TRUE(guard.addEvent(
        makeEvent("US CPI", "USD", "high", utc(2024, 7, day, 12, 30))));
  }
  EXPECT_EQ(guard.calendarSize(), 20u);

  EXPECT_EQ(guard.pruneBefore(utc(2024, 7, 18, 0, 0)), 17u);
  EXPECT_EQ(guard.calendarSize(), 3u);
  EXPECT_TRUE(guard.blackoutFor("XAUUSD", utc(2024, 7, 18, 12, 30)));
}
