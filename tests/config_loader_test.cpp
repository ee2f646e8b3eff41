// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for the JSON configuration loader.
//
// Validates:
//   - A complete config parses into typed, validated values
//   - Every structural or semantic error raises ConfigError naming the
//     JSON path: unknown zone, inverted window, missing lookback,
//     non-monotonic limits, duplicate accounts, wrong types, bad JSON
//   - Integer fields reject fractional numbers instead of truncating
//
// Design: Tests start from baseConfig() (a valid document) and break one
// thing each.
// =============================================================================

#include "tradegate/config/config_error.hpp"
#include "tradegate/config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using namespace std::chrono_literals;
using nlohmann::json;
using tradegate::ConfigError;
using tradegate::domain::DrawdownLookback;

static json baseConfig() {
  return json::parse(R"({
    "accounts": [
      { "id": "main", "reference_timezone": "America/New_York",
        "rollover_time": "17:00",
        "drawdown_lookback": { "trades": 20 },
        "limits": { "max_risk_per_trade_pct": 2.0, "max_daily_risk_pct": 5.0,
                    "daily_stop_r": -3.0, "max_concurrent_r": 2.0,
                    "drawdown_threshold_r": 6.0 } }
    ],
    "symbols": {
      "XAUUSD": { "session_windows": [
        { "name": "London", "start": "08:00", "end": "16:00",
          "timezone": "Europe/London" },
        { "name": "New York", "start": "08:00", "end": "17:00",
          "timezone": "America/New_York" } ] },
      "BTCUSD": { "session_windows": [] }
    },
    "news_guard": { "enabled": true, "block_minutes_before": 10,
                    "block_minutes_after": 20,
                    "events": ["NFP", "CPI"],
                    "calendar": [
                      { "name": "NFP", "currency": "USD", "impact": "high",
                        "time_ms": 1720182600000 } ] },
    "engine": { "worker_threads": 3 }
  })");
}

// Runs parseConfig and returns the ConfigError message ("" if none).
static std::string errorOf(const json& config) {
  try {
    tradegate::parseConfig(config);
  } catch (const ConfigError& e) {
    return e.what();
  }
  return "";
}

// -----------------------------------------------------------------------------
// 1. Happy path.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, ParsesCompleteConfig) {
  const auto config = tradegate::parseConfig(baseConfig());

  ASSERT_EQ(config.accounts.size(), 1u);
  const auto& account = config.accounts[0];
  EXPECT_EQ(account.id, "main");
  EXPECT_EQ(account.settings.rollover_time, 17h);
  EXPECT_EQ(account.settings.reference_zone.name(), "America/New_York");
  EXPECT_EQ(account.settings.drawdown_lookback.kind(),
            DrawdownLookback::Kind::Trades);
  EXPECT_EQ(account.settings.drawdown_lookback.length(), 20);
  EXPECT_DOUBLE_EQ(account.limits.maxDailyRiskR(), 2.5);

  ASSERT_EQ(config.sessions.count("XAUUSD"), 1u);
  EXPECT_EQ(config.sessions.at("XAUUSD").size(), 2u);
  EXPECT_EQ(config.sessions.at("XAUUSD")[1].name, "New York");
  EXPECT_TRUE(config.sessions.at("BTCUSD").empty());

  EXPECT_TRUE(config.news_guard.enabled);
  EXPECT_EQ(config.news_guard.block_before, 10min);
  EXPECT_EQ(config.news_guard.block_after, 20min);
  EXPECT_EQ(config.news_guard.watched_events.size(), 2u);
  ASSERT_EQ(config.news_calendar.size(), 1u);
  EXPECT_EQ(config.news_calendar[0].currency, "USD");

  EXPECT_EQ(config.worker_threads, 3u);
}

TEST(ConfigLoaderTest, OptionalSectionsDefault) {
  auto doc = baseConfig();
  doc.erase("symbols");
  doc.erase("news_guard");
  doc.erase("engine");
  doc["accounts"][0].erase("reference_timezone");
  doc["accounts"][0].erase("rollover_time");
  doc["accounts"][0]["drawdown_lookback"] = {{"days", 5}};

  const auto config = tradegate::parseConfig(doc);
  EXPECT_TRUE(config.sessions.empty());
  EXPECT_FALSE(config.news_guard.enabled);
  EXPECT_EQ(config.worker_threads, 2u);
  EXPECT_EQ(config.accounts[0].settings.rollover_time, 0s);
  EXPECT_EQ(config.accounts[0].settings.drawdown_lookback.kind(),
            DrawdownLookback::Kind::Days);
}

// -----------------------------------------------------------------------------
// 2. Session window errors.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, UnknownZoneIsConfigError) {
  auto doc = baseConfig();
  doc["symbols"]["XAUUSD"]["session_windows"][1]["timezone"] = "Europe/Atlantis";

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("symbols.XAUUSD.session_windows[1]"),
            std::string::npos)
      << message;
  EXPECT_NE(message.find("Europe/Atlantis"), std::string::npos) << message;
}

TEST(ConfigLoaderTest, InvertedWindowIsConfigError) {
  auto doc = baseConfig();
  doc["symbols"]["XAUUSD"]["session_windows"][0]["start"] = "22:00";
  doc["symbols"]["XAUUSD"]["session_windows"][0]["end"] = "02:00";

  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);
}

TEST(ConfigLoaderTest, MalformedTimeIsConfigError) {
  auto doc = baseConfig();
  doc["symbols"]["XAUUSD"]["session_windows"][0]["end"] = "4pm";

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("session_windows[0].end"), std::string::npos)
      << message;
}

// -----------------------------------------------------------------------------
// 3. Account errors.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MissingLookbackIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0].erase("drawdown_lookback");

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("accounts[0].drawdown_lookback"), std::string::npos)
      << message;
}

TEST(ConfigLoaderTest, AmbiguousOrInvalidLookbackIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0]["drawdown_lookback"] = {{"days", 5}, {"trades", 20}};
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);

  doc["accounts"][0]["drawdown_lookback"] = {{"trades", 0}};
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);
}

TEST(ConfigLoaderTest, FractionalLookbackIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0]["drawdown_lookback"] = {{"days", 2.7}};

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("drawdown_lookback.days"), std::string::npos)
      << message;
  EXPECT_NE(message.find("integer"), std::string::npos) << message;

  doc["accounts"][0]["drawdown_lookback"] = {{"trades", 20.5}};
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);

  // Integral values written as integers still parse.
  doc["accounts"][0]["drawdown_lookback"] = {{"days", 3}};
  const auto lookback =
      tradegate::parseConfig(doc).accounts[0].settings.drawdown_lookback;
  EXPECT_EQ(lookback.kind(), DrawdownLookback::Kind::Days);
  EXPECT_EQ(lookback.length(), 3);
}

TEST(ConfigLoaderTest, NonMonotonicLimitsAreConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0]["limits"]["max_daily_risk_pct"] = 1.0;

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("accounts[0].limits"), std::string::npos) << message;
  EXPECT_NE(message.find("max_daily_risk_pct"), std::string::npos) << message;
}

TEST(ConfigLoaderTest, PositiveDailyStopIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0]["limits"]["daily_stop_r"] = 3.0;
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);
}

TEST(ConfigLoaderTest, MissingLimitFieldIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0]["limits"].erase("max_concurrent_r");

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("accounts[0].limits.max_concurrent_r"),
            std::string::npos)
      << message;
}

TEST(ConfigLoaderTest, WrongTypeIsWrappedInConfigError) {
  auto doc = baseConfig();
  doc["accounts"][0]["limits"]["daily_stop_r"] = "minus three";
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);
}

TEST(ConfigLoaderTest, DuplicateAccountIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"].push_back(doc["accounts"][0]);

  const std::string message = errorOf(doc);
  EXPECT_NE(message.find("duplicate account id 'main'"), std::string::npos)
      << message;
}

TEST(ConfigLoaderTest, MissingOrEmptyAccountsIsConfigError) {
  auto doc = baseConfig();
  doc["accounts"] = json::array();
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);

  doc.erase("accounts");
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Document-level errors.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MalformedJsonIsConfigError) {
  EXPECT_THROW(tradegate::parseConfig(std::string("{ \"accounts\": [ ")),
               ConfigError);
}

TEST(ConfigLoaderTest, MissingFileIsConfigError) {
  EXPECT_THROW(tradegate::loadConfigFile("/nonexistent/tradegate.json"),
               ConfigError);
}

TEST(ConfigLoaderTest, ZeroWorkersIsConfigError) {
  auto doc = baseConfig();
  doc["engine"]["worker_threads"] = 0;
  EXPECT_THROW(tradegate::parseConfig(doc), ConfigError);
}

TEST(ConfigLoaderTest, FractionalCountsAreConfigError) {
  auto doc = baseConfig();
  doc["engine"]["worker_threads"] = 2.5;
  EXPECT_NE(errorOf(doc).find("engine.worker_threads"), std::string::npos);

  doc = baseConfig();
  doc["news_guard"]["block_minutes_after"] = 12.5;
  EXPECT_NE(errorOf(doc).find("news_guard.block_minutes_after"),
            std::string::npos);
}
