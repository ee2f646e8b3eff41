// =============================================================================
// replay_gateway_test.cpp
// =============================================================================
// Unit tests for tradegate::ReplayGateway.
//
// Validates:
//   - Each record type decodes into the right sink call
//   - The simulation clock is advanced before the record is dispatched
//   - Malformed and unsupported lines are counted and skipped
//   - An end-to-end replay through the AdmissionEngine rolls the account-day
//     over by record time and enforces the 2R concurrent budget
// =============================================================================

#include "tradegate/config/config_loader.hpp"
#include "tradegate/engine/admission_engine.hpp"
#include "tradegate/events/admission_decision_event.hpp"
#include "tradegate/gateway/replay_gateway.hpp"
#include "tradegate/time/simulation_time_provider.hpp"
#include "tradegate/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using tradegate::domain::ReasonCode;

// 2024-07-15 10:00:00 UTC
constexpr std::int64_t kMonday10 = 1721037600000;
constexpr std::int64_t kHour = 3600 * 1000;

class ReplayGatewayTest : public ::testing::Test {
 protected:
  ReplayGatewayTest()
      : gateway(
            clock,
            [this](tradegate::Event event) {
              events.push_back(std::move(event));
              clock_at_dispatch.push_back(clock.now_ms());
            },
            [this](const std::string& cmd) {
              commands.push_back(cmd);
              return std::string("{\"status\":\"ok\"}");
            },
            [this](const tradegate::NewsEvent& event) {
              news.push_back(event);
            },
            out) {}

  tradegate::SimulationTimeProvider clock;
  std::ostringstream out;
  std::vector<tradegate::Event> events;
  std::vector<std::int64_t> clock_at_dispatch;
  std::vector<std::string> commands;
  std::vector<tradegate::NewsEvent> news;
  tradegate::ReplayGateway gateway;
};

TEST_F(ReplayGatewayTest, DecodesEveryRecordType) {
  std::istringstream in(
      R"({"type":"signal","timestamp_ms":1721037600000,"account":"main","symbol":"XAUUSD","risk_r":1.0,"signal_id":"s1"})"
      "\n"
      "\n"
      R"({"type":"close","timestamp_ms":1721041200000,"account":"main","commitment_id":1,"pnl_r":-0.5,"fraction":0.5})"
      "\n"
      R"({"type":"rollover","timestamp_ms":1721088000000,"account":"main"})"
      "\n"
      R"({"type":"command","command":"STATUS main"})"
      "\n"
      R"({"type":"news","time_ms":1721050000000,"name":"CPI","currency":"USD"})"
      "\n");

  const auto stats = gateway.run(in);
  EXPECT_EQ(stats.lines, 5u);
  EXPECT_EQ(stats.dispatched, 5u);
  EXPECT_EQ(stats.skipped, 0u);

  ASSERT_EQ(events.size(), 3u);
  const auto& signal = std::get<tradegate::CandidateSignal>(events[0]);
  EXPECT_EQ(signal.signal_id, "s1");
  EXPECT_EQ(signal.symbol, "XAUUSD");
  EXPECT_EQ(tradegate::timestamp_to_ms(signal.timestamp), kMonday10);
  EXPECT_EQ(clock_at_dispatch[0], kMonday10);

  const auto& close = std::get<tradegate::TradeClose>(events[1]);
  EXPECT_EQ(close.commitment_id, 1u);
  EXPECT_DOUBLE_EQ(close.closed_fraction, 0.5);
  EXPECT_DOUBLE_EQ(close.realized_pnl_dollars, 0.0);
  EXPECT_EQ(clock_at_dispatch[1], kMonday10 + kHour);

  EXPECT_TRUE(std::holds_alternative<tradegate::RolloverRequest>(events[2]));

  ASSERT_EQ(commands.size(), 1u);
  EXPECT_EQ(commands[0], "STATUS main");
  EXPECT_EQ(out.str(), "{\"status\":\"ok\"}\n");

  ASSERT_EQ(news.size(), 1u);
  EXPECT_EQ(news[0].impact, "high");

  // Records without timestamp_ms leave the clock where it was.
  EXPECT_EQ(clock.now_ms(), 1721088000000);
}

TEST_F(ReplayGatewayTest, SignalIdDefaultsToLineNumber) {
  EXPECT_TRUE(gateway.handleLine(
      R"({"type":"signal","timestamp_ms":1,"account":"a","symbol":"X","risk_r":1})",
      12));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(std::get<tradegate::CandidateSignal>(events[0]).signal_id,
            "line-12");
}

TEST_F(ReplayGatewayTest, MalformedLinesAreSkipped) {
  std::istringstream in(
      "not json\n"
      R"({"type":"signal","account":"main"})"
      "\n"
      R"({"type":"teleport"})"
      "\n"
      R"({"type":"news","time_ms":1,"name":"NFP"})"
      "\n"
      R"({"type":"rollover","timestamp_ms":1721088000000,"account":"main"})"
      "\n");

  const auto stats = gateway.run(in);
  EXPECT_EQ(stats.lines, 5u);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(stats.skipped, 4u);
  EXPECT_EQ(events.size(), 1u);
  EXPECT_TRUE(news.empty());
}

TEST_F(ReplayGatewayTest, StopFromSinkEndsRun) {
  std::istringstream in(
      R"({"type":"rollover","timestamp_ms":1,"account":"main"})"
      "\n"
      R"({"type":"rollover","timestamp_ms":2,"account":"main"})"
      "\n");

  tradegate::ReplayGateway* self = nullptr;
  tradegate::ReplayGateway stopping(
      clock,
      [&](tradegate::Event event) {
        events.push_back(std::move(event));
        self->stop();
      },
      [](const std::string&) { return std::string(); },
      [](const tradegate::NewsEvent&) {}, out);
  self = &stopping;

  const auto stats = stopping.run(in);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(events.size(), 1u);
  EXPECT_EQ(clock.now_ms(), 1);
}

// -----------------------------------------------------------------------------
// End to end: replay → engine.dispatch on the replaying thread.
// -----------------------------------------------------------------------------
TEST(ReplayEndToEndTest, ReplayDrivesEngine) {
  const auto config = tradegate::parseConfig(std::string(R"({
    "accounts": [
      { "id": "main", "drawdown_lookback": { "days": 5 },
        "limits": { "max_risk_per_trade_pct": 2.0, "max_daily_risk_pct": 5.0,
                    "daily_stop_r": -3.0, "max_concurrent_r": 2.0,
                    "drawdown_threshold_r": 6.0 } }
    ]
  })"));

  tradegate::SimulationTimeProvider clock(kMonday10);
  tradegate::AdmissionEngine engine(config, clock);

  std::vector<tradegate::domain::AdmissionDecision> decisions;
  engine.outputBus().subscribe<tradegate::AdmissionDecisionEvent>(
      [&decisions](const tradegate::AdmissionDecisionEvent& e) {
        decisions.push_back(e.decision);
      });

  std::ostringstream out;
  tradegate::ReplayGateway gateway(
      clock, [&engine](tradegate::Event event) { engine.dispatch(event); },
      [&engine](const std::string& cmd) { return engine.executeCommand(cmd); },
      [&engine](const tradegate::NewsEvent& event) {
        engine.addNewsEvent(event);
      },
      out);

  // Three 1R signals against a 2R budget, a losing close, then the next
  // day's signal after midnight UTC.
  std::istringstream in(
      R"({"type":"signal","timestamp_ms":1721037600000,"account":"main","symbol":"EURUSD","risk_r":1.0})"
      "\n"
      R"({"type":"signal","timestamp_ms":1721037660000,"account":"main","symbol":"EURUSD","risk_r":1.0})"
      "\n"
      R"({"type":"signal","timestamp_ms":1721037720000,"account":"main","symbol":"EURUSD","risk_r":1.0})"
      "\n"
      R"({"type":"close","timestamp_ms":1721041200000,"account":"main","commitment_id":1,"pnl_r":-1.0})"
      "\n"
      R"({"type":"signal","timestamp_ms":1721091600000,"account":"main","symbol":"EURUSD","risk_r":1.0})"
      "\n"
      R"({"type":"command","command":"STATUS main"})"
      "\n");

  const auto stats = gateway.run(in);
  EXPECT_EQ(stats.dispatched, 6u);

  ASSERT_EQ(decisions.size(), 4u);
  EXPECT_TRUE(decisions[0].approved());
  EXPECT_TRUE(decisions[1].approved());
  EXPECT_EQ(decisions[2].reason, ReasonCode::ConcurrentRiskExceeded);
  EXPECT_TRUE(decisions[3].approved());

  const auto status = nlohmann::json::parse(out.str());
  EXPECT_EQ(status["account"]["trading_day"], "2024-07-16");
  EXPECT_DOUBLE_EQ(status["account"]["daily_pnl_r"].get<double>(), 0.0);
  EXPECT_DOUBLE_EQ(status["account"]["active_risk_r"].get<double>(), 2.0);
  EXPECT_DOUBLE_EQ(status["account"]["drawdown_r"].get<double>(), -1.0);
}
