#pragma once

#include "tradegate/domain/ledger_settings.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/session/news_guard.hpp"
#include "tradegate/session/session_gate.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace tradegate {

// One account: its ledger settings and initial limits.
struct AccountConfig {
  std::string id;
  domain::LedgerSettings settings;
  domain::RiskLimits limits;
};

// -----------------------------------------------------------------------------
// EngineConfig: everything the AdmissionEngine needs to start
// -----------------------------------------------------------------------------
// accounts:       at least one, ids unique.
// sessions:       symbol → windows; symbols not listed are always tradable.
// news_guard:     blackout settings (disabled when the section is absent).
// news_calendar:  events listed inline under news_guard.calendar, unfiltered.
// worker_threads: EventLoopThreads for the streamed API (>= 1).
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::vector<AccountConfig> accounts;
  SessionConfig sessions;
  NewsGuardConfig news_guard;
  std::vector<NewsEvent> news_calendar;
  std::size_t worker_threads{2};
};

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  JSON → validated typed config. Every function throws ConfigError
//         on the first problem, with the JSON path of the offending value in
//         the message (e.g. "accounts[1].limits.daily_stop_r: ...").
//
// @details
// nlohmann::json parse and type errors are caught and rethrown as
// ConfigError, so callers handle exactly one exception type. Nothing is
// partially applied: a failed load leaves no trace.
// -----------------------------------------------------------------------------
EngineConfig loadConfigFile(const std::string& path);
EngineConfig parseConfig(const std::string& text);
EngineConfig parseConfig(const nlohmann::json& root);

SessionConfig parseSessions(const nlohmann::json& symbols,
                            const std::string& path = "symbols");

domain::RiskLimits parseLimits(const nlohmann::json& limits,
                               const std::string& path = "limits");

domain::DrawdownLookback parseDrawdownLookback(
    const nlohmann::json& lookback,
    const std::string& path = "drawdown_lookback");

NewsGuardConfig parseNewsGuard(const nlohmann::json& guard,
                               const std::string& path = "news_guard");

// {"name":..,"currency":..,"impact":..,"time_ms":..}
NewsEvent parseNewsEvent(const nlohmann::json& event,
                         const std::string& path = "event");

}  // namespace tradegate
