#pragma once

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: per-account risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  The budget an account may consume, in percent of equity and in
//         R-multiples.
//
// @details
// One R is the amount risked on a single trade, i.e. max_risk_per_trade_pct
// of equity. That gives the daily percent budget an R equivalent:
//
//     max_daily_risk_r = max_daily_risk_pct / max_risk_per_trade_pct
//
// e.g. 2% per trade and 5% per day → 2.5R of daily budget.
//
// Sign convention:
//   daily_stop_r is NEGATIVE: the realized-R floor for the day. Once
//   daily realized pnl is at or below it, no new trades until rollover.
//   Every other field is non-negative.
//
// validate() enforces:
//   max_risk_per_trade_pct > 0
//   max_daily_risk_pct     >= max_risk_per_trade_pct
//   daily_stop_r           < 0
//   max_concurrent_r       >= 0
//   drawdown_threshold_r   > 0
//
// Thread model:
//   Plain value. The RiskLedger holds the current limits behind a
//   shared_ptr<const RiskLimits> and swaps it whole on reload, so an
//   evaluation never sees a half-updated set.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Percent of equity risked by one trade (defines 1R).
  double max_risk_per_trade_pct{2.0};

  /// Percent of equity the account may put at risk in one account-day.
  double max_daily_risk_pct{5.0};

  /// Realized-R floor for the day (negative).
  double daily_stop_r{-3.0};

  /// Maximum sum of open commitment risk, in R.
  double max_concurrent_r{2.0};

  /// Trailing realized losses (in R) that engage the drawdown throttle.
  double drawdown_threshold_r{6.0};

  double maxDailyRiskR() const {
    return max_daily_risk_pct / max_risk_per_trade_pct;
  }
};

// -----------------------------------------------------------------------------
// validate(limits)
// -----------------------------------------------------------------------------
// @throws ConfigError naming the first violated invariant.
// -----------------------------------------------------------------------------
void validate(const RiskLimits& limits);

}  // namespace domain
}  // namespace tradegate
