#pragma once

#include "tradegate/events/event_types.hpp"

#include <cstddef>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLedgerView: consistent snapshot of one account's risk state
// -----------------------------------------------------------------------------
//
// @brief  Every derived quantity of the ledger, computed under one lock
//         acquisition together with the limits in force at that moment.
//
// @details
// This is both the Risk Gate's input and the shape a monitoring layer
// renders. The derived fields are never stored in the ledger; they are
// recomputed for each view:
//
//   active_risk_r          = sum of open commitment risk
//   daily_risk_used_r      = -min(0, daily_pnl_r) + active_risk_r
//   risk_utilization       = active_risk_r / max_concurrent_r  (0 if limit 0)
//   drawdown_r             = sum of negative pnl_r in the trailing window
//   risk_reduction_active  = drawdown_r <= -drawdown_threshold_r
//   can_trade              = daily_pnl_r > daily_stop_r
//
// Value type, safe to copy to any thread.
// -----------------------------------------------------------------------------
struct RiskLedgerView {
  std::string account_id;
  std::string trading_day;  // Account-day, "YYYY-MM-DD"
  Timestamp as_of{};

  double daily_pnl_r{0.0};
  double daily_pnl_dollars{0.0};
  int trade_count{0};
  std::size_t active_trades_count{0};
  double active_risk_r{0.0};

  // Limits in force for this snapshot.
  double max_risk_per_trade{0.0};  // percent of equity
  double max_daily_risk{0.0};      // percent of equity
  double max_daily_risk_r{0.0};
  double daily_stop_r{0.0};
  double max_concurrent_r{0.0};
  double drawdown_threshold_r{0.0};

  double daily_risk_used_r{0.0};
  double drawdown_r{0.0};
  double risk_utilization{0.0};
  bool risk_reduction_active{false};
  bool can_trade{true};
};

}  // namespace domain
}  // namespace tradegate
