#pragma once

#include "tradegate/domain/decision.hpp"
#include "tradegate/domain/risk_ledger_view.hpp"
#include "tradegate/events/event_types.hpp"
#include "tradegate/risk/risk_ledger.hpp"

#include <string>

namespace tradegate {

// Effective-size multiplier while the drawdown throttle is engaged.
constexpr double kDrawdownSizeFactor = 0.5;

// -----------------------------------------------------------------------------
// RiskGate: pre-trade budget check for one account
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a proposed risk (in R) fits the account's budget,
//         halving it while the drawdown throttle is engaged.
//
// @details
// Rules, evaluated in order against one ledger view:
//   1. !can_trade                                        → DailyStopHit
//   2. effective = proposed * (0.5 if risk_reduction_active else 1)
//   3. active_risk_r + effective > max_concurrent_r      → ConcurrentRiskExceeded
//   4. daily_risk_used_r + effective > max_daily_risk_r  → DailyRiskExceeded
//   5. Approved(effective)
//
// The throttle has no state of its own. It engages and disengages as the
// trailing window changes.
//
// Thread model:
//   decide() is pure. evaluate() and evaluateAndReserve() are as thread-safe
//   as the RiskLedger they wrap.
//
// Ownership:
//   Holds a reference to the ledger; both live in the same account runtime.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  explicit RiskGate(RiskLedger& ledger);

  RiskGate(const RiskGate&) = delete;
  RiskGate& operator=(const RiskGate&) = delete;

  static domain::GateDecision decide(const domain::RiskLedgerView& view,
                                     const std::string& symbol,
                                     double proposed_risk_r);

  // Advisory check against a fresh snapshot. Reserves nothing.
  domain::GateDecision evaluate(const std::string& symbol,
                                double proposed_risk_r);

  // -------------------------------------------------------------------------
  // evaluateAndReserve(symbol, proposed, opened_at, next_id)
  // -------------------------------------------------------------------------
  // @brief  decide() and the reservation run under one ledger lock, so an
  //         approval can never be invalidated by a concurrent reservation.
  //
  // @return The ledger's GatedReservation. next_id is called only when the
  //         decision is an approval.
  // -------------------------------------------------------------------------
  RiskLedger::GatedReservation evaluateAndReserve(
      const std::string& symbol, double proposed_risk_r, Timestamp opened_at,
      const RiskLedger::IdSource& next_id);

  RiskLedger& ledger() { return ledger_; }

 private:
  RiskLedger& ledger_;
};

}  // namespace tradegate
