#include "tradegate/risk/risk_gate.hpp"

#include <sstream>

namespace tradegate {

namespace {

std::string describe(const std::string& symbol, const char* what,
                     double used, double requested, double limit) {
  std::ostringstream out;
  out << symbol << ": " << what << " " << used << "R + " << requested
      << "R exceeds " << limit << "R";
  return out.str();
}

}  // namespace

RiskGate::RiskGate(RiskLedger& ledger) : ledger_(ledger) {}

// -----------------------------------------------------------------------------
// decide(): the ordered rule set, pure over the view
// -----------------------------------------------------------------------------
domain::GateDecision RiskGate::decide(const domain::RiskLedgerView& view,
                                      const std::string& symbol,
                                      double proposed_risk_r) {
  using domain::GateDecision;
  using domain::ReasonCode;

  if (!view.can_trade) {
    std::ostringstream out;
    out << "daily stop hit: realized " << view.daily_pnl_r
        << "R is at or below " << view.daily_stop_r << "R";
    return GateDecision::Denied(ReasonCode::DailyStopHit, 0.0, out.str());
  }

  const bool reduced = view.risk_reduction_active;
  const double effective =
      reduced ? proposed_risk_r * kDrawdownSizeFactor : proposed_risk_r;

  if (view.active_risk_r + effective >
      view.max_concurrent_r + kRiskTolerance) {
    return GateDecision::Denied(
        ReasonCode::ConcurrentRiskExceeded, effective,
        describe(symbol, "concurrent risk", view.active_risk_r, effective,
                 view.max_concurrent_r));
  }

  if (view.daily_risk_used_r + effective >
      view.max_daily_risk_r + kRiskTolerance) {
    return GateDecision::Denied(
        ReasonCode::DailyRiskExceeded, effective,
        describe(symbol, "daily risk", view.daily_risk_used_r, effective,
                 view.max_daily_risk_r));
  }

  GateDecision approved = GateDecision::Approved(effective, reduced);
  if (reduced) {
    std::ostringstream out;
    out << "drawdown throttle: size halved to " << effective << "R (trailing "
        << view.drawdown_r << "R)";
    approved.message = out.str();
  }
  return approved;
}

domain::GateDecision RiskGate::evaluate(const std::string& symbol,
                                        double proposed_risk_r) {
  return decide(ledger_.snapshot(), symbol, proposed_risk_r);
}

RiskLedger::GatedReservation RiskGate::evaluateAndReserve(
    const std::string& symbol, double proposed_risk_r, Timestamp opened_at,
    const RiskLedger::IdSource& next_id) {
  return ledger_.reserveIf(
      symbol, opened_at,
      [&symbol, proposed_risk_r](const domain::RiskLedgerView& view) {
        return decide(view, symbol, proposed_risk_r);
      },
      next_id);
}

}  // namespace tradegate
