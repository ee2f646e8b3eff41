#include "tradegate/admission/admission_controller.hpp"
#include "tradegate/time/time_utils.hpp"

#include <cmath>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace tradegate {

namespace {

domain::AdmissionDecision rejected(const CandidateSignal& signal,
                                   domain::ReasonCode reason,
                                   std::string message) {
  domain::AdmissionDecision d;
  d.status = domain::AdmissionStatus::Rejected;
  d.reason = reason;
  d.message = std::move(message);
  d.account_id = signal.account_id;
  d.signal_id = signal.signal_id;
  d.symbol = signal.symbol;
  d.timestamp = signal.timestamp;
  d.proposed_risk_r = signal.proposed_risk_r;
  return d;
}

}  // namespace

AdmissionController::AdmissionController(const SessionGate& sessions,
                                         const NewsGuard& news,
                                         RiskGate& risk,
                                         CommitmentIdGenerator& ids)
    : sessions_(sessions), news_(news), risk_(risk), ids_(ids) {}

// -----------------------------------------------------------------------------
// evaluate(signal)
// -----------------------------------------------------------------------------
domain::AdmissionDecision AdmissionController::evaluate(
    const CandidateSignal& signal, domain::RiskLedgerView* ledger_after) {
  using domain::ReasonCode;

  // --- 0) Proposed risk must be a positive finite number --------------------
  if (!std::isfinite(signal.proposed_risk_r) ||
      signal.proposed_risk_r <= 0.0) {
    std::ostringstream out;
    out << "proposed risk " << signal.proposed_risk_r
        << "R must be positive and finite";
    return rejected(signal, ReasonCode::InvalidRisk, out.str());
  }

  // --- 1) Session windows ---------------------------------------------------
  const std::optional<std::string> window =
      sessions_.matchingWindow(signal.symbol, signal.timestamp);
  if (!window && !sessions_.isTradable(signal.symbol, signal.timestamp)) {
    return rejected(signal, ReasonCode::OutsideSessionWindow,
                    signal.symbol + " outside session windows (" +
                        sessions_.describeWindows(signal.symbol) + ")");
  }

  // --- 2) News blackout -----------------------------------------------------
  if (auto event = news_.blackoutFor(signal.symbol, signal.timestamp)) {
    std::ostringstream out;
    out << signal.symbol << " in news blackout for " << event->name << " ("
        << event->currency << ") at " << timestamp_to_ms(event->time)
        << " ms";
    return rejected(signal, ReasonCode::NewsBlackout, out.str());
  }

  // --- 3) Risk check and reservation, one ledger critical section -----------
  RiskLedger::GatedReservation result = risk_.evaluateAndReserve(
      signal.symbol, signal.proposed_risk_r, signal.timestamp,
      [this] { return ids_.next_id(); });

  if (!result.decision.approved) {
    domain::AdmissionDecision d =
        rejected(signal, result.decision.reason, result.decision.message);
    d.risk_reduced = result.decision.risk_reduced;
    return d;
  }

  if (result.reservation != ReservationResult::Reserved) {
    return rejected(signal, ReasonCode::ConcurrentRiskExceeded,
                    std::string("reservation refused: ") +
                        toString(result.reservation));
  }

  // --- 4) Approved ----------------------------------------------------------
  if (ledger_after != nullptr) {
    *ledger_after = result.view;
  }

  // "in session London; drawdown throttle: ..."
  std::string message = window ? "in session " + *window : std::string();
  if (!result.decision.message.empty()) {
    if (!message.empty()) {
      message += "; ";
    }
    message += result.decision.message;
  }

  domain::AdmissionDecision d;
  d.status = domain::AdmissionStatus::Approved;
  d.reason = ReasonCode::None;
  d.message = std::move(message);
  d.account_id = signal.account_id;
  d.signal_id = signal.signal_id;
  d.symbol = signal.symbol;
  d.timestamp = signal.timestamp;
  d.proposed_risk_r = signal.proposed_risk_r;
  d.effective_risk_r = result.decision.effective_risk_r;
  d.risk_reduced = result.decision.risk_reduced;
  d.commitment_id = result.commitment_id;
  return d;
}

}  // namespace tradegate
