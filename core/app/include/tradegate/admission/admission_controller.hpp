#pragma once

#include "tradegate/concurrent/commitment_id_generator.hpp"
#include "tradegate/domain/decision.hpp"
#include "tradegate/domain/risk_ledger_view.hpp"
#include "tradegate/events/event_types.hpp"
#include "tradegate/risk/risk_gate.hpp"
#include "tradegate/session/news_guard.hpp"
#include "tradegate/session/session_gate.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// AdmissionController
// -----------------------------------------------------------------------------
//
// @brief  Turns a CandidateSignal into an AdmissionDecision for one account,
//         reserving its risk when approved.
//
// @details
// Pipeline, first failure wins:
//   0. proposed_risk_r not finite or <= 0       → Rejected(InvalidRisk)
//   1. SessionGate::isTradable() is false       → Rejected(OutsideSessionWindow)
//   2. NewsGuard::blackoutFor() finds an event  → Rejected(NewsBlackout)
//   3. RiskGate::evaluateAndReserve(), fused under the ledger lock. A gate
//      denial keeps its own reason; a reservation refused after an approval
//      maps to ConcurrentRiskExceeded.
//   4. Approved(effective_risk_r, commitment_id). The message names the
//      session window that matched, followed by any throttle note.
//
// Steps 1 and 2 only read shared, read-mostly state. Step 3 is the only
// mutation this class performs; trade closes go to the ledger directly.
//
// Thread model:
//   evaluate() is safe to call from any number of threads at once. The
//   ledger's exclusive lock makes each check-and-reserve atomic.
//
// Ownership:
//   Non-owning references to everything; the AdmissionEngine's account
//   runtime owns the gate and ledger, the engine owns the session gate,
//   news guard and id generator.
// -----------------------------------------------------------------------------
class AdmissionController {
 public:
  AdmissionController(const SessionGate& sessions, const NewsGuard& news,
                      RiskGate& risk, CommitmentIdGenerator& ids);

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;

  // When approved and `ledger_after` is non-null, it receives the ledger
  // view taken inside the reservation's critical section.
  domain::AdmissionDecision evaluate(const CandidateSignal& signal,
                                     domain::RiskLedgerView* ledger_after =
                                         nullptr);

 private:
  const SessionGate& sessions_;
  const NewsGuard& news_;
  RiskGate& risk_;
  CommitmentIdGenerator& ids_;
};

}  // namespace tradegate
