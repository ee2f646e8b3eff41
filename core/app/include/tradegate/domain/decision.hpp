#pragma once

#include "tradegate/events/event_types.hpp"

#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// ReasonCode: why a signal was (not) admitted
// -----------------------------------------------------------------------------
//
// @brief  Machine-readable outcome code carried by every decision.
//
// @details
// Denials are decision VALUES, never exceptions. The string form
// (toString) is the stable wire code a client sees next to the
// human-readable message.
//
//   None                    Approved.
//   InvalidRisk             proposed_risk_r not finite or <= 0.
//   OutsideSessionWindow    No configured window of the symbol is open.
//   NewsBlackout            Inside a watched high-impact event's blackout.
//   DailyStopHit            Daily realized R is at or below daily_stop_r.
//   ConcurrentRiskExceeded  Open risk + this trade > max_concurrent_r (also
//                           returned when a reservation race is lost).
//   DailyRiskExceeded       Daily risk used + this trade > daily R budget.
// -----------------------------------------------------------------------------
enum class ReasonCode {
  None,
  InvalidRisk,
  OutsideSessionWindow,
  NewsBlackout,
  DailyStopHit,
  ConcurrentRiskExceeded,
  DailyRiskExceeded,
};

const char* toString(ReasonCode reason);

// -----------------------------------------------------------------------------
// GateDecision: Risk Gate outcome
// -----------------------------------------------------------------------------
// approved == true  → effective_risk_r is the size to reserve (proposed, or
//                     half of it under the drawdown throttle).
// approved == false → reason/message describe the denial; effective_risk_r
//                     still reports the size that was tested.
// -----------------------------------------------------------------------------
struct GateDecision {
  bool approved{false};
  double effective_risk_r{0.0};
  bool risk_reduced{false};
  ReasonCode reason{ReasonCode::None};
  std::string message;

  static GateDecision Approved(double effective_risk_r, bool risk_reduced);
  static GateDecision Denied(ReasonCode reason, double effective_risk_r,
                             std::string message);
};

// -----------------------------------------------------------------------------
// AdmissionDecision: final answer for one CandidateSignal
// -----------------------------------------------------------------------------
enum class AdmissionStatus { Approved, Rejected };

struct AdmissionDecision {
  AdmissionStatus status{AdmissionStatus::Rejected};
  ReasonCode reason{ReasonCode::None};
  std::string message;

  std::string account_id;
  std::string signal_id;
  std::string symbol;
  Timestamp timestamp{};

  double proposed_risk_r{0.0};
  double effective_risk_r{0.0};   // 0 unless approved
  bool risk_reduced{false};       // drawdown throttle halved the size
  CommitmentId commitment_id{0};  // 0 unless approved

  bool approved() const { return status == AdmissionStatus::Approved; }
};

}  // namespace domain
}  // namespace tradegate
