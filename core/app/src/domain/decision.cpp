#include "tradegate/domain/decision.hpp"

#include <utility>

namespace tradegate {
namespace domain {

const char* toString(ReasonCode reason) {
  switch (reason) {
    case ReasonCode::None:
      return "None";
    case ReasonCode::InvalidRisk:
      return "InvalidRisk";
    case ReasonCode::OutsideSessionWindow:
      return "OutsideSessionWindow";
    case ReasonCode::NewsBlackout:
      return "NewsBlackout";
    case ReasonCode::DailyStopHit:
      return "DailyStopHit";
    case ReasonCode::ConcurrentRiskExceeded:
      return "ConcurrentRiskExceeded";
    case ReasonCode::DailyRiskExceeded:
      return "DailyRiskExceeded";
  }
  return "Unknown";
}

GateDecision GateDecision::Approved(double effective_risk_r,
                                    bool risk_reduced) {
  GateDecision d;
  d.approved = true;
  d.effective_risk_r = effective_risk_r;
  d.risk_reduced = risk_reduced;
  d.reason = ReasonCode::None;
  return d;
}

GateDecision GateDecision::Denied(ReasonCode reason, double effective_risk_r,
                                  std::string message) {
  GateDecision d;
  d.approved = false;
  d.effective_risk_r = effective_risk_r;
  d.reason = reason;
  d.message = std::move(message);
  return d;
}

}  // namespace domain
}  // namespace tradegate
