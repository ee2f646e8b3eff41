#pragma once

#include "tradegate/events/event_types.hpp"

#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// OpenCommitment: one admitted trade currently holding risk budget
// -----------------------------------------------------------------------------
//
// @brief  Created by a successful reservation, destroyed by a full close.
//
// @details
// Owned exclusively by the RiskLedger (keyed by id). risk_r is the
// EFFECTIVE risk the gate approved, i.e. already halved when the drawdown
// throttle was active; a partial close shrinks it further.
// -----------------------------------------------------------------------------
struct OpenCommitment {
  CommitmentId id{0};
  std::string symbol;
  double risk_r{0.0};
  Timestamp opened_at{};
};

}  // namespace domain
}  // namespace tradegate
