#pragma once

#include "tradegate/domain/decision.hpp"

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// AdmissionDecisionEvent
// -----------------------------------------------------------------------------
//
// @brief  Published on the engine's output bus for every evaluated signal,
//         approved or rejected.
//
// Thread model:
//   Published on whichever worker thread evaluated the signal (or on the
//   caller's thread for the synchronous API). Plain value; safe to copy.
// -----------------------------------------------------------------------------
struct AdmissionDecisionEvent {
  domain::AdmissionDecision decision;
  std::uint64_t sequence_id{0};
};

}  // namespace tradegate
