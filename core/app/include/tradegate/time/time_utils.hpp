#pragma once

#include "tradegate/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Converts between the engine's Timestamp type
//         (std::chrono::system_clock::time_point) and int64_t epoch
//         milliseconds.
//
// @details
// ITimeProvider and the JSON replay records speak int64 milliseconds. The
// domain records (CandidateSignal, TradeClose, OpenCommitment) carry a
// Timestamp. These helpers bridge the two.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace tradegate
