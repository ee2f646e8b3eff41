#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract "now" for ledger bookkeeping
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where the current time comes
//         from.
//
// @details
// The RiskLedger needs "now" in two places: to stamp a trade close that
// carries no explicit close time, and to detect a missed daily rollover
// (the process was down across the account-day boundary). If the ledger
// called std::chrono::system_clock::now() directly, replaying a day of
// signals through the engine would roll over at the wrong moments and the
// tests would depend on the wall clock.
//
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the replay gateway or
//                              by a test.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Admission workers call now_ms() while the replay thread advances the
//   simulated clock.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradegate
