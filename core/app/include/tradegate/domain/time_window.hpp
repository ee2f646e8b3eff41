#pragma once

#include <absl/time/time.h>

#include <chrono>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// TimeWindow: a recurring local-time interval in one IANA zone
// -----------------------------------------------------------------------------
//
// @brief  "London 08:00–16:00 Europe/London": the half-open interval
//         [start_local, end_local) of local wall-clock time, every day.
//
// @details
// Invariant: start_local < end_local, both within one calendar day
// (end_local may be exactly 24h to mean "until midnight"). Overnight
// windows are rejected at construction by makeTimeWindow(); configure them
// as two windows instead.
//
// The zone is resolved once, when the window is built, so evaluation never
// touches the tz database by name.
//
// Thread model:
//   Immutable value once built. Owned by the SessionGate's configuration
//   snapshot and shared read-only by every reader.
// -----------------------------------------------------------------------------
struct TimeWindow {
  std::string name;
  std::string zone_name;
  absl::TimeZone zone;
  std::chrono::seconds start_local{0};
  std::chrono::seconds end_local{0};
};

}  // namespace domain
}  // namespace tradegate
