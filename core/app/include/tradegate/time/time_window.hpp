#pragma once

#include "tradegate/domain/time_window.hpp"
#include "tradegate/events/event_types.hpp"

#include <chrono>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// Time Window Evaluator
// -----------------------------------------------------------------------------
//
// Free functions: the evaluator has no state. Every call converts the
// instant with the window's own zone rules, so "08:00 local" stays 08:00
// local on both sides of a daylight-saving transition.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// contains(instant, window)
// -------------------------------------------------------------------------
// @brief  True iff window.start_local <= local time-of-day < end_local,
//         where local time is `instant` seen in window.zone.
//
// Thread-safety: Pure; safe for unlimited concurrent callers.
// -------------------------------------------------------------------------
bool contains(Timestamp instant, const domain::TimeWindow& window);

// -------------------------------------------------------------------------
// makeTimeWindow(name, zone_name, start_local, end_local)
// -------------------------------------------------------------------------
// @brief  Builds a validated TimeWindow.
//
// @throws ConfigError  unknown zone, start/end outside [0, 24h], or
//                      start_local >= end_local.
// -------------------------------------------------------------------------
domain::TimeWindow makeTimeWindow(std::string name, std::string zone_name,
                                  std::chrono::seconds start_local,
                                  std::chrono::seconds end_local);

// -------------------------------------------------------------------------
// parseTimeOfDay("HH:MM" | "HH:MM:SS")
// -------------------------------------------------------------------------
// @brief  Parses a wall-clock time into seconds since midnight. "24:00" is
//         accepted (end of day); anything past it is not.
//
// @throws ConfigError on malformed input.
// -------------------------------------------------------------------------
std::chrono::seconds parseTimeOfDay(const std::string& text);

// "HH:MM" or "HH:MM:SS" when seconds are non-zero.
std::string formatTimeOfDay(std::chrono::seconds time_of_day);

}  // namespace tradegate
