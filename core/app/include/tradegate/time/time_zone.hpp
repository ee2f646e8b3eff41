#pragma once

#include "tradegate/events/event_types.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include <chrono>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// LocalTime: an instant as seen on a wall clock in some zone
// -----------------------------------------------------------------------------
// date:        local calendar day.
// time_of_day: seconds since local midnight, in [0, 86400). Sub-second
//              precision is truncated, so a window end of 16:00:00 excludes
//              16:00:00.500 as well.
// -----------------------------------------------------------------------------
struct LocalTime {
  absl::CivilDay date;
  std::chrono::seconds time_of_day{0};
};

// -----------------------------------------------------------------------------
// loadTimeZone(name)
// -----------------------------------------------------------------------------
// @brief  Resolves an IANA identifier ("Europe/London") against the system
//         tz database.
//
// @throws ConfigError if the identifier is unknown. absl::LoadTimeZone
//         would otherwise silently hand back UTC.
// -----------------------------------------------------------------------------
absl::TimeZone loadTimeZone(const std::string& name);

// -----------------------------------------------------------------------------
// toLocal(instant, zone)
// -----------------------------------------------------------------------------
// @brief  Converts a UTC instant into local date and time-of-day using the
//         zone's full transition rules (not a fixed offset).
//
// Thread-safety: Pure. absl::TimeZone is an immutable handle.
// -----------------------------------------------------------------------------
LocalTime toLocal(Timestamp instant, const absl::TimeZone& zone);

// -----------------------------------------------------------------------------
// accountDay(instant, zone, day_start)
// -----------------------------------------------------------------------------
// @brief  The trading day an instant belongs to when the account's day
//         begins at local time `day_start` in `zone`.
//
// @details
// With day_start = 17:00 (a New York FX close), 16:59 local on Tuesday
// belongs to Monday's account-day and 17:00 local opens Tuesday's. This is
// computed by shifting the local wall clock back by day_start and taking
// the calendar day of the result. With day_start = 00:00 the account-day
// is simply the local calendar day.
// -----------------------------------------------------------------------------
absl::CivilDay accountDay(Timestamp instant, const absl::TimeZone& zone,
                          std::chrono::seconds day_start);

}  // namespace tradegate
