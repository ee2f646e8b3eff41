#include "tradegate/time/time_zone.hpp"
#include "tradegate/config/config_error.hpp"

namespace tradegate {

absl::TimeZone loadTimeZone(const std::string& name) {
  absl::TimeZone zone;
  if (name.empty() || !absl::LoadTimeZone(name, &zone)) {
    throw ConfigError("unknown timezone '" + name + "'");
  }
  return zone;
}

// -----------------------------------------------------------------------------
// toLocal: absl::Time → CivilSecond in the zone → (day, seconds of day)
// -----------------------------------------------------------------------------
LocalTime toLocal(Timestamp instant, const absl::TimeZone& zone) {
  const absl::CivilSecond cs =
      absl::ToCivilSecond(absl::FromChrono(instant), zone);

  LocalTime local;
  local.date = absl::CivilDay(cs);
  local.time_of_day = std::chrono::seconds{cs - absl::CivilSecond(local.date)};
  return local;
}

absl::CivilDay accountDay(Timestamp instant, const absl::TimeZone& zone,
                          std::chrono::seconds day_start) {
  const absl::CivilSecond cs =
      absl::ToCivilSecond(absl::FromChrono(instant), zone);
  return absl::CivilDay(cs - day_start.count());
}

}  // namespace tradegate
