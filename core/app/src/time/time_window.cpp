#include "tradegate/time/time_window.hpp"
#include "tradegate/config/config_error.hpp"
#include "tradegate/time/time_zone.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace tradegate {

namespace {

constexpr std::chrono::seconds kDay{24 * 60 * 60};

// Reads exactly two decimal digits at text[pos]; -1 if not digits.
int twoDigits(const std::string& text, std::size_t pos) {
  if (pos + 2 > text.size() ||
      !std::isdigit(static_cast<unsigned char>(text[pos])) ||
      !std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
    return -1;
  }
  return (text[pos] - '0') * 10 + (text[pos + 1] - '0');
}

}  // namespace

// -----------------------------------------------------------------------------
// contains: local time-of-day in the window's zone vs. [start, end)
// -----------------------------------------------------------------------------
bool contains(Timestamp instant, const domain::TimeWindow& window) {
  const LocalTime local = toLocal(instant, window.zone);
  return window.start_local <= local.time_of_day &&
         local.time_of_day < window.end_local;
}

// -----------------------------------------------------------------------------
// makeTimeWindow: resolve the zone and enforce start < end within one day
// -----------------------------------------------------------------------------
domain::TimeWindow makeTimeWindow(std::string name, std::string zone_name,
                                  std::chrono::seconds start_local,
                                  std::chrono::seconds end_local) {
  if (start_local < std::chrono::seconds{0} || start_local >= kDay) {
    throw ConfigError("window '" + name + "': start " +
                      formatTimeOfDay(start_local) + " is not a time of day");
  }
  if (end_local <= std::chrono::seconds{0} || end_local > kDay) {
    throw ConfigError("window '" + name + "': end " +
                      formatTimeOfDay(end_local) + " is not a time of day");
  }
  if (start_local >= end_local) {
    // Overnight windows (22:00–02:00) are not supported as a single window.
    throw ConfigError("window '" + name + "': start " +
                      formatTimeOfDay(start_local) +
                      " must be before end " + formatTimeOfDay(end_local) +
                      " (split overnight sessions into two windows)");
  }

  domain::TimeWindow window;
  window.zone = loadTimeZone(zone_name);
  window.name = std::move(name);
  window.zone_name = std::move(zone_name);
  window.start_local = start_local;
  window.end_local = end_local;
  return window;
}

// -----------------------------------------------------------------------------
// parseTimeOfDay: strict "HH:MM" / "HH:MM:SS"
// -----------------------------------------------------------------------------
std::chrono::seconds parseTimeOfDay(const std::string& text) {
  const bool has_seconds = text.size() == 8;
  if ((text.size() != 5 && !has_seconds) || text[2] != ':' ||
      (has_seconds && text[5] != ':')) {
    throw ConfigError("malformed time of day '" + text +
                      "' (expected HH:MM or HH:MM:SS)");
  }

  const int hours = twoDigits(text, 0);
  const int minutes = twoDigits(text, 3);
  const int seconds = has_seconds ? twoDigits(text, 6) : 0;
  if (hours < 0 || minutes < 0 || seconds < 0 || minutes > 59 ||
      seconds > 59) {
    throw ConfigError("malformed time of day '" + text + "'");
  }

  const std::chrono::seconds total =
      std::chrono::hours{hours} + std::chrono::minutes{minutes} +
      std::chrono::seconds{seconds};
  if (total > kDay) {
    throw ConfigError("time of day '" + text + "' is past 24:00");
  }
  return total;
}

std::string formatTimeOfDay(std::chrono::seconds time_of_day) {
  const long long total = time_of_day.count();
  const long long hours = total / 3600;
  const long long minutes = (total % 3600) / 60;
  const long long seconds = total % 60;

  char buf[32];
  if (seconds != 0) {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", hours, minutes,
                  seconds);
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", hours, minutes);
  }
  return buf;
}

}  // namespace tradegate
