#pragma once

#include <absl/time/time.h>

#include <chrono>
#include <string>

namespace tradegate {
namespace domain {

// -----------------------------------------------------------------------------
// DrawdownLookback: horizon of the trailing realized-pnl window
// -----------------------------------------------------------------------------
//
// @brief  How far back realized losses count toward the drawdown throttle.
//
// @details
// No default constructor: the horizon must always be
// configured explicitly, either as
//   days(N)   – closes whose account-day is within the last N account-days
//               (today included), trimmed at each rollover, or
//   trades(N) – the last N closed trades, trimmed on every close.
// -----------------------------------------------------------------------------
class DrawdownLookback {
 public:
  enum class Kind { Days, Trades };

  // @throws ConfigError if length <= 0.
  static DrawdownLookback days(int length);
  static DrawdownLookback trades(int length);

  Kind kind() const { return kind_; }
  int length() const { return length_; }

 private:
  DrawdownLookback(Kind kind, int length) : kind_(kind), length_(length) {}

  Kind kind_;
  int length_;
};

// -----------------------------------------------------------------------------
// LedgerSettings: account calendar and drawdown horizon
// -----------------------------------------------------------------------------
// reference_zone: zone whose calendar defines the account-day.
// rollover_time:  local time-of-day at which a new account-day starts.
// -----------------------------------------------------------------------------
struct LedgerSettings {
  LedgerSettings(absl::TimeZone zone, std::chrono::seconds rollover,
                 DrawdownLookback lookback)
      : reference_zone(zone), rollover_time(rollover),
        drawdown_lookback(lookback) {}

  absl::TimeZone reference_zone;
  std::chrono::seconds rollover_time{0};
  DrawdownLookback drawdown_lookback;
};

}  // namespace domain
}  // namespace tradegate
