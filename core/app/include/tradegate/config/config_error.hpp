#pragma once

#include <stdexcept>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// ConfigError: a configuration value the engine refuses to run with
// -----------------------------------------------------------------------------
//
// @brief  Thrown at load or reload time for malformed windows, unknown
//         timezone identifiers, missing drawdown lookback, and limits that
//         violate their invariants.
//
// @details
// Configuration problems fail fast: the engine never starts (or never
// swaps in a reload) with a half-valid configuration. The message carries
// the JSON path of the offending value when the error comes from the
// ConfigLoader, e.g. "symbols.XAUUSD.session_windows[1].timezone: unknown
// timezone 'Europe/Londn'".
//
// Gate denials are NOT configuration errors and are never thrown.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace tradegate
