#include "tradegate/domain/ledger_settings.hpp"
#include "tradegate/config/config_error.hpp"

#include <string>

namespace tradegate {
namespace domain {

DrawdownLookback DrawdownLookback::days(int length) {
  if (length <= 0) {
    throw ConfigError("drawdown lookback: days must be > 0, got " +
                      std::to_string(length));
  }
  return DrawdownLookback(Kind::Days, length);
}

DrawdownLookback DrawdownLookback::trades(int length) {
  if (length <= 0) {
    throw ConfigError("drawdown lookback: trades must be > 0, got " +
                      std::to_string(length));
  }
  return DrawdownLookback(Kind::Trades, length);
}

}  // namespace domain
}  // namespace tradegate
