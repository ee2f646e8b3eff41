#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/config/config_error.hpp"

#include <cmath>
#include <string>

namespace tradegate {
namespace domain {

namespace {

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigError("risk limits: " + message);
  }
}

}  // namespace

void validate(const RiskLimits& limits) {
  require(std::isfinite(limits.max_risk_per_trade_pct) &&
              std::isfinite(limits.max_daily_risk_pct) &&
              std::isfinite(limits.daily_stop_r) &&
              std::isfinite(limits.max_concurrent_r) &&
              std::isfinite(limits.drawdown_threshold_r),
          "all limits must be finite numbers");
  require(limits.max_risk_per_trade_pct > 0.0,
          "max_risk_per_trade_pct must be > 0");
  require(limits.max_daily_risk_pct >= limits.max_risk_per_trade_pct,
          "max_daily_risk_pct must be >= max_risk_per_trade_pct");
  require(limits.daily_stop_r < 0.0, "daily_stop_r must be negative");
  require(limits.max_concurrent_r >= 0.0, "max_concurrent_r must be >= 0");
  require(limits.drawdown_threshold_r > 0.0,
          "drawdown_threshold_r must be > 0");
}

}  // namespace domain
}  // namespace tradegate
