#include "tradegate/session/session_gate.hpp"
#include "tradegate/time/time_window.hpp"

#include <mutex>
#include <utility>

namespace tradegate {

SessionGate::SessionGate()
    : config_(std::make_shared<const SessionConfig>()) {}

SessionGate::SessionGate(SessionConfig config)
    : config_(std::make_shared<const SessionConfig>(std::move(config))) {}

// -----------------------------------------------------------------------------
// config(): copy the current snapshot pointer under the shared lock
// -----------------------------------------------------------------------------
std::shared_ptr<const SessionConfig> SessionGate::config() const {
  std::shared_lock lock(mutex_);
  return config_;
}

// -----------------------------------------------------------------------------
// isTradable: OR across the symbol's windows; no windows → tradable
// -----------------------------------------------------------------------------
bool SessionGate::isTradable(const std::string& symbol,
                             Timestamp instant) const {
  const std::shared_ptr<const SessionConfig> snapshot = config();

  auto it = snapshot->find(symbol);
  if (it == snapshot->end() || it->second.empty()) {
    return true;
  }

  for (const domain::TimeWindow& window : it->second) {
    if (contains(instant, window)) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> SessionGate::matchingWindow(
    const std::string& symbol, Timestamp instant) const {
  const std::shared_ptr<const SessionConfig> snapshot = config();

  auto it = snapshot->find(symbol);
  if (it == snapshot->end()) {
    return std::nullopt;
  }
  for (const domain::TimeWindow& window : it->second) {
    if (contains(instant, window)) {
      return window.name;
    }
  }
  return std::nullopt;
}

std::string SessionGate::describeWindows(const std::string& symbol) const {
  const std::shared_ptr<const SessionConfig> snapshot = config();

  std::string out;
  auto it = snapshot->find(symbol);
  if (it == snapshot->end()) {
    return out;
  }
  for (const domain::TimeWindow& window : it->second) {
    if (!out.empty()) {
      out += ", ";
    }
    out += window.name + " " + formatTimeOfDay(window.start_local) + "-" +
           formatTimeOfDay(window.end_local) + " " + window.zone_name;
  }
  return out;
}

// -----------------------------------------------------------------------------
// replaceConfig: allocate the new snapshot outside the lock, swap inside
// -----------------------------------------------------------------------------
void SessionGate::replaceConfig(SessionConfig config) {
  auto next = std::make_shared<const SessionConfig>(std::move(config));
  std::unique_lock lock(mutex_);
  config_.swap(next);
  // `next` (the old snapshot) is released after the lock, when it goes out
  // of scope; readers still holding it keep it alive.
}

}  // namespace tradegate
