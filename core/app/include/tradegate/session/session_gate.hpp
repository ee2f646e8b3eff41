#pragma once

#include "tradegate/domain/time_window.hpp"
#include "tradegate/events/event_types.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradegate {

// symbol → windows in which the symbol may trade. Order is irrelevant to the
// verdict; it only decides which window name a match reports.
using SessionConfig =
    std::unordered_map<std::string, std::vector<domain::TimeWindow>>;

// -----------------------------------------------------------------------------
// SessionGate: "is this symbol tradable at this instant?"
// -----------------------------------------------------------------------------
//
// @brief  Holds the per-symbol session windows and answers tradability as
//         the logical OR of the symbol's windows.
//
// @details
// Rules:
//   - A symbol with no windows (or absent from the config) is ALWAYS
//     tradable: session filtering is switched off for it.
//   - Otherwise the instant must fall inside at least one window. Two
//     sessions in different zones (London 08:00–16:00 Europe/London and New
//     York 08:00–17:00 America/New_York) therefore combine into one wider
//     trading day, overlap included.
//
// Copy-and-swap configuration:
//   The config lives behind a shared_ptr<const SessionConfig>. Readers take
//   the shared lock only long enough to copy the pointer, then evaluate
//   against their private snapshot without any lock. replaceConfig() builds
//   nothing under the lock: it receives a complete config and swaps the
//   pointer under the unique lock. A reader sees either the old config or
//   the new one, never a mix.
//
// Thread model:
//   Unlimited concurrent readers (admission workers); occasional writer
//   (reload). All methods are thread-safe.
//
// Ownership:
//   Owned by AdmissionEngine, shared by reference with every account's
//   AdmissionController.
// -----------------------------------------------------------------------------
class SessionGate {
 public:
  SessionGate();
  explicit SessionGate(SessionConfig config);

  SessionGate(const SessionGate&) = delete;
  SessionGate& operator=(const SessionGate&) = delete;

  // -------------------------------------------------------------------------
  // isTradable(symbol, instant)
  // -------------------------------------------------------------------------
  // @return true if the symbol has no windows, or the instant is inside at
  //         least one of them.
  //
  // Side-effects: None.
  // -------------------------------------------------------------------------
  bool isTradable(const std::string& symbol, Timestamp instant) const;

  // -------------------------------------------------------------------------
  // matchingWindow(symbol, instant)
  // -------------------------------------------------------------------------
  // @return Name of the first window containing the instant; std::nullopt if
  //         none does (including when the symbol has no windows at all).
  // -------------------------------------------------------------------------
  std::optional<std::string> matchingWindow(const std::string& symbol,
                                            Timestamp instant) const;

  // "London 08:00-16:00 Europe/London, New York 08:00-17:00 America/New_York"
  // Empty when the symbol has no windows.
  std::string describeWindows(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // replaceConfig(config)
  // -------------------------------------------------------------------------
  // @brief  Publishes a new configuration with one pointer swap.
  //
  // @details
  // The windows must already be validated (built via makeTimeWindow or the
  // ConfigLoader). Evaluations already holding the old snapshot finish
  // against it.
  // -------------------------------------------------------------------------
  void replaceConfig(SessionConfig config);

  std::shared_ptr<const SessionConfig> config() const;

 private:
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const SessionConfig> config_;
};

}  // namespace tradegate
