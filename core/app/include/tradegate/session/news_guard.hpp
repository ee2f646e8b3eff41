#pragma once

#include "tradegate/events/event_types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// NewsEvent: one economic-calendar entry
// -----------------------------------------------------------------------------
struct NewsEvent {
  std::string name;      // e.g. "NFP - Non-Farm Payrolls"
  std::string currency;  // ISO code the release moves, e.g. "USD"
  std::string impact;    // "high", "medium", "low"
  Timestamp time{};      // Scheduled release instant (UTC)
};

struct NewsGuardConfig {
  bool enabled{false};
  std::chrono::minutes block_before{15};
  std::chrono::minutes block_after{15};

  // Substrings matched against event names. Only high-impact events whose
  // name contains one of these are kept when a calendar is loaded.
  std::vector<std::string> watched_events;
};

// -----------------------------------------------------------------------------
// NewsGuard: blackout around scheduled high-impact releases
// -----------------------------------------------------------------------------
//
// @brief  Blocks admission for a symbol in
//         [event.time - block_before, event.time + block_after] of any
//         retained calendar event whose currency affects the symbol.
//
// @details
// Symbol/currency mapping (affectsSymbol):
//   - symbols containing "XAU" or "GOLD" move on USD releases only;
//   - symbols of six or more characters are treated as a currency pair and
//     move on their base (chars 0-2) and quote (chars 3-5) currencies;
//   - anything else is never affected.
//
// The calendar is copy-and-swap like SessionGate's config: loadCalendar(),
// addEvent() and pruneBefore() publish a new vector, readers evaluate a
// private snapshot. Owners prune as their clock advances so the calendar
// does not grow without bound.
//
// Thread model: all methods thread-safe.
// -----------------------------------------------------------------------------
class NewsGuard {
 public:
  // Disabled guard: blackoutFor() always returns std::nullopt.
  NewsGuard();
  explicit NewsGuard(NewsGuardConfig config);

  NewsGuard(const NewsGuard&) = delete;
  NewsGuard& operator=(const NewsGuard&) = delete;

  // -------------------------------------------------------------------------
  // loadCalendar(events)
  // -------------------------------------------------------------------------
  // @brief  Replaces the calendar with the retained subset of `events`.
  // @return Number of events retained.
  // -------------------------------------------------------------------------
  std::size_t loadCalendar(const std::vector<NewsEvent>& events);

  // Appends one event if it passes the same filter. Returns true if kept.
  bool addEvent(const NewsEvent& event);

  // -------------------------------------------------------------------------
  // pruneBefore(instant)
  // -------------------------------------------------------------------------
  // @brief  Drops events whose blackout ended before `instant`
  //         (time + block_after < instant). They can no longer block an
  //         evaluation at or after `instant`.
  // @return Number of events removed. Nothing is republished when zero.
  // -------------------------------------------------------------------------
  std::size_t pruneBefore(Timestamp instant);

  // -------------------------------------------------------------------------
  // blackoutFor(symbol, instant)
  // -------------------------------------------------------------------------
  // @return The first retained event whose blackout covers `instant` and
  //         whose currency affects `symbol`; std::nullopt otherwise or when
  //         the guard is disabled.
  // -------------------------------------------------------------------------
  std::optional<NewsEvent> blackoutFor(const std::string& symbol,
                                       Timestamp instant) const;

  bool enabled() const { return config_.enabled; }
  const NewsGuardConfig& config() const { return config_; }
  std::size_t calendarSize() const;

  static bool affectsSymbol(const std::string& symbol,
                            const std::string& currency);

 private:
  bool retains(const NewsEvent& event) const;

  const NewsGuardConfig config_;
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const std::vector<NewsEvent>> calendar_;
};

}  // namespace tradegate
