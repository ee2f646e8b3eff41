#include "tradegate/session/news_guard.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <iostream>
#include <mutex>
#include <utility>

namespace tradegate {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

}  // namespace

NewsGuard::NewsGuard() : NewsGuard(NewsGuardConfig{}) {}

NewsGuard::NewsGuard(NewsGuardConfig config)
    : config_(std::move(config)),
      calendar_(std::make_shared<const std::vector<NewsEvent>>()) {}

// -----------------------------------------------------------------------------
// retains: high impact AND name contains a watched substring
// -----------------------------------------------------------------------------
bool NewsGuard::retains(const NewsEvent& event) const {
  if (upper(event.impact) != "HIGH") {
    return false;
  }
  return std::any_of(config_.watched_events.begin(),
                     config_.watched_events.end(),
                     [&event](const std::string& watched) {
                       return event.name.find(watched) != std::string::npos;
                     });
}

std::size_t NewsGuard::loadCalendar(const std::vector<NewsEvent>& events) {
  auto next = std::make_shared<std::vector<NewsEvent>>();
  for (const NewsEvent& event : events) {
    if (retains(event)) {
      next->push_back(event);
    }
  }
  const std::size_t kept = next->size();

  std::shared_ptr<const std::vector<NewsEvent>> published = std::move(next);
  {
    std::unique_lock lock(mutex_);
    calendar_.swap(published);
  }

  std::cout << "[NewsGuard] Loaded " << kept << " high-impact event(s) of "
            << events.size() << ".\n";
  return kept;
}

bool NewsGuard::addEvent(const NewsEvent& event) {
  if (!retains(event)) {
    return false;
  }
  std::unique_lock lock(mutex_);
  auto next = std::make_shared<std::vector<NewsEvent>>(*calendar_);
  next->push_back(event);
  calendar_ = std::move(next);
  return true;
}

std::size_t NewsGuard::pruneBefore(Timestamp instant) {
  const auto expired = [this, instant](const NewsEvent& event) {
    return event.time + config_.block_after < instant;
  };

  std::unique_lock lock(mutex_);
  const auto removed = static_cast<std::size_t>(
      std::count_if(calendar_->begin(), calendar_->end(), expired));
  if (removed == 0) {
    return 0;
  }

  auto next = std::make_shared<std::vector<NewsEvent>>();
  next->reserve(calendar_->size() - removed);
  std::remove_copy_if(calendar_->begin(), calendar_->end(),
                      std::back_inserter(*next), expired);
  calendar_ = std::move(next);
  return removed;
}

std::size_t NewsGuard::calendarSize() const {
  std::shared_lock lock(mutex_);
  return calendar_->size();
}

// -----------------------------------------------------------------------------
// blackoutFor: closed interval [time - before, time + after]
// -----------------------------------------------------------------------------
std::optional<NewsEvent> NewsGuard::blackoutFor(const std::string& symbol,
                                                Timestamp instant) const {
  if (!config_.enabled) {
    return std::nullopt;
  }

  std::shared_ptr<const std::vector<NewsEvent>> snapshot;
  {
    std::shared_lock lock(mutex_);
    snapshot = calendar_;
  }

  for (const NewsEvent& event : *snapshot) {
    if (!affectsSymbol(symbol, event.currency)) {
      continue;
    }
    const Timestamp start = event.time - config_.block_before;
    const Timestamp end = event.time + config_.block_after;
    if (start <= instant && instant <= end) {
      return event;
    }
  }
  return std::nullopt;
}

bool NewsGuard::affectsSymbol(const std::string& symbol,
                              const std::string& currency) {
  const std::string sym = upper(symbol);
  const std::string ccy = upper(currency);

  if (sym.find("XAU") != std::string::npos ||
      sym.find("GOLD") != std::string::npos) {
    return ccy == "USD";
  }
  if (sym.size() >= 6) {
    return ccy == sym.substr(0, 3) || ccy == sym.substr(3, 3);
  }
  return false;
}

}  // namespace tradegate
