#include "tradegate/risk/risk_ledger.hpp"
#include "tradegate/time/time_utils.hpp"
#include "tradegate/time/time_zone.hpp"

#include <absl/time/civil_time.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>

namespace tradegate {

const char* toString(ReservationResult result) {
  switch (result) {
    case ReservationResult::Reserved:
      return "Reserved";
    case ReservationResult::InsufficientBudget:
      return "InsufficientBudget";
    case ReservationResult::DuplicateCommitment:
      return "DuplicateCommitment";
    case ReservationResult::InvalidRisk:
      return "InvalidRisk";
  }
  return "Unknown";
}

const char* toString(ReleaseResult result) {
  switch (result) {
    case ReleaseResult::Released:
      return "Released";
    case ReleaseResult::UnknownCommitment:
      return "UnknownCommitment";
    case ReleaseResult::InvalidFraction:
      return "InvalidFraction";
    case ReleaseResult::InvalidPnl:
      return "InvalidPnl";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Constructor: validate limits, anchor the ledger to today's account-day
// -----------------------------------------------------------------------------
RiskLedger::RiskLedger(std::string account_id,
                       domain::LedgerSettings settings,
                       const domain::RiskLimits& limits,
                       const ITimeProvider& clock)
    : account_id_(std::move(account_id)),
      settings_(std::move(settings)),
      clock_(clock) {
  domain::validate(limits);
  limits_ = std::make_shared<const domain::RiskLimits>(limits);
  current_day_ = dayOf(now());
}

Timestamp RiskLedger::now() const { return ms_to_timestamp(clock_.now_ms()); }

absl::CivilDay RiskLedger::dayOf(Timestamp instant) const {
  return accountDay(instant, settings_.reference_zone,
                    settings_.rollover_time);
}

// -----------------------------------------------------------------------------
// snapshot: shared lock in the common case, exclusive only to catch up
// -----------------------------------------------------------------------------
domain::RiskLedgerView RiskLedger::snapshot() {
  const Timestamp t = now();
  {
    std::shared_lock lock(mutex_);
    if (!rolloverDueLocked(t)) {
      return buildViewLocked(t);
    }
  }

  // Another thread may roll over between the two locks; catchUpLocked()
  // re-checks, so the rollover still happens exactly once.
  std::unique_lock lock(mutex_);
  catchUpLocked(t);
  return buildViewLocked(t);
}

ReservationResult RiskLedger::reserve(
    const domain::OpenCommitment& commitment) {
  std::unique_lock lock(mutex_);
  catchUpLocked(now());
  return reserveLocked(commitment);
}

// -----------------------------------------------------------------------------
// reserveIf: view → decide → reserve, one critical section
// -----------------------------------------------------------------------------
RiskLedger::GatedReservation RiskLedger::reserveIf(const std::string& symbol,
                                                   Timestamp opened_at,
                                                   const Decider& decide,
                                                   const IdSource& next_id) {
  const Timestamp t = now();
  std::unique_lock lock(mutex_);
  catchUpLocked(t);

  GatedReservation result;
  result.decision = decide(buildViewLocked(t));
  if (!result.decision.approved) {
    return result;
  }

  domain::OpenCommitment commitment;
  commitment.id = next_id();
  commitment.symbol = symbol;
  commitment.risk_r = result.decision.effective_risk_r;
  commitment.opened_at = opened_at;

  result.reservation = reserveLocked(commitment);
  if (result.reservation == ReservationResult::Reserved) {
    result.commitment_id = commitment.id;
    result.view = buildViewLocked(t);
  }
  return result;
}

ReleaseResult RiskLedger::release(CommitmentId id, double realized_pnl_r,
                                  double realized_pnl_dollars) {
  return release(id, realized_pnl_r, realized_pnl_dollars, now());
}

ReleaseResult RiskLedger::release(CommitmentId id, double realized_pnl_r,
                                  double realized_pnl_dollars,
                                  Timestamp closed_at,
                                  domain::RiskLedgerView* after) {
  if (!std::isfinite(realized_pnl_r) || !std::isfinite(realized_pnl_dollars)) {
    return ReleaseResult::InvalidPnl;
  }

  const Timestamp t = now();
  std::unique_lock lock(mutex_);
  catchUpLocked(t);
  const ReleaseResult result =
      releaseLocked(id, realized_pnl_r, realized_pnl_dollars, closed_at);
  if (result == ReleaseResult::Released && after != nullptr) {
    *after = buildViewLocked(t);
  }
  return result;
}

ReleaseResult RiskLedger::reduce(CommitmentId id, double fraction) {
  return reduce(id, fraction, 0.0, 0.0, now());
}

// -----------------------------------------------------------------------------
// reduce: shrink the open risk and book the closed portion's pnl
// -----------------------------------------------------------------------------
ReleaseResult RiskLedger::reduce(CommitmentId id, double fraction,
                                 double realized_pnl_r,
                                 double realized_pnl_dollars,
                                 Timestamp closed_at,
                                 domain::RiskLedgerView* after) {
  if (!(fraction > 0.0 && fraction < 1.0)) {
    return ReleaseResult::InvalidFraction;
  }
  if (!std::isfinite(realized_pnl_r) || !std::isfinite(realized_pnl_dollars)) {
    return ReleaseResult::InvalidPnl;
  }

  const Timestamp t = now();
  std::unique_lock lock(mutex_);
  catchUpLocked(t);

  auto it = open_.find(id);
  if (it == open_.end()) {
    return ReleaseResult::UnknownCommitment;
  }
  it->second.risk_r *= (1.0 - fraction);

  daily_pnl_r_ += realized_pnl_r;
  daily_pnl_dollars_ += realized_pnl_dollars;
  if (realized_pnl_r != 0.0) {
    trailing_.push_back(PnlEntry{closed_at, dayOf(closed_at), realized_pnl_r});
    trimTrailingLocked();
  }

  if (after != nullptr) {
    *after = buildViewLocked(t);
  }
  return ReleaseResult::Released;
}

bool RiskLedger::rollover(Timestamp boundary, domain::RiskLedgerView* after) {
  const absl::CivilDay day = dayOf(boundary);
  std::unique_lock lock(mutex_);
  if (day <= current_day_) {
    return false;
  }
  rolloverLocked(day, "scheduled");
  if (after != nullptr) {
    *after = buildViewLocked(now());
  }
  return true;
}

void RiskLedger::replaceLimits(const domain::RiskLimits& limits,
                               domain::RiskLedgerView* after) {
  domain::validate(limits);
  auto next = std::make_shared<const domain::RiskLimits>(limits);
  const Timestamp t = now();
  std::unique_lock lock(mutex_);
  limits_.swap(next);
  if (after != nullptr) {
    catchUpLocked(t);
    *after = buildViewLocked(t);
  }
}

std::shared_ptr<const domain::RiskLimits> RiskLedger::limits() const {
  std::shared_lock lock(mutex_);
  return limits_;
}

std::optional<domain::OpenCommitment> RiskLedger::commitment(
    CommitmentId id) const {
  std::shared_lock lock(mutex_);
  auto it = open_.find(id);
  if (it == open_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Rollover machinery
// -----------------------------------------------------------------------------
bool RiskLedger::rolloverDueLocked(Timestamp now) const {
  return dayOf(now) > current_day_;
}

void RiskLedger::catchUpLocked(Timestamp now) {
  const absl::CivilDay today = dayOf(now);
  if (today > current_day_) {
    rolloverLocked(today, "catch-up");
  }
}

void RiskLedger::rolloverLocked(absl::CivilDay day, const char* cause) {
  std::cout << "[RiskLedger] " << account_id_ << ": " << cause
            << " rollover " << absl::FormatCivilTime(current_day_) << " -> "
            << absl::FormatCivilTime(day) << " (daily pnl "
            << daily_pnl_r_ << "R, " << daily_trade_count_ << " trade(s), "
            << open_.size() << " open commitment(s) carried).\n";

  current_day_ = day;
  daily_pnl_r_ = 0.0;
  daily_pnl_dollars_ = 0.0;
  daily_trade_count_ = 0;
  trimTrailingLocked();
}

// -----------------------------------------------------------------------------
// trimTrailingLocked: enforce the drawdown lookback horizon
// -----------------------------------------------------------------------------
void RiskLedger::trimTrailingLocked() {
  const domain::DrawdownLookback& lookback = settings_.drawdown_lookback;

  if (lookback.kind() == domain::DrawdownLookback::Kind::Trades) {
    while (trailing_.size() > static_cast<std::size_t>(lookback.length())) {
      trailing_.pop_front();
    }
    return;
  }

  // Days: keep closes whose account-day is one of the last N, today
  // included. Entries are appended in close order but closed_at may be
  // back-dated, so filter rather than pop from the front.
  const absl::CivilDay oldest_kept = current_day_ - (lookback.length() - 1);
  trailing_.erase(std::remove_if(trailing_.begin(), trailing_.end(),
                                 [oldest_kept](const PnlEntry& e) {
                                   return e.day < oldest_kept;
                                 }),
                  trailing_.end());
}

double RiskLedger::activeRiskLocked() const {
  double active = 0.0;
  for (const auto& [id, commitment] : open_) {
    active += commitment.risk_r;
  }
  return active;
}

// -----------------------------------------------------------------------------
// buildViewLocked: every derived quantity, from one consistent state
// -----------------------------------------------------------------------------
domain::RiskLedgerView RiskLedger::buildViewLocked(Timestamp now) const {
  const domain::RiskLimits& limits = *limits_;

  domain::RiskLedgerView view;
  view.account_id = account_id_;
  view.trading_day = absl::FormatCivilTime(current_day_);
  view.as_of = now;

  view.daily_pnl_r = daily_pnl_r_;
  view.daily_pnl_dollars = daily_pnl_dollars_;
  view.trade_count = daily_trade_count_;
  view.active_trades_count = open_.size();
  view.active_risk_r = activeRiskLocked();

  view.max_risk_per_trade = limits.max_risk_per_trade_pct;
  view.max_daily_risk = limits.max_daily_risk_pct;
  view.max_daily_risk_r = limits.maxDailyRiskR();
  view.daily_stop_r = limits.daily_stop_r;
  view.max_concurrent_r = limits.max_concurrent_r;
  view.drawdown_threshold_r = limits.drawdown_threshold_r;

  view.daily_risk_used_r = -std::min(0.0, daily_pnl_r_) + view.active_risk_r;
  view.risk_utilization = limits.max_concurrent_r > 0.0
                              ? view.active_risk_r / limits.max_concurrent_r
                              : 0.0;

  double drawdown = 0.0;
  for (const PnlEntry& entry : trailing_) {
    if (entry.pnl_r < 0.0) {
      drawdown += entry.pnl_r;
    }
  }
  view.drawdown_r = drawdown;
  view.risk_reduction_active = drawdown <= -limits.drawdown_threshold_r;
  view.can_trade = daily_pnl_r_ > limits.daily_stop_r;
  return view;
}

// -----------------------------------------------------------------------------
// reserveLocked: all-or-nothing budget check, then insert
// -----------------------------------------------------------------------------
ReservationResult RiskLedger::reserveLocked(
    const domain::OpenCommitment& commitment) {
  if (!std::isfinite(commitment.risk_r) || commitment.risk_r <= 0.0) {
    return ReservationResult::InvalidRisk;
  }
  if (open_.count(commitment.id) != 0) {
    return ReservationResult::DuplicateCommitment;
  }

  const domain::RiskLimits& limits = *limits_;
  const double active = activeRiskLocked();
  const double daily_used = -std::min(0.0, daily_pnl_r_) + active;

  if (active + commitment.risk_r > limits.max_concurrent_r + kRiskTolerance ||
      daily_used + commitment.risk_r >
          limits.maxDailyRiskR() + kRiskTolerance) {
    return ReservationResult::InsufficientBudget;
  }

  open_.emplace(commitment.id, commitment);
  ++daily_trade_count_;
  return ReservationResult::Reserved;
}

ReleaseResult RiskLedger::releaseLocked(CommitmentId id, double pnl_r,
                                        double pnl_dollars,
                                        Timestamp closed_at) {
  auto it = open_.find(id);
  if (it == open_.end()) {
    return ReleaseResult::UnknownCommitment;
  }
  open_.erase(it);

  daily_pnl_r_ += pnl_r;
  daily_pnl_dollars_ += pnl_dollars;
  trailing_.push_back(PnlEntry{closed_at, dayOf(closed_at), pnl_r});
  trimTrailingLocked();
  return ReleaseResult::Released;
}

}  // namespace tradegate
