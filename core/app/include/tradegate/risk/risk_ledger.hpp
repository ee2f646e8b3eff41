#pragma once

#include "tradegate/domain/decision.hpp"
#include "tradegate/domain/ledger_settings.hpp"
#include "tradegate/domain/open_commitment.hpp"
#include "tradegate/domain/risk_ledger_view.hpp"
#include "tradegate/domain/risk_limits.hpp"
#include "tradegate/events/event_types.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <absl/time/civil_time.h>

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tradegate {

// Budget comparisons allow this much floating-point slack so that an exact
// fit (e.g. 0.1 + 0.2 of a 0.3R budget) is not refused by rounding.
constexpr double kRiskTolerance = 1e-9;

enum class ReservationResult {
  Reserved,
  InsufficientBudget,   // Would breach max_concurrent_r or the daily R budget
  DuplicateCommitment,  // Id already open
  InvalidRisk,          // risk_r not finite or <= 0
};

enum class ReleaseResult {
  Released,
  UnknownCommitment,  // Not open: double close or bookkeeping bug upstream
  InvalidFraction,    // reduce() fraction outside (0, 1)
  InvalidPnl,         // Realized pnl (R or dollars) not finite
};

const char* toString(ReservationResult result);
const char* toString(ReleaseResult result);

// -----------------------------------------------------------------------------
// RiskLedger: one account's live risk budget
// -----------------------------------------------------------------------------
//
// @brief  Owns the open commitments, the daily realized totals, and the
//         trailing realized-pnl window of a single account, and performs
//         every mutation of them atomically.
//
// @details
// Stored state (everything else is derived in snapshots):
//   daily_pnl_r_ / daily_pnl_dollars_  realized since the last rollover
//   daily_trade_count_                 reservations since the last rollover
//   open_                              id → OpenCommitment (risk_r > 0)
//   trailing_                          (closed_at, pnl_r) within the horizon
//   current_day_                       account-day of the last rollover
//
// Account-day and rollover:
//   The account-day is the calendar day in settings.reference_zone after
//   shifting back by settings.rollover_time. rollover() resets the daily
//   totals, keeps open commitments (open trades survive the boundary), and
//   trims the trailing window to the configured lookback. It happens at
//   most once per account-day. Every other operation first compares
//   current_day_ with the account-day of clock.now_ms() and performs a
//   catch-up rollover if a boundary was missed (e.g. the process was down).
//
// Fused check-and-reserve:
//   reserveIf() computes the view, runs the caller's decision function on
//   it, and (if approved) reserves, all inside one exclusive critical
//   section. No other reservation can slip between the check and the
//   commit, so the concurrent-risk invariant holds under any interleaving.
//
// Views after a mutation:
//   The mutating calls take an optional RiskLedgerView* and fill it from
//   the same critical section, so a published update shows exactly the
//   state that mutation produced.
//
// Thread model:
//   One std::shared_mutex per ledger. reserve/reserveIf/release/reduce/
//   rollover/replaceLimits take it exclusively. snapshot() takes it shared
//   (concurrent snapshots do not block each other) and only upgrades to
//   exclusive when a catch-up rollover is due. A snapshot never observes a
//   half-applied mutation.
//
// Ownership:
//   Owned by the AdmissionEngine's per-account runtime. Holds a reference
//   to the engine's ITimeProvider, which must outlive it.
// -----------------------------------------------------------------------------
class RiskLedger {
 public:
  // Receives the ledger's current view; returns the gate's verdict.
  using Decider =
      std::function<domain::GateDecision(const domain::RiskLedgerView&)>;

  // Called only when a reservation is about to be made.
  using IdSource = std::function<CommitmentId()>;

  // -------------------------------------------------------------------------
  // GatedReservation: result of reserveIf()
  // -------------------------------------------------------------------------
  // decision:       what the Decider returned.
  // reservation:    Reserved when the commitment was added. When the
  //                 decision was a denial, InsufficientBudget (nothing was
  //                 attempted).
  // commitment_id:  id of the new commitment, 0 unless Reserved.
  // view:           ledger state right after the reservation (only set
  //                 when Reserved).
  // -------------------------------------------------------------------------
  struct GatedReservation {
    domain::GateDecision decision;
    ReservationResult reservation{ReservationResult::InsufficientBudget};
    CommitmentId commitment_id{0};
    domain::RiskLedgerView view;
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  account_id  Label carried into every view.
  // @param  settings    Reference zone, rollover time, drawdown lookback.
  // @param  limits      Initial limits (validated; ConfigError if invalid).
  // @param  clock       "Now" for catch-up rollovers and default close
  //                     stamps. Must outlive the ledger.
  //
  // The ledger starts empty with current_day_ = account-day of clock now.
  // -------------------------------------------------------------------------
  RiskLedger(std::string account_id, domain::LedgerSettings settings,
             const domain::RiskLimits& limits, const ITimeProvider& clock);

  RiskLedger(const RiskLedger&) = delete;
  RiskLedger& operator=(const RiskLedger&) = delete;
  RiskLedger(RiskLedger&&) = delete;
  RiskLedger& operator=(RiskLedger&&) = delete;

  // -------------------------------------------------------------------------
  // snapshot()
  // -------------------------------------------------------------------------
  // @brief  Consistent read of every derived quantity plus current limits.
  //
  // Thread-safety: Concurrent with other snapshots; excluded from writers.
  // Side-effects:  May perform a catch-up rollover.
  // -------------------------------------------------------------------------
  domain::RiskLedgerView snapshot();

  // -------------------------------------------------------------------------
  // reserve(commitment)
  // -------------------------------------------------------------------------
  // @brief  Adds the commitment and increments the daily trade count.
  //
  // @return InvalidRisk if risk_r is not finite or <= 0.
  //         InsufficientBudget if active_risk_r + risk_r > max_concurrent_r,
  //         or daily_risk_used_r + risk_r > max_daily_risk_r.
  //         DuplicateCommitment if the id is already open.
  //         On any refusal the ledger is unchanged.
  // -------------------------------------------------------------------------
  ReservationResult reserve(const domain::OpenCommitment& commitment);

  // -------------------------------------------------------------------------
  // reserveIf(symbol, opened_at, decide, next_id)
  // -------------------------------------------------------------------------
  // @brief  Fused check-and-reserve under one exclusive lock.
  //
  // @details
  // 1. catch-up rollover if due; 2. build the view; 3. decision =
  // decide(view); 4. if approved, reserve decision.effective_risk_r under id
  // next_id() with the same budget checks as reserve(). Step 4 can only
  // fail if the Decider approved something the budget does not allow; the
  // result then reports InsufficientBudget and nothing changes.
  // -------------------------------------------------------------------------
  GatedReservation reserveIf(const std::string& symbol, Timestamp opened_at,
                             const Decider& decide, const IdSource& next_id);

  // -------------------------------------------------------------------------
  // release(id, pnl_r, pnl_dollars [, closed_at])
  // -------------------------------------------------------------------------
  // @brief  Full close: removes the commitment, adds the realized pnl to the
  //         daily totals, appends (closed_at, pnl_r) to the trailing window.
  //
  // @return InvalidPnl if either pnl is not finite, UnknownCommitment if
  //         the id is not open; nothing changes in both cases.
  //
  // The three-argument form stamps the close with clock now.
  // -------------------------------------------------------------------------
  ReleaseResult release(CommitmentId id, double realized_pnl_r,
                        double realized_pnl_dollars);
  ReleaseResult release(CommitmentId id, double realized_pnl_r,
                        double realized_pnl_dollars, Timestamp closed_at,
                        domain::RiskLedgerView* after = nullptr);

  // -------------------------------------------------------------------------
  // reduce(id, fraction [, pnl_r, pnl_dollars, closed_at])
  // -------------------------------------------------------------------------
  // @brief  Partial close: risk_r *= (1 - fraction), and the pnl realized
  //         by the closed portion is added to the daily totals. A non-zero
  //         pnl_r also appends (closed_at, pnl_r) to the trailing window.
  //         The final release() reports only the remainder's pnl.
  //
  // @return InvalidFraction unless 0 < fraction < 1, InvalidPnl for a
  //         non-finite pnl, UnknownCommitment if the id is not open.
  // -------------------------------------------------------------------------
  ReleaseResult reduce(CommitmentId id, double fraction);
  ReleaseResult reduce(CommitmentId id, double fraction,
                       double realized_pnl_r, double realized_pnl_dollars,
                       Timestamp closed_at,
                       domain::RiskLedgerView* after = nullptr);

  // -------------------------------------------------------------------------
  // rollover(boundary)
  // -------------------------------------------------------------------------
  // @brief  Starts the account-day containing `boundary`.
  // @return false (no-op) if that account-day was already started; `after`
  //         is then left untouched.
  // -------------------------------------------------------------------------
  bool rollover(Timestamp boundary, domain::RiskLedgerView* after = nullptr);

  // Validates (ConfigError) and swaps in new limits between evaluations.
  void replaceLimits(const domain::RiskLimits& limits,
                     domain::RiskLedgerView* after = nullptr);

  std::shared_ptr<const domain::RiskLimits> limits() const;
  std::optional<domain::OpenCommitment> commitment(CommitmentId id) const;
  const std::string& accountId() const { return account_id_; }

 private:
  struct PnlEntry {
    Timestamp closed_at;
    absl::CivilDay day;
    double pnl_r;
  };

  Timestamp now() const;
  absl::CivilDay dayOf(Timestamp instant) const;

  // All *Locked helpers require mutex_ held exclusively (rolloverDueLocked
  // and buildViewLocked only need it shared).
  bool rolloverDueLocked(Timestamp now) const;
  void catchUpLocked(Timestamp now);
  void rolloverLocked(absl::CivilDay day, const char* cause);
  void trimTrailingLocked();
  double activeRiskLocked() const;
  domain::RiskLedgerView buildViewLocked(Timestamp now) const;
  ReservationResult reserveLocked(const domain::OpenCommitment& commitment);
  ReleaseResult releaseLocked(CommitmentId id, double pnl_r,
                              double pnl_dollars, Timestamp closed_at);

  const std::string account_id_;
  const domain::LedgerSettings settings_;
  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;

  std::shared_ptr<const domain::RiskLimits> limits_;
  absl::CivilDay current_day_;
  double daily_pnl_r_{0.0};
  double daily_pnl_dollars_{0.0};
  int daily_trade_count_{0};
  std::unordered_map<CommitmentId, domain::OpenCommitment> open_;
  std::deque<PnlEntry> trailing_;
};

}  // namespace tradegate
