#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Absolute UTC instant. Every record entering the engine carries one; local
// wall-clock views are derived on demand with the zone of whoever asks
// (session window, account reference zone).
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// Identifier of one open commitment (one admitted trade holding budget).
// 0 is reserved as "unset"; the CommitmentIdGenerator starts at 1.
using CommitmentId = std::uint64_t;

// -----------------------------------------------------------------------------
// CandidateSignal
// -----------------------------------------------------------------------------
// Responsibility: A fully-formed trade proposal from the (external) signal
// generator, asking to spend proposed_risk_r of the account's budget.
// Why in architecture: Input to AdmissionController::evaluate(). The engine
// never inspects how the signal was produced.
// -----------------------------------------------------------------------------
struct CandidateSignal {
  std::string account_id;       // Which account's ledger to charge
  std::string signal_id;        // Caller's reference, echoed in decisions
  std::string symbol;           // Instrument (session windows are per symbol)
  Timestamp timestamp{};        // When the signal wants to execute (UTC)
  double proposed_risk_r{0.0};  // Requested risk in R-multiples
};

// -----------------------------------------------------------------------------
// TradeClose
// -----------------------------------------------------------------------------
// Responsibility: Reports that an admitted trade was closed (fully or in
// part) with the given realized result.
// Why in architecture: Flows straight to RiskLedger::release()/reduce(),
// bypassing the admission gates: a close is never refused.
//
// closed_fraction: 1.0 (default) is a full close: the commitment is
// released and the pnl recorded. A value in (0, 1) is a partial close: the
// commitment's risk shrinks proportionally and the pnl fields hold what the
// closed portion realized, recorded at once.
// -----------------------------------------------------------------------------
struct TradeClose {
  std::string account_id;
  CommitmentId commitment_id{0};
  double realized_pnl_r{0.0};
  double realized_pnl_dollars{0.0};
  Timestamp closed_at{};
  double closed_fraction{1.0};
};

// -----------------------------------------------------------------------------
// RolloverRequest
// -----------------------------------------------------------------------------
// Responsibility: Explicit daily boundary trigger for one account (normally
// from a scheduler). Missed boundaries are also caught up automatically on
// the next ledger access, so this is an optimisation, not a requirement.
// -----------------------------------------------------------------------------
struct RolloverRequest {
  std::string account_id;
  Timestamp boundary{};
};

}  // namespace tradegate
