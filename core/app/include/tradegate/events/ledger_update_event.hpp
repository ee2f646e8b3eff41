#pragma once

#include "tradegate/domain/risk_ledger_view.hpp"

#include <cstdint>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// LedgerUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of an account's ledger taken right after a mutation
//         (reservation, close, partial close, rollover, limits reload).
//
// @details
// `cause` names the mutation: "reserve", "close", "reduce", "rollover" or
// "limits". The view is a full copy, so the event stays valid however the
// ledger moves on. Under concurrent workers two updates for one account can
// be published out of mutation order; the view, not the arrival order, is
// authoritative.
// -----------------------------------------------------------------------------
struct LedgerUpdateEvent {
  domain::RiskLedgerView view;
  std::string cause;
  std::uint64_t sequence_id{0};
};

}  // namespace tradegate
