#pragma once

#include "tradegate/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// LedgerFaultEvent: a bookkeeping request the ledger refused
// -----------------------------------------------------------------------------
//
// @brief  Raised when a close names a commitment that is not open, a
//         reservation id is already open, or a partial close fraction is
//         outside (0, 1]. The ledger is unchanged in every case.
//
// @details
//   - account_id:    Account the request was addressed to.
//   - commitment_id: The offending id.
//   - fault:         Result code name ("UnknownCommitment",
//                    "DuplicateCommitment", "InvalidFraction",
//                    "InvalidPnl", "UnknownAccount").
//   - detail:        Human-readable description, also written to stderr.
// -----------------------------------------------------------------------------
struct LedgerFaultEvent {
  std::string account_id;
  CommitmentId commitment_id{0};
  std::string fault;
  std::string detail;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradegate
