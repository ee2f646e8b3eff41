#pragma once

#include "tradegate/events/event_types.hpp"

#include <atomic>

namespace tradegate {

// -----------------------------------------------------------------------------
// CommitmentIdGenerator: process-wide source of commitment ids
// -----------------------------------------------------------------------------
//
// @brief  Monotonically increasing ids shared by every account, so an id
//         identifies a commitment without naming its account.
//
// @details
// Starts at 1; 0 means "no commitment" in AdmissionDecision. Relaxed
// ordering suffices: uniqueness is the only guarantee required.
//
// Thread model:
//   next_id() is safe from any thread. Called from inside the ledger's
//   critical section, and only for approved reservations, so ids of
//   committed reservations have no gaps caused by denials.
//
// Ownership:
//   Value member of AdmissionEngine; injected by reference into each
//   AdmissionController.
// -----------------------------------------------------------------------------
class CommitmentIdGenerator {
 public:
  CommitmentIdGenerator() = default;

  CommitmentIdGenerator(const CommitmentIdGenerator&) = delete;
  CommitmentIdGenerator& operator=(const CommitmentIdGenerator&) = delete;
  CommitmentIdGenerator(CommitmentIdGenerator&&) = delete;
  CommitmentIdGenerator& operator=(CommitmentIdGenerator&&) = delete;

  CommitmentId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<CommitmentId> next_id_{1};
};

}  // namespace tradegate
