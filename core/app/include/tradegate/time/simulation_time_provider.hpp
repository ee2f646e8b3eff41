#pragma once

#include "tradegate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the
//         replay gateway (or a test) instead of read from the system clock.
//
// @details
// The ReplayGateway reads a record stamped timestamp_ms and calls
// advance_time(timestamp_ms) before handing the record to the engine. Any
// ledger that checks for a missed rollover during that record sees the
// record's time, so a replayed week rolls over exactly as the live week
// did.
//
// Thread model:
//   advance_time() single writer; now_ms() any number of readers. Plain
//   64-bit atomic, no mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms (1970-01-01T00:00:00Z). Tests normally advance the clock
  // to a meaningful instant before constructing ledgers.
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given epoch milliseconds.
  //
  // @details
  // Monotonicity is the caller's responsibility. Moving the clock backwards
  // never undoes a rollover: the ledger only ever rolls forward.
  //
  // Thread-safety: Safe from any thread; intended single writer.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradegate
