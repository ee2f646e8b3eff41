#pragma once

#include "tradegate/time/i_time_provider.hpp"

namespace tradegate {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used when the engine serves live signal streams. Ledger rollovers then
// follow the real account-day boundary.
//
// Thread model: system_clock::now() is safe from any thread; no mutex.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradegate
