#include "tradegate/time/simulation_time_provider.hpp"

namespace tradegate {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): seq_cst store; readers on admission workers see the new
// value on their next now_ms().
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

}  // namespace tradegate
