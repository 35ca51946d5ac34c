#pragma once

#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time only moves when told to.
//
// @details
// Tests construct it at the start of a scheduling window, call
// AlgorithmicScheduler::tick(), advance_by() one slice interval, tick again,
// and so on. Monotonicity is the caller's responsibility.
//
// Thread model:
//   Backed by std::atomic<int64_t>; reads and writes are safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace oms
