#pragma once

#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for order timestamps, expiry and algorithmic slice
//         scheduling.
//
// @details
//   LiveTimeProvider        wall clock (std::chrono::system_clock).
//   SimulationTimeProvider  set explicitly; lets tests walk a TWAP schedule
//                           through a 25 minute window in microseconds.
//
// Time is int64 milliseconds since the Unix epoch throughout the core and on
// the JSON wire.
//
// Thread model:
//   now_ms() must be safe for concurrent calls.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace oms
