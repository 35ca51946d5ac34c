#pragma once

#include "oms/ports/i_venue_endpoint.hpp"
#include "oms/sim/simulated_market.hpp"
#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// SimulatedVenueEndpoint
// -----------------------------------------------------------------------------
//
// @brief  IVenueEndpoint that executes against a SimulatedMarket.
//
// @details
// execute() takes liquidity from the named venue's book for the order's
// symbol, honoring the limit price when one is set, and reports the
// resulting fill at its average price. Execution ids are "<venue>-<seq>"
// with one sequence shared by all venues.
//
// Failure injection for exercising the dispatcher's fallback path:
//   setVenueDown(venue, true)  every call to the venue throws VenueFailure.
//   setLatency(venue, ms)      each call sleeps for ms before executing. A
//                              latency beyond the caller's deadline sleeps
//                              for the deadline and throws a timed-out
//                              VenueFailure.
// A call that finds nothing executable also throws VenueFailure.
//
// Thread model:
//   Safe for concurrent calls, including to the same venue.
// -----------------------------------------------------------------------------
class SimulatedVenueEndpoint final : public ports::IVenueEndpoint {
 public:
  SimulatedVenueEndpoint(SimulatedMarket& market, const ITimeProvider& clock);

  SimulatedVenueEndpoint(const SimulatedVenueEndpoint&) = delete;
  SimulatedVenueEndpoint& operator=(const SimulatedVenueEndpoint&) = delete;

  domain::ExecutionReport execute(const domain::VenueOrder& order,
                                  std::int64_t timeout_ms) override;

  void setVenueDown(const domain::Venue& venue, bool down);
  void setLatency(const domain::Venue& venue, std::int64_t latency_ms);

  std::uint64_t executionCount() const { return sequence_.load(); }

 private:
  struct VenueBehaviour {
    bool down{false};
    std::int64_t latency_ms{0};
  };

  VenueBehaviour behaviour(const domain::Venue& venue) const;

  SimulatedMarket& market_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::map<domain::Venue, VenueBehaviour> behaviour_;
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace oms
