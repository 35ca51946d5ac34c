#include "oms/sim/simulated_venue_endpoint.hpp"
#include "oms/core/error.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace oms {

SimulatedVenueEndpoint::SimulatedVenueEndpoint(SimulatedMarket& market,
                                               const ITimeProvider& clock)
    : market_(market), clock_(clock) {}

void SimulatedVenueEndpoint::setVenueDown(const domain::Venue& venue,
                                          bool down) {
  std::lock_guard lock(mutex_);
  behaviour_[venue].down = down;
  std::cout << "[SimulatedVenue] " << venue << (down ? " DOWN" : " UP")
            << "\n";
}

void SimulatedVenueEndpoint::setLatency(const domain::Venue& venue,
                                        std::int64_t latency_ms) {
  std::lock_guard lock(mutex_);
  behaviour_[venue].latency_ms = latency_ms;
}

SimulatedVenueEndpoint::VenueBehaviour SimulatedVenueEndpoint::behaviour(
    const domain::Venue& venue) const {
  std::lock_guard lock(mutex_);
  auto it = behaviour_.find(venue);
  return it == behaviour_.end() ? VenueBehaviour{} : it->second;
}

// -----------------------------------------------------------------------------
// execute(): one aggressive order against the simulated book
// -----------------------------------------------------------------------------
domain::ExecutionReport SimulatedVenueEndpoint::execute(
    const domain::VenueOrder& order, std::int64_t timeout_ms) {
  const VenueBehaviour b = behaviour(order.venue);

  if (b.down) {
    throw VenueFailure(order.venue, "venue " + order.venue + " is down");
  }
  if (b.latency_ms > 0) {
    if (timeout_ms > 0 && b.latency_ms > timeout_ms) {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
      throw VenueFailure(order.venue,
                         "venue " + order.venue + " exceeded " +
                             std::to_string(timeout_ms) + "ms deadline",
                         true);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(b.latency_ms));
  }

  const TakeResult taken = market_.take(order.venue, order.symbol, order.side,
                                        order.quantity, order.limit_price);
  if (taken.filled <= 0) {
    throw VenueFailure(order.venue, "no executable liquidity for " +
                                        order.symbol + " on " + order.venue);
  }

  domain::ExecutionReport report;
  report.execution_id =
      order.venue + "-" + std::to_string(sequence_.fetch_add(1) + 1);
  report.order_id = order.order_id;
  report.slice_id = order.slice_id;
  report.quantity = taken.filled;
  report.price = taken.average_price;
  report.venue = order.venue;
  report.timestamp_ms = clock_.now_ms();
  return report;
}

}  // namespace oms
