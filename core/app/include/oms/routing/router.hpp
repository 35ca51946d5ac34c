#pragma once

#include "oms/config/engine_config.hpp"
#include "oms/domain/market_data.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/routing_plan.hpp"

#include <set>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// Router: smart order routing over per-venue book snapshots
// -----------------------------------------------------------------------------
//
// @brief  Turns (order snapshot, quote snapshot, RouterConfig) into a
//         RoutingPlan. Pure: never touches the order or any shared state, so
//         a retry or fallback can simply call it again.
//
// @details
// For every eligible venue the router walks the relevant side of the book
// (asks for a BUY, bids for a SELL) and computes the VWAP obtainable for the
// requested quantity, together with the depth actually available. Each
// level contributes floor(level.quantity * aggressiveness).
//
// Ranking:
//   BUY ascending VWAP, SELL descending VWAP, with the strategy adjustments
//   described on RoutingStrategy. Ties go to the lower expected latency, then
//   to the earlier venue in RouterConfig::venues.
//
// Allocation:
//   If the best venue alone covers the quantity (and the strategy is not
//   CUSTOM) the plan has a single route. Otherwise the quantity is split
//   greedily down the ranking until it is covered or the venues run out.
//   Each route's expected_price is the VWAP of its own allocation.
//
// A plan that covers less than the requested quantity is still a valid
// plan; confidence reports the covered fraction. An empty plan means no
// eligible venue showed any liquidity.
//
// Thread model:
//   route() is const and may be called from any thread concurrently.
// -----------------------------------------------------------------------------
class Router {
 public:
  explicit Router(config::RouterConfig config);

  // Routes `quantity` of `order`. `excluded` venues are never used; the
  // dispatcher passes failed venues here when building a fallback plan.
  domain::RoutingPlan route(const domain::Order& order,
                            domain::Quantity quantity,
                            const domain::QuoteSnapshot& quotes,
                            const std::set<domain::Venue>& excluded = {}) const;

  // Routes the order's remaining quantity.
  domain::RoutingPlan route(const domain::Order& order,
                            const domain::QuoteSnapshot& quotes) const;

  // Configured venues that pass the dark-pool and latency filters, in
  // configuration order. This is the list handed to IQuoteSource::quotes().
  std::vector<domain::Venue> eligibleVenues(
      const std::set<domain::Venue>& excluded = {}) const;

  const config::RouterConfig& config() const { return config_; }

 private:
  struct Candidate {
    const config::VenueProfile* profile{nullptr};
    std::size_t config_index{0};
    std::vector<domain::PriceLevel> levels;
    domain::Quantity available{0};
    domain::Price vwap{0.0};
    double score{0.0};
  };

  bool eligible(const config::VenueProfile& venue) const;

  // true when a should be ranked ahead of b.
  bool ranksBefore(const Candidate& a, const Candidate& b) const;

  config::RouterConfig config_;
};

// -----------------------------------------------------------------------------
// walkBook(levels, quantity)
// -----------------------------------------------------------------------------
// Walks price levels in the given order, filling up to `quantity`. Returns
// {filled, vwap}; vwap is 0.0 when nothing could be filled.
// -----------------------------------------------------------------------------
struct BookWalk {
  domain::Quantity filled{0};
  domain::Price vwap{0.0};
};

BookWalk walkBook(const std::vector<domain::PriceLevel>& levels,
                  domain::Quantity quantity);

}  // namespace oms
