#include "oms/routing/router.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace oms {

namespace {

constexpr double kPriceEpsilon = 1e-9;

const std::vector<domain::PriceLevel>& sideOf(
    const domain::OrderBookSnapshot& book, domain::Side side) {
  return side == domain::Side::Buy ? book.asks : book.bids;
}

}  // namespace

BookWalk walkBook(const std::vector<domain::PriceLevel>& levels,
                  domain::Quantity quantity) {
  BookWalk walk;
  double notional = 0.0;
  for (const auto& level : levels) {
    if (walk.filled >= quantity) {
      break;
    }
    if (level.quantity <= 0 || level.price <= 0.0) {
      continue;
    }
    const domain::Quantity take =
        std::min(level.quantity, quantity - walk.filled);
    notional += level.price * static_cast<double>(take);
    walk.filled += take;
  }
  if (walk.filled > 0) {
    walk.vwap = notional / static_cast<double>(walk.filled);
  }
  return walk;
}

Router::Router(config::RouterConfig config) : config_(std::move(config)) {}

bool Router::eligible(const config::VenueProfile& venue) const {
  if (venue.dark_pool && !config_.enable_dark_pools &&
      config_.routing_strategy != config::RoutingStrategy::DarkPool) {
    return false;
  }
  if (config_.max_venue_latency_ms > 0 &&
      venue.expected_latency_ms > config_.max_venue_latency_ms) {
    return false;
  }
  return true;
}

std::vector<domain::Venue> Router::eligibleVenues(
    const std::set<domain::Venue>& excluded) const {
  std::vector<domain::Venue> out;
  for (const auto& venue : config_.venues) {
    if (eligible(venue) && excluded.count(venue.name) == 0) {
      out.push_back(venue.name);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// ranksBefore(): strategy ordering plus the deterministic tie-breaks
// -----------------------------------------------------------------------------
bool Router::ranksBefore(const Candidate& a, const Candidate& b) const {
  const auto strategy = config_.routing_strategy;

  if (strategy == config::RoutingStrategy::DarkPool &&
      a.profile->dark_pool != b.profile->dark_pool) {
    return a.profile->dark_pool;
  }
  if (strategy == config::RoutingStrategy::Fastest &&
      a.profile->expected_latency_ms != b.profile->expected_latency_ms) {
    return a.profile->expected_latency_ms < b.profile->expected_latency_ms;
  }
  if (std::fabs(a.score - b.score) > kPriceEpsilon) {
    return a.score < b.score;
  }
  if (a.profile->expected_latency_ms != b.profile->expected_latency_ms) {
    return a.profile->expected_latency_ms < b.profile->expected_latency_ms;
  }
  return a.config_index < b.config_index;
}

// -----------------------------------------------------------------------------
// route()
// -----------------------------------------------------------------------------
domain::RoutingPlan Router::route(const domain::Order& order,
                                  const domain::QuoteSnapshot& quotes) const {
  return route(order, order.remaining_quantity, quotes);
}

domain::RoutingPlan Router::route(const domain::Order& order,
                                  domain::Quantity quantity,
                                  const domain::QuoteSnapshot& quotes,
                                  const std::set<domain::Venue>& excluded) const {
  domain::RoutingPlan plan;
  plan.requested_quantity = std::max<domain::Quantity>(quantity, 0);
  if (plan.requested_quantity == 0) {
    plan.confidence = 1.0;
    return plan;
  }

  // --- Candidates: configured, eligible, quoted, with depth ----------------
  std::vector<Candidate> candidates;
  for (std::size_t i = 0; i < config_.venues.size(); ++i) {
    const config::VenueProfile& profile = config_.venues[i];
    if (!eligible(profile) || excluded.count(profile.name) != 0) {
      continue;
    }
    auto it = quotes.find(profile.name);
    if (it == quotes.end()) {
      continue;
    }

    Candidate c;
    c.profile = &profile;
    c.config_index = i;
    for (const auto& level : sideOf(it->second, order.side)) {
      const auto depth = static_cast<domain::Quantity>(std::floor(
          static_cast<double>(level.quantity) * config_.aggressiveness));
      if (depth > 0 && level.price > 0.0) {
        c.levels.push_back(domain::PriceLevel{level.price, depth});
      }
    }
    if (c.levels.empty()) {
      continue;
    }

    const BookWalk walk = walkBook(c.levels, plan.requested_quantity);
    c.available = walk.filled;
    c.vwap = walk.vwap;

    double effective = c.vwap;
    if (config_.routing_strategy == config::RoutingStrategy::LowestCost) {
      effective += order.side == domain::Side::Buy ? profile.fee_per_share
                                                   : -profile.fee_per_share;
    }
    // Lower score ranks first on both sides.
    c.score = order.side == domain::Side::Buy ? effective : -effective;
    candidates.push_back(std::move(c));
  }

  if (candidates.empty()) {
    std::cerr << "[Router] WARNING: no liquidity for order " << order.order_id
              << " " << order.symbol << " on any eligible venue\n";
    return plan;
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [&](const Candidate& a, const Candidate& b) {
                     return ranksBefore(a, b);
                   });

  // --- Allocation -----------------------------------------------------------
  const bool single =
      candidates.front().available >= plan.requested_quantity &&
      config_.routing_strategy != config::RoutingStrategy::Custom;

  domain::Quantity left = plan.requested_quantity;
  for (const auto& c : candidates) {
    if (left == 0) {
      break;
    }
    const domain::Quantity take = std::min(c.available, left);
    if (take <= 0) {
      continue;
    }
    const BookWalk allocated = walkBook(c.levels, take);

    domain::VenueRoute line;
    line.venue = c.profile->name;
    line.quantity = allocated.filled;
    line.expected_price = allocated.vwap;
    line.priority = static_cast<int>(plan.routes.size()) + 1;
    plan.routes.push_back(std::move(line));

    left -= allocated.filled;
    if (single) {
      break;
    }
  }

  plan.routed_quantity = plan.requested_quantity - left;
  plan.primary_venue = plan.routes.front().venue;
  plan.confidence = static_cast<double>(plan.routed_quantity) /
                    static_cast<double>(plan.requested_quantity);

  std::cout << "[Router] order " << order.order_id << " " << order.symbol
            << " " << domain::toString(order.side) << " "
            << plan.requested_quantity << " -> " << plan.routes.size()
            << " route(s), primary=" << plan.primary_venue
            << ", confidence=" << plan.confidence << "\n";
  return plan;
}

}  // namespace oms
