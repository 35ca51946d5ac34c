#pragma once

#include "oms/domain/order.hpp"

#include <map>
#include <string>
#include <vector>

namespace oms {
namespace domain {

using Venue = std::string;

// -----------------------------------------------------------------------------
// PriceLevel / OrderBookSnapshot
// -----------------------------------------------------------------------------
// One venue's book for one symbol at one instant. bids are sorted best
// (highest) first, asks best (lowest) first; the Router walks them in the
// order given.
// -----------------------------------------------------------------------------
struct PriceLevel {
  Price price{0.0};
  Quantity quantity{0};
};

struct OrderBookSnapshot {
  std::vector<PriceLevel> bids;
  std::vector<PriceLevel> asks;
};

// Per-venue snapshots returned by IQuoteSource::quotes(). Treated as an
// immutable per-call input; nothing in the core caches it.
using QuoteSnapshot = std::map<Venue, OrderBookSnapshot>;

// Mid of the best bid/ask, or whichever side exists. 0.0 for an empty book.
Price midPrice(const OrderBookSnapshot& book);

}  // namespace domain
}  // namespace oms
