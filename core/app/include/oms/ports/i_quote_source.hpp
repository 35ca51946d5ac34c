#pragma once

#include "oms/domain/market_data.hpp"

#include <string>
#include <vector>

namespace oms {
namespace ports {

// -----------------------------------------------------------------------------
// IQuoteSource: per-venue order book snapshots
// -----------------------------------------------------------------------------
//
// @brief  Returns the current book for `symbol` on each requested venue.
//
// @details
// Venues with no book may be omitted from the result. Freshness is the
// source's responsibility: the core never caches a snapshot across calls,
// and every routing decision (including a fallback) asks again.
//
// Thread model: must be safe for concurrent calls.
// -----------------------------------------------------------------------------
class IQuoteSource {
 public:
  virtual ~IQuoteSource() = default;

  virtual domain::QuoteSnapshot quotes(
      const std::string& symbol, const std::vector<domain::Venue>& venues) = 0;
};

}  // namespace ports
}  // namespace oms
