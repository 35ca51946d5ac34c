#pragma once

#include "oms/domain/order.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace oms {
namespace ports {

// -----------------------------------------------------------------------------
// IMarketVolumeSource: traded volume statistics for algorithmic execution
// -----------------------------------------------------------------------------
//   historicalVolumeProfile  intraday volume curve in `buckets` equal time
//                            buckets (need not be normalized). Used by VWAP
//                            when the order carries no custom curve.
//   marketVolume             shares printed in [from_ms, to_ms]. Drives POV.
//   marketVwap               VWAP of the prints in [from_ms, to_ms], or 0.0
//                            when nothing printed. MARKET_VWAP benchmark.
// -----------------------------------------------------------------------------
class IMarketVolumeSource {
 public:
  virtual ~IMarketVolumeSource() = default;

  virtual std::vector<double> historicalVolumeProfile(const std::string& symbol,
                                                      int buckets) = 0;
  virtual domain::Quantity marketVolume(const std::string& symbol,
                                        std::int64_t from_ms,
                                        std::int64_t to_ms) = 0;
  virtual domain::Price marketVwap(const std::string& symbol,
                                   std::int64_t from_ms,
                                   std::int64_t to_ms) = 0;
};

}  // namespace ports
}  // namespace oms
