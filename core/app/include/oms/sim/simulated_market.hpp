#pragma once

#include "oms/domain/market_data.hpp"
#include "oms/domain/order.hpp"
#include "oms/ports/i_market_volume_source.hpp"
#include "oms/ports/i_quote_source.hpp"
#include "oms/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oms {

// Result of SimulatedMarket::take().
struct TakeResult {
  domain::Quantity filled{0};
  domain::Price average_price{0.0};
};

// -----------------------------------------------------------------------------
// SimulatedMarket: in-process books, prints and volume statistics
// -----------------------------------------------------------------------------
//
// @brief  Quote source and market volume source backed by books the owner
//         sets explicitly. Used by the oms_gateway executable and by the
//         engine tests in place of live venue connectivity.
//
// @details
// setBook() installs one venue's book for one symbol. take() removes
// liquidity from that book the way an aggressive order would: a BUY walks
// the asks, a SELL walks the bids, stopping at the quantity or at the limit
// price. Every take() also records a print, so POV and MARKET_VWAP see the
// market's own executions plus whatever recordTrade() adds.
//
// historicalVolumeProfile() returns a configured curve when one was set for
// the symbol, otherwise a U-shaped intraday curve (heavier at the open and
// the close), resampled to the requested bucket count.
//
// Thread model:
//   Every member is safe to call concurrently; one mutex guards all state.
// -----------------------------------------------------------------------------
class SimulatedMarket final : public ports::IQuoteSource,
                              public ports::IMarketVolumeSource {
 public:
  explicit SimulatedMarket(const ITimeProvider& clock);

  SimulatedMarket(const SimulatedMarket&) = delete;
  SimulatedMarket& operator=(const SimulatedMarket&) = delete;

  void setBook(const domain::Venue& venue, const std::string& symbol,
               domain::OrderBookSnapshot book);

  void setVolumeProfile(const std::string& symbol, std::vector<double> curve);

  // Adds a print at the clock's current time.
  void recordTrade(const std::string& symbol, domain::Quantity quantity,
                   domain::Price price);
  void recordTrade(const std::string& symbol, domain::Quantity quantity,
                   domain::Price price, std::int64_t timestamp_ms);

  TakeResult take(const domain::Venue& venue, const std::string& symbol,
                  domain::Side side, domain::Quantity quantity,
                  std::optional<domain::Price> limit_price);

  // --- IQuoteSource ----------------------------------------------------------
  domain::QuoteSnapshot quotes(
      const std::string& symbol,
      const std::vector<domain::Venue>& venues) override;

  // --- IMarketVolumeSource ---------------------------------------------------
  std::vector<double> historicalVolumeProfile(const std::string& symbol,
                                              int buckets) override;
  domain::Quantity marketVolume(const std::string& symbol,
                                std::int64_t from_ms,
                                std::int64_t to_ms) override;
  domain::Price marketVwap(const std::string& symbol, std::int64_t from_ms,
                           std::int64_t to_ms) override;

 private:
  struct Print {
    std::int64_t timestamp_ms{0};
    domain::Quantity quantity{0};
    domain::Price price{0.0};
  };

  using BookKey = std::pair<domain::Venue, std::string>;

  void recordLocked(const std::string& symbol, domain::Quantity quantity,
                    domain::Price price, std::int64_t timestamp_ms);

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::map<BookKey, domain::OrderBookSnapshot> books_;
  std::map<std::string, std::vector<Print>> prints_;
  std::map<std::string, std::vector<double>> profiles_;
};

}  // namespace oms
